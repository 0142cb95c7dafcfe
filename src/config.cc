#include "lockstep/config.hh"
#include "lockstep/error.hh"
#include <cstdlib>
#include <string>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

namespace lockstep {

std::chrono::milliseconds parse_timeout(const std::string &name, const std::string &value) {
    long long ms = 0;
    try {
        ms = boost::lexical_cast<long long>(boost::trim_copy(value));
    } catch (boost::bad_lexical_cast &) {
        throw errorx("invalid " + name + ": '" + value + "' is not a number of milliseconds");
    }
    if (ms <= 0) {
        throw errorx("invalid " + name + ": timeout must be positive, got " + std::to_string(ms));
    }
    return std::chrono::milliseconds{ms};
}

bool parse_flag(const std::string &name, const std::string &value) {
    const std::string v = boost::to_lower_copy(boost::trim_copy(value));
    if (v == "1" || v == "true" || v == "yes") return true;
    if (v == "0" || v == "false" || v == "no" || v.empty()) return false;
    throw errorx("invalid " + name + ": '" + value + "' is not a boolean");
}

config config::from_env() {
    config c;
    if (const char *v = getenv(timeout_env)) {
        c.timeout = parse_timeout(timeout_env, v);
    }
    if (const char *v = getenv(verbose_env)) {
        c.verbose = parse_flag(verbose_env, v);
    }
    return c;
}

void config::add_options(po::options_description &desc) {
    desc.add_options()
        ("timeout-ms", po::value<long long>()->default_value(timeout.count())
            ->notifier([this](long long ms) {
                timeout = parse_timeout("--timeout-ms", std::to_string(ms));
            }),
            "fail any emit or wait unmatched after this many milliseconds")
        ("verbose", po::value(&verbose)->default_value(verbose)->implicit_value(true),
            "trace every emit and wait")
        ;
}

} // end namespace lockstep
