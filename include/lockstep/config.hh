#ifndef LOCKSTEP_CONFIG_HH
#define LOCKSTEP_CONFIG_HH

#include <chrono>
#include <string>
#include <boost/program_options.hpp>

namespace lockstep {

namespace po = boost::program_options;

//! timeout applied to each emit and wait unless overridden
constexpr std::chrono::milliseconds default_timeout{10 * 1000};

//! environment variable overriding the default timeout, in milliseconds
constexpr const char *timeout_env = "LOCKSTEP_TIMEOUT_MS";
//! environment variable enabling verbose trace output
constexpr const char *verbose_env = "LOCKSTEP_VERBOSE";

//! rendezvous settings
//
//! the timeout should only be lengthened for interactive debugging,
//! a scenario that needs more than the default is usually deadlocked.
struct config {
    std::chrono::milliseconds timeout;
    bool verbose;

    config() : timeout(default_timeout), verbose(false) {}

    //! defaults overridden by LOCKSTEP_TIMEOUT_MS and LOCKSTEP_VERBOSE
    //
    //! throws errorx naming the variable if a value does not parse
    static config from_env();

    //! --timeout-ms and --verbose, stored into this config on po::notify
    void add_options(po::options_description &desc);
};

//! parse a LOCKSTEP_TIMEOUT_MS style value; must be a positive integer
std::chrono::milliseconds parse_timeout(const std::string &name, const std::string &value);

//! parse a LOCKSTEP_VERBOSE style value: 0, 1, true, false, yes, no
bool parse_flag(const std::string &name, const std::string &value);

} // end namespace lockstep

#endif // LOCKSTEP_CONFIG_HH
