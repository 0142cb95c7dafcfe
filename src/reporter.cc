#include "lockstep/reporter.hh"
#include <algorithm>

namespace lockstep {

std::ostream &operator << (std::ostream &o, failure_kind k) {
    switch (k) {
    case failure_kind::double_wait:  return o << "double_wait";
    case failure_kind::emit_timeout: return o << "emit_timeout";
    case failure_kind::wait_timeout: return o << "wait_timeout";
    }
    return o << "failure_kind(" << static_cast<int>(k) << ")";
}

static std::string describe(failure_kind kind, const std::vector<std::string> &messages) {
    const std::string names = message_list(messages);
    switch (kind) {
    case failure_kind::double_wait:  return "double wait for " + names;
    case failure_kind::emit_timeout: return "timeout emitting " + names;
    case failure_kind::wait_timeout: return "timeout waiting for " + names;
    }
    return names;
}

failure::failure(failure_kind kind, std::vector<std::string> messages)
    : errorx(describe(kind, messages)), _kind(kind), _messages(std::move(messages))
{
    std::sort(_messages.begin(), _messages.end());
}

void reporter::log(const std::string &msg) {
    LOG(INFO) << msg;
}

void throwing_reporter::fatal(const failure &f) {
    LOG(ERROR) << f.what();
    VLOG(1) << "failed at:\n" << f.backtrace();
    throw f;
}

void glog_reporter::fatal(const failure &f) {
    LOG(FATAL) << f.what() << "\n" << f.backtrace();
    // not reached
    throw f;
}

reporter &default_reporter() {
    static throwing_reporter r;
    return r;
}

} // end namespace lockstep
