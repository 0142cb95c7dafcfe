#ifndef LOCKSTEP_REPORTER_HH
#define LOCKSTEP_REPORTER_HH

#include <ostream>
#include <string>
#include <vector>
#include "lockstep/error.hh"
#include "lockstep/logging.hh"

namespace lockstep {

enum class failure_kind {
    double_wait,
    emit_timeout,
    wait_timeout,
};

std::ostream &operator << (std::ostream &o, failure_kind k);

//! a scenario failure: which check failed and for which messages
//
//! what() reads "double wait for x", "timeout emitting x" or
//! "timeout waiting for x, y" and names every message, however long.
class failure : public errorx {
private:
    failure_kind _kind;
    std::vector<std::string> _messages;
    call_stack _where;
public:
    //! messages are kept sorted
    failure(failure_kind kind, std::vector<std::string> messages);

    failure_kind kind() const { return _kind; }
    const std::vector<std::string> &messages() const { return _messages; }

    //! stack of the emit or wait that failed, for reporters to print
    std::string backtrace() const { return _where.str(); }
};

//! where scenario failures and trace output go
class reporter {
public:
    virtual ~reporter() {}

    //! verbose trace line, logs at INFO by default. called without the
    //! registry lock held, so it may call back into the registry.
    virtual void log(const std::string &msg);

    //! fail the current scenario. implementations must not return;
    //! they throw or end the process.
    [[noreturn]] virtual void fatal(const failure &f) = 0;
};

//! logs the failure and throws it, unwinding the calling task
class throwing_reporter : public reporter {
public:
    [[noreturn]] void fatal(const failure &f) override;
};

//! LOG(FATAL)s the failure
class glog_reporter : public reporter {
public:
    [[noreturn]] void fatal(const failure &f) override;
};

//! process-wide throwing_reporter
reporter &default_reporter();

} // end namespace lockstep

#endif // LOCKSTEP_REPORTER_HH
