#ifndef LOCKSTEP_RENDEZVOUS_HH
#define LOCKSTEP_RENDEZVOUS_HH

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <initializer_list>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>
#include "lockstep/alarm.hh"
#include "lockstep/config.hh"
#include "lockstep/deadline.hh"
#include "lockstep/reporter.hh"

namespace lockstep {

//! named rendezvous points for ordering concurrent test tasks
//
//! emit(m) blocks until a wait() that names m takes it, and wait(ms...)
//! blocks until every message in ms was emitted. the messages of a single
//! wait may be emitted in any order:
//!
//!   rv.wait("x", "y");
//!
//! is satisfied by emit("y"); emit("x"). two separate waits
//!
//!   rv.wait("x");
//!   rv.wait("y");
//!
//! are only satisfied if x is emitted before y.
//!
//! every call gives up after timeout() and reports the failure through
//! the reporter, which does not return.
class rendezvous {
private:
    reporter &_reporter;
    std::chrono::milliseconds _timeout;
    std::atomic<bool> _verbose;

    mutable std::mutex _m;
    std::condition_variable _cv;
    //! messages named by a blocked wait and not yet emitted
    std::unordered_set<std::string> _pending;

    // declared last so the clock thread is joined before the
    // mutex and condition its alarms touch are destroyed
    alarm_clock _clock;

    //! never called with _m held
    void trace(const std::string &msg);
    bool sleep(std::unique_lock<std::mutex> &lk, const deadline &dl);
    void wakeupall();

public:
    //! settings from config::from_env()
    explicit rendezvous(reporter &r = default_reporter());
    rendezvous(reporter &r, const config &c);

    rendezvous(const rendezvous &) = delete;
    rendezvous &operator =(const rendezvous &) = delete;

    ~rendezvous();

    void set_timeout(std::chrono::milliseconds timeout);
    std::chrono::milliseconds timeout() const;

    //! trace every emit and wait through reporter::log
    void set_verbose(bool v) { _verbose = v; }
    bool verbose() const { return _verbose; }

    //! announce m and block until a wait for m takes it
    void emit(const std::string &m);

    //! block until every message in ms was emitted, in any order
    void wait(const std::vector<std::string> &ms);

    void wait(std::initializer_list<std::string> ms) {
        wait(std::vector<std::string>(ms));
    }

    template <typename... Args>
    void wait(const std::string &m, Args&&... ms) {
        wait(std::vector<std::string>{m, std::forward<Args>(ms)...});
    }

    //! sorted snapshot of the messages currently waited for
    std::vector<std::string> pending() const;
};

} // end namespace lockstep

#endif // LOCKSTEP_RENDEZVOUS_HH
