#include "lockstep/rendezvous.hh"
#include "lockstep/logging.hh"
#include <algorithm>

namespace lockstep {

rendezvous::rendezvous(reporter &r) : rendezvous(r, config::from_env()) {}

rendezvous::rendezvous(reporter &r, const config &c)
    : _reporter(r), _timeout(c.timeout), _verbose(c.verbose)
{
    if (_timeout.count() < 0) {
        throw errorx("negative rendezvous timeout: %lldms", static_cast<long long>(_timeout.count()));
    }
}

rendezvous::~rendezvous() {
    std::lock_guard<std::mutex> lk(_m);
    LOG_IF(WARNING, !_pending.empty())
        << "rendezvous " << this << " destroyed while waiting for " << message_list(_pending);
}

void rendezvous::set_timeout(std::chrono::milliseconds timeout) {
    if (timeout.count() < 0) {
        throw errorx("negative rendezvous timeout: %lldms", static_cast<long long>(timeout.count()));
    }
    std::lock_guard<std::mutex> lk(_m);
    _timeout = timeout;
}

std::chrono::milliseconds rendezvous::timeout() const {
    std::lock_guard<std::mutex> lk(_m);
    return _timeout;
}

// now + timeout, saturated at time_point::max() for timeouts too
// long to add to the clock
static alarm_clock::time_point deadline_after(std::chrono::milliseconds timeout) {
    using std::chrono::duration_cast;
    const auto now = alarm_clock::clock::now();
    const auto left = duration_cast<std::chrono::milliseconds>(alarm_clock::time_point::max() - now);
    if (timeout >= left) {
        return alarm_clock::time_point::max();
    }
    return now + timeout;
}

void rendezvous::trace(const std::string &msg) {
    if (_verbose) {
        _reporter.log(msg);
    }
}

void rendezvous::wakeupall() {
    std::lock_guard<std::mutex> lk(_m);
    _cv.notify_all();
}

bool rendezvous::sleep(std::unique_lock<std::mutex> &lk, const deadline &dl) {
    DCHECK(lk.owns_lock()) << "must own lock before calling rendezvous::sleep";
    if (dl.reached()) {
        return false;
    }
    DVLOG(5) << "RENDEZVOUS[" << this << "] sleep, " << _pending.size() << " pending";
    _cv.wait(lk);
    return true;
}

void rendezvous::emit(const std::string &m) {
    trace("emitting " + m);

    std::unique_lock<std::mutex> lk(_m);
    const auto when = deadline_after(_timeout);
    deadline dl{_clock, when, [this] { wakeupall(); }};
    for (;;) {
        auto i = _pending.find(m);
        if (i != _pending.end()) {
            _pending.erase(i);
            _cv.notify_all();
            lk.unlock();
            trace("emitted " + m);
            return;
        }

        if (!sleep(lk, dl)) {
            lk.unlock();
            _reporter.fatal(failure(failure_kind::emit_timeout, {m}));
        }
    }
}

void rendezvous::wait(const std::vector<std::string> &ms) {
    trace("waiting for " + message_list(ms));

    // messages of this call not yet emitted
    std::unordered_set<std::string> waiting;
    // reporter calls are made with _m released
    std::vector<std::string> satisfied;

    std::unique_lock<std::mutex> lk(_m);
    const auto when = deadline_after(_timeout);

    // check everything before registering anything so a failed
    // wait leaves no names behind
    for (const auto &m : ms) {
        if (_pending.count(m) || !waiting.insert(m).second) {
            lk.unlock();
            _reporter.fatal(failure(failure_kind::double_wait, {m}));
        }
    }
    _pending.insert(waiting.begin(), waiting.end());
    _cv.notify_all();

    deadline dl{_clock, when, [this] { wakeupall(); }};
    for (;;) {
        for (auto i = waiting.begin(); i != waiting.end(); ) {
            if (_pending.count(*i) == 0) {
                satisfied.push_back(*i);
                i = waiting.erase(i);
                _cv.notify_all();
            } else {
                ++i;
            }
        }

        if (!satisfied.empty()) {
            lk.unlock();
            for (const auto &m : satisfied) {
                trace("wait satisfied for " + m);
            }
            satisfied.clear();
            if (waiting.empty()) {
                return;
            }
            // emits may have landed meanwhile; rescan before sleeping
            lk.lock();
            continue;
        }

        if (waiting.empty()) {
            return;
        }

        if (!sleep(lk, dl)) {
            // withdraw what nobody emitted; the names are free again
            for (const auto &m : waiting) {
                _pending.erase(m);
            }
            lk.unlock();
            _reporter.fatal(failure(failure_kind::wait_timeout,
                        std::vector<std::string>(waiting.begin(), waiting.end())));
        }
    }
}

std::vector<std::string> rendezvous::pending() const {
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lk(_m);
        names.assign(_pending.begin(), _pending.end());
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // end namespace lockstep
