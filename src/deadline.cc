#include "lockstep/deadline.hh"
#include "lockstep/logging.hh"

namespace lockstep {

deadline::deadline(alarm_clock &clock, time_point when, alarm_clock::callback on_expire)
    : _reached(std::make_shared<std::atomic<bool>>(false))
{
    if (when <= alarm_clock::clock::now()) {
        _reached->store(true);
        return;
    }
    if (when == time_point::max()) {
        // never expires
        return;
    }
    auto reached = _reached;
    _alarm = clock.arm(when, [reached, on_expire] {
        reached->store(true);
        on_expire();
    });
    DVLOG(5) << "deadline " << this << " armed in "
        << std::chrono::duration_cast<std::chrono::milliseconds>(_alarm.remaining()).count() << "ms";
}

deadline::duration deadline::remaining() const {
    if (reached()) {
        return duration::zero();
    }
    if (!_alarm.armed()) {
        return duration::max();
    }
    return _alarm.remaining();
}

void deadline::cancel() {
    if (_alarm.cancel()) {
        DVLOG(5) << "deadline " << this << " canceled";
    }
}

deadline::~deadline() {
    cancel();
}

} // end namespace lockstep
