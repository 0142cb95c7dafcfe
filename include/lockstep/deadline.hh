#ifndef LOCKSTEP_DEADLINE_HH
#define LOCKSTEP_DEADLINE_HH

#include <atomic>
#include <memory>
#include "lockstep/alarm.hh"

namespace lockstep {

//! per-call timer: marks itself reached and runs on_expire at a fixed time
//
//! on_expire runs on the alarm clock thread after the flag is set. it must
//! take the lock the caller sleeps under before waking it, otherwise the
//! wakeup can land between the caller's reached() check and its sleep.
class deadline {
public:
    typedef alarm_clock::time_point time_point;
    typedef alarm_clock::duration duration;

private:
    // shared with the alarm callback, which can outlive this object
    std::shared_ptr<std::atomic<bool>> _reached;
    alarm_clock::scoped_alarm _alarm;

public:
    //! a when that is not in the future is reached immediately;
    //! time_point::max() is never reached and arms nothing
    deadline(alarm_clock &clock, time_point when, alarm_clock::callback on_expire);

    deadline(const deadline &) = delete;
    deadline &operator =(const deadline &) = delete;

    bool reached() const { return _reached->load(); }

    //! time remaining on the deadline, duration::max() once nothing is armed
    duration remaining() const;

    //! cancel the deadline
    void cancel();

    ~deadline();
};

} // end namespace lockstep

#endif // LOCKSTEP_DEADLINE_HH
