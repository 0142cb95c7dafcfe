#ifndef LOCKSTEP_ALARM_HH
#define LOCKSTEP_ALARM_HH

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace lockstep {

//! runs callbacks at points in time on a single background thread
class alarm_clock {
public:
    typedef std::chrono::steady_clock clock;
    typedef clock::time_point time_point;
    typedef clock::duration duration;
    typedef std::function<void ()> callback;

private:
    struct data {
        uint64_t id;
        time_point when;
        callback fn;
    };

    struct order {
        bool operator ()(const data &a, const data &b) const {
            return a.when < b.when;
        }
    };

    mutable std::mutex _m;
    std::condition_variable _cv;
    //! kept sorted by when, equal times in arming order
    std::vector<data> _set;
    uint64_t _next_id;
    bool _stopping;
    std::thread _thread;

    uint64_t insert(time_point when, callback fn);
    bool remove(uint64_t id);
    void run();

public:
    //! cancels the alarm when it goes out of scope
    class scoped_alarm {
        friend class alarm_clock;

        alarm_clock *_clock;
        uint64_t _id;
        time_point _when;
        bool _armed;

        scoped_alarm(alarm_clock &c, uint64_t id, time_point when)
            : _clock(&c), _id(id), _when(when), _armed(true) {}

    public:
        scoped_alarm() : _clock(nullptr), _id(0), _armed(false) {}

        scoped_alarm(const scoped_alarm &) = delete;
        scoped_alarm &operator = (const scoped_alarm &) = delete;

        scoped_alarm(scoped_alarm &&other)
            : _clock(other._clock), _id(other._id), _when(other._when), _armed(other._armed)
        {
            other._armed = false;
        }

        scoped_alarm &operator = (scoped_alarm &&other) {
            if (this != &other) {
                cancel();
                std::swap(_clock, other._clock);
                std::swap(_id, other._id);
                std::swap(_when, other._when);
                std::swap(_armed, other._armed);
            }
            return *this;
        }

        bool armed() const { return _armed; }

        //! time until the alarm is due, zero once due or disarmed
        duration remaining() const;

        //! disarm; returns false if the callback already ran (or is running)
        bool cancel();

        ~scoped_alarm() {
            cancel();
        }
    };

    alarm_clock();
    ~alarm_clock();

    alarm_clock(const alarm_clock &) = delete;
    alarm_clock &operator = (const alarm_clock &) = delete;

    //! schedule fn to run on the clock thread at when
    scoped_alarm arm(time_point when, callback fn);

    //! number of alarms not yet fired or cancelled
    size_t size() const;

    bool empty() const { return size() == 0; }
};

} // end namespace lockstep

#endif // LOCKSTEP_ALARM_HH
