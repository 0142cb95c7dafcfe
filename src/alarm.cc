#include "lockstep/alarm.hh"
#include "lockstep/logging.hh"
#include <algorithm>
#include <exception>

namespace lockstep {

alarm_clock::alarm_clock() : _next_id(1), _stopping(false) {
    _thread = std::thread([this] { run(); });
}

alarm_clock::~alarm_clock() {
    {
        std::lock_guard<std::mutex> lk(_m);
        _stopping = true;
        DVLOG(5) << "ALARM[" << this << "] stopping with " << _set.size() << " unfired";
    }
    _cv.notify_one();
    _thread.join();
}

uint64_t alarm_clock::insert(time_point when, callback fn) {
    std::lock_guard<std::mutex> lk(_m);
    data d{_next_id++, when, std::move(fn)};
    auto i = std::upper_bound(std::begin(_set), std::end(_set), d, order());
    const bool new_front = (i == std::begin(_set));
    const uint64_t id = d.id;
    _set.insert(i, std::move(d));
    if (new_front) {
        // clock thread may be sleeping until a later alarm
        _cv.notify_one();
    }
    return id;
}

bool alarm_clock::remove(uint64_t id) {
    std::lock_guard<std::mutex> lk(_m);
    auto i = std::find_if(std::begin(_set), std::end(_set),
            [id](const data &d) { return d.id == id; });
    if (i == std::end(_set)) {
        return false;
    }
    _set.erase(i);
    return true;
}

void alarm_clock::run() {
    std::unique_lock<std::mutex> lk(_m);
    while (!_stopping) {
        if (_set.empty()) {
            _cv.wait(lk);
            continue;
        }
        const auto now = clock::now();
        if (_set.front().when > now) {
            // copy: _set can reallocate while we sleep
            const time_point next = _set.front().when;
            _cv.wait_until(lk, next);
            continue;
        }

        std::vector<callback> due;
        auto i = std::begin(_set);
        for (; i != std::end(_set) && i->when <= now; ++i) {
            due.push_back(std::move(i->fn));
        }
        _set.erase(std::begin(_set), i);

        // callbacks may take other locks; never hold ours while they run
        lk.unlock();
        for (auto &fn : due) {
            DVLOG(5) << "ALARM[" << this << "] firing";
            try {
                fn();
            } catch (std::exception &e) {
                LOG(ERROR) << "alarm callback threw: " << e.what();
            }
        }
        lk.lock();
    }
}

alarm_clock::scoped_alarm alarm_clock::arm(time_point when, callback fn) {
    return scoped_alarm{*this, insert(when, std::move(fn)), when};
}

size_t alarm_clock::size() const {
    std::lock_guard<std::mutex> lk(_m);
    return _set.size();
}

alarm_clock::duration alarm_clock::scoped_alarm::remaining() const {
    if (_armed) {
        const auto now = clock::now();
        if (now < _when) {
            return _when - now;
        }
    }
    return duration::zero();
}

bool alarm_clock::scoped_alarm::cancel() {
    if (_armed) {
        _armed = false;
        return _clock->remove(_id);
    }
    return false;
}

} // end namespace lockstep
