#ifndef LOCKSTEP_TASK_HH
#define LOCKSTEP_TASK_HH

#include <exception>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <thread>
#include "lockstep/logging.hh"

namespace lockstep {

//! a test task on its own thread, joined in the destructor
//
//! an exception the function ends with (e.g. a failure thrown by
//! throwing_reporter) is kept and rethrown by join(), so failures on
//! worker tasks surface in the task that waits for them.
class task {
private:
    std::thread _thread;
    std::shared_ptr<std::exception_ptr> _error;

public:
    task() : _error(std::make_shared<std::exception_ptr>()) {}
    task(const task &) = delete;
    task &operator =(const task &) = delete;
    task(task &&other) : _error(std::make_shared<std::exception_ptr>()) {
        std::swap(_thread, other._thread);
        std::swap(_error, other._error);
    }
    task &operator=(task &&other) {
        if (this != &other) {
            std::swap(_thread, other._thread);
            std::swap(_error, other._error);
        }
        return *this;
    }

    //! start f on a new thread
    template <typename Func>
    static task spawn(Func f) {
        task t;
        auto error = t._error;
        t._thread = std::thread([f, error]() mutable {
            try {
                f();
            } catch (...) {
                *error = std::current_exception();
            }
        });
        return t;
    }

    bool joinable() const { return _thread.joinable(); }

    //! wait for the task; rethrows the exception it ended with, if any
    void join() {
        if (_thread.joinable()) {
            _thread.join();
        }
        if (*_error) {
            std::exception_ptr e;
            std::swap(e, *_error);
            std::rethrow_exception(e);
        }
    }

    ~task() {
        try {
            if (_thread.joinable()) {
                _thread.join();
            }
        } catch (std::system_error &e) {
            LOG(ERROR) << "task join failed: " << e.what();
        }
        if (*_error) {
            try {
                std::rethrow_exception(*_error);
            } catch (std::exception &e) {
                LOG(ERROR) << "task " << this << " ended with unobserved exception: " << e.what();
            } catch (...) {
                LOG(ERROR) << "task " << this << " ended with unobserved exception of unknown type";
            }
        }
    }
};

} // end namespace lockstep

#endif // LOCKSTEP_TASK_HH
