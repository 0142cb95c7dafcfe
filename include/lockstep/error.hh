#ifndef LOCKSTEP_ERROR_HH
#define LOCKSTEP_ERROR_HH

#include <exception>
#include <string>
#include <utility>
#include <vector>

namespace lockstep {

//! printf() into a std::string of whatever length it needs
std::string strprintf(const char *fmt, ...) __attribute__((format (printf, 1, 2)));

//! misuse of the library: bad timeouts, malformed configuration
class errorx : public std::exception {
private:
    std::string _msg;

public:
    errorx(std::string msg) : _msg(std::move(msg)) {}
    errorx(const char *msg) : _msg(msg) {}

    //! \param fmt printf-style format string
    template <typename A, typename... Args>
    errorx(const char *fmt, A &&a, Args&&... args)
        : _msg(strprintf(fmt, std::forward<A>(a), std::forward<Args>(args)...)) {}

    const char *what() const noexcept override { return _msg.c_str(); }
};

//! the frames of the thread that constructed it
//
//! failures are reported from the thread that made the bad call, but
//! reporters may log them elsewhere, so the stack is captured eagerly and
//! symbolized only when printed.
class call_stack {
private:
    std::vector<void *> _frames;

public:
    //! captures the caller's stack, without this constructor's frame
    call_stack();

    size_t depth() const { return _frames.size(); }

    //! one "#n object(function+offset) [address]" line per frame,
    //! function names demangled where possible
    std::string str() const;
};

} // end namespace lockstep

#endif // LOCKSTEP_ERROR_HH
