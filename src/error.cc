#include "lockstep/error.hh"

#include <execinfo.h>
#include <cxxabi.h>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <sstream>

namespace lockstep {

std::string strprintf(const char *fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    va_list again;
    va_copy(again, ap);
    const int len = vsnprintf(nullptr, 0, fmt, ap);
    va_end(ap);

    std::string s;
    if (len > 0) {
        std::vector<char> buf(static_cast<size_t>(len) + 1);
        vsnprintf(buf.data(), buf.size(), fmt, again);
        s.assign(buf.data(), static_cast<size_t>(len));
    }
    va_end(again);
    return s;
}

namespace {

constexpr int max_frames = 64;

// glibc symbols read "object(mangled+0x1f) [0x4005d2]"
std::string demangle_symbol(const std::string &symbol) {
    const auto open = symbol.find('(');
    if (open == std::string::npos) return symbol;
    const auto plus = symbol.find('+', open);
    if (plus == std::string::npos || plus == open + 1) return symbol;

    const std::string mangled = symbol.substr(open + 1, plus - open - 1);
    int status = -1;
    std::unique_ptr<char, void (*)(void *)> name{
        abi::__cxa_demangle(mangled.c_str(), nullptr, nullptr, &status), free};
    if (status != 0 || !name) return symbol;
    return symbol.substr(0, open + 1) + name.get() + symbol.substr(plus);
}

} // end anon namespace

call_stack::call_stack() : _frames(max_frames) {
    const int n = backtrace(_frames.data(), max_frames);
    _frames.resize(n > 0 ? static_cast<size_t>(n) : 0);
    if (!_frames.empty()) {
        _frames.erase(_frames.begin());
    }
}

std::string call_stack::str() const {
    std::ostringstream ss;
    if (_frames.empty()) return ss.str();

    std::unique_ptr<char *, void (*)(void *)> symbols{
        backtrace_symbols(_frames.data(), static_cast<int>(_frames.size())), free};
    for (size_t i = 0; i < _frames.size(); ++i) {
        ss << "#" << i << " ";
        if (symbols) {
            ss << demangle_symbol(symbols.get()[i]);
        } else {
            ss << _frames[i];
        }
        ss << "\n";
    }
    return ss.str();
}

} // end namespace lockstep
