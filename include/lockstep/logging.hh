#ifndef LOCKSTEP_LOGGING_HH
#define LOCKSTEP_LOGGING_HH

#include <glog/logging.h>
#include <algorithm>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

namespace lockstep {

//! message names sorted and joined with ", " for diagnostics
template <typename Range> std::string message_list(const Range &names) {
    std::vector<std::string> sorted(std::begin(names), std::end(names));
    std::sort(sorted.begin(), sorted.end());
    std::stringstream ss;
    for (auto i = sorted.begin(); i != sorted.end(); ++i) {
        if (i != sorted.begin()) ss << ", ";
        ss << *i;
    }
    return ss.str();
}

} // end namespace lockstep

#endif // LOCKSTEP_LOGGING_HH
