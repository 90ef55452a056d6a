#pragma once

#include <sstream>
#include <string>

namespace syncset {

// Anything with an ostream operator<< can be printed.
template <class T>
inline std::string to_string(const T &value) {
    std::ostringstream o;
    o << value;
    return o.str();
}

inline std::string to_string(const std::string &value) { return value; }

template <class Range>
std::string join(const Range &values, const std::string &separator) {
    std::ostringstream o;
    bool first = true;
    for (const auto &value : values) {
        if (not first) {
            o << separator;
        }
        o << to_string(value);
        first = false;
    }
    return o.str();
}

}  // namespace syncset
