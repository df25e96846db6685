#pragma once

// Formatting routines that return std::string.

#include <optional>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace hdw {
namespace util {

// Use ADL to_string or std::to_string, falling back to ostream formatting:

namespace impl_to_string {
    using std::to_string;

    template <typename T, typename = void>
    struct select {
        static std::string str(const T& value) {
            std::ostringstream o;
            o << value;
            return o.str();
        }
    };

    template <typename T>
    struct select<T, std::void_t<decltype(to_string(std::declval<T>()))>> {
        static std::string str(const T& v) {
            return to_string(v);
        }
    };
}

template <typename T>
std::string to_string(const T& value) {
    return impl_to_string::select<T>::str(value);
}

template <typename T>
std::string to_string(const std::optional<T>& value) {
    return value? to_string(*value): std::string("none");
}

template <typename T>
std::string to_string(const std::vector<T>& vs) {
    return fmt::format("[{}]", fmt::join(vs, ", "));
}

// Python-style `{}` substitution, with a format string known only at run time.

template <typename... Args>
std::string pprintf(const char* fmt, Args&&... args) {
    return fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
}

template <typename... Args>
std::string pprintf(const std::string& fmt, Args&&... args) {
    return pprintf(fmt.c_str(), std::forward<Args>(args)...);
}

} // namespace util
} // namespace hdw
