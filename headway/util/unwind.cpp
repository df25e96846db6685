#include "util/unwind.hpp"

#include <algorithm>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

#include <fmt/format.h>

#ifdef WITH_BACKTRACE
#define BOOST_STACKTRACE_GNU_SOURCE_NOT_REQUIRED
#define BOOST_STACKTRACE_USE_ADDR2LINE
#include <boost/stacktrace.hpp>
#endif

namespace hdw {
namespace util {

backtrace::backtrace(std::size_t skip) {
#ifdef WITH_BACKTRACE
    // Skip this constructor as well as the requested frames.
    boost::stacktrace::stacktrace bt(skip+1, static_cast<std::size_t>(-1));
    for (const auto& f: bt) {
        frames_.push_back(source_location{f.name(), f.source_file(), f.source_line()});
    }
#else
    (void)skip;
#endif
}

std::ostream& operator<<(std::ostream& out, const backtrace& trace) {
    if (trace.frames_.empty()) return out;

    out << "Backtrace:\n";
    std::size_t ix = 0;
    for (const auto& f: trace.frames_) {
        out << fmt::format("{:>8} {} ({}:{})\n", ix++, f.func, f.file, f.line);
    }
    return out;
}

std::string backtrace::to_string() const {
    std::ostringstream ss;
    ss << *this;
    return ss.str();
}

} // namespace util
} // namespace hdw
