#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

namespace hdw {
namespace util {

// One frame of a captured call stack.
struct source_location {
    std::string func;
    std::string file;
    std::size_t line;
};

// Captures the call stack at construction, skipping the innermost `skip`
// frames (the capture itself is always skipped).
//
// Frames are only recorded in builds with WITH_BACKTRACE defined; otherwise
// the trace is empty and prints as nothing.
class backtrace {
public:
    explicit backtrace(std::size_t skip = 0);

    const std::vector<source_location>& frames() const { return frames_; }
    bool empty() const { return frames_.empty(); }

    std::string to_string() const;

    friend std::ostream& operator<<(std::ostream&, const backtrace&);

private:
    std::vector<source_location> frames_;
};

} // namespace util
} // namespace hdw
