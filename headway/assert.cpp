#include <cstdlib>
#include <iostream>

#include <fmt/format.h>

#include <headway/assert.hpp>

#include "util/unwind.hpp"

namespace hdw {

void abort_on_failed_assertion(
    const char* assertion,
    const char* file,
    int line,
    const char* func)
{
    // Omit this handler from the emitted trace.
    std::cerr << util::backtrace(1);

    // std::endl flushes: abort() is not guaranteed to flush stderr.
    std::cerr << fmt::format("{}:{} {}: headway assertion `{}' failed.", file, line, func, assertion)
              << std::endl;
    std::abort();
}

void ignore_failed_assertion(const char*, const char*, int, const char*) {}

failed_assertion_handler_t global_failed_assertion_handler = abort_on_failed_assertion;

} // namespace hdw
