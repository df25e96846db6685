#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <headway/common_types.hpp>
#include <headway/hdwexcept.hpp>

#include "util/strprintf.hpp"
#include "util/unwind.hpp"

namespace hdw {

using util::pprintf;

headway_exception::headway_exception(const std::string& what):
    std::runtime_error{what} {
    // Backtrace w/o this c'tor and that of backtrace.
    where = util::backtrace(1).to_string();
}

headway_internal_error::headway_internal_error(const std::string& what):
    std::logic_error(what) {
    where = util::backtrace(1).to_string();
}

domain_error::domain_error(const std::string& w): headway_exception(w) {}

unsorted_arrivals::unsorted_arrivals(std::size_t index, time_type previous, time_type value):
    headway_exception(pprintf("arrival times must be sorted: time {} at index {} precedes previous time {}", value, index, previous)),
    index(index), previous(previous), value(value)
{}

static std::string format_points(const std::vector<cdf_point>& points) {
    std::vector<std::string> parts;
    for (const auto& p: points) {
        parts.push_back(fmt::format("({}, {})", p.wait, p.probability));
    }
    return fmt::format("[{}]", fmt::join(parts, ", "));
}

invalid_cumulative_distribution::invalid_cumulative_distribution(
        std::vector<time_type> headways,
        std::vector<time_type> breakpoints,
        time_type end_elapsed_time,
        std::optional<time_type> end_wait_time,
        std::vector<cdf_point> points):
    headway_internal_error(pprintf(
        "invalid cumulative distribution: {}\n"
        "interval headways: {}\n"
        "sorted wait time values: {}\n"
        "end elapsed time: {}\n"
        "end wait time: {}",
        format_points(points),
        util::to_string(headways),
        util::to_string(breakpoints),
        end_elapsed_time,
        util::to_string(end_wait_time))),
    headways(std::move(headways)),
    breakpoints(std::move(breakpoints)),
    end_elapsed_time(end_elapsed_time),
    end_wait_time(end_wait_time),
    points(std::move(points))
{}

} // namespace hdw
