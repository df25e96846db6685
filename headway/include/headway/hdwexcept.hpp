#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <headway/common_types.hpp>

// Headway-specific exception hierarchy.

namespace hdw {

// Headway internal logic error (if these are thrown,
// there is a bug in the library.)

struct headway_internal_error: std::logic_error {
    headway_internal_error(const std::string&);
    std::string where;
};

// Common base-class for headway run-time errors.

struct headway_exception: std::runtime_error {
    headway_exception(const std::string&);
    std::string where;
};

// Argument violates domain constraints, eg quantile outside [0, 1].
struct domain_error: headway_exception {
    domain_error(const std::string&);
};

// Arrival series supplied to build_stats is not in ascending order.
struct unsorted_arrivals: headway_exception {
    unsorted_arrivals(std::size_t index, time_type previous, time_type value);
    std::size_t index;
    time_type previous;
    time_type value;
};

// The constructed cumulative distribution does not start at probability 0
// and end at probability 1. The geometric construction has been given an
// input it cannot handle; the full construction state is retained.
struct invalid_cumulative_distribution: headway_internal_error {
    invalid_cumulative_distribution(std::vector<time_type> headways,
                                    std::vector<time_type> breakpoints,
                                    time_type end_elapsed_time,
                                    std::optional<time_type> end_wait_time,
                                    std::vector<cdf_point> points);
    std::vector<time_type> headways;
    std::vector<time_type> breakpoints;
    time_type end_elapsed_time;
    std::optional<time_type> end_wait_time;
    std::vector<cdf_point> points;
};

} // namespace hdw
