#pragma once

#include <optional>
#include <vector>

#include <headway/common_types.hpp>

#include "interval.hpp"

namespace hdw {

// Closed-form mean wait [min] over the interval, or std::nullopt if the
// interval is empty.
std::optional<minutes_type> average_wait(const arrival_interval& ival);

// Exact piecewise-linear CDF of wait time over the interval.
//
// Returns std::nullopt if the interval is empty, or if it contains neither an
// arrival nor a following arrival. Throws invalid_cumulative_distribution if
// the constructed points do not run from probability 0 to probability 1.
std::optional<std::vector<cdf_point>> wait_time_cdf(const arrival_interval& ival);

} // namespace hdw
