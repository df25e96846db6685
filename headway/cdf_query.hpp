#pragma once

#include <vector>

#include <headway/common_types.hpp>

// Queries over a piecewise-linear CDF given as points with strictly
// increasing wait and non-decreasing probability, running from probability
// 0 to probability 1.

namespace hdw {

// Smallest wait at which the CDF reaches q, interpolated linearly.
// Precondition: 0 ≤ q ≤ 1.
minutes_type cdf_quantile(const std::vector<cdf_point>& cdf, probability_type q);

// CDF value at wait w: 0 at or below the first point, 1 at or beyond the
// last, linear in between.
probability_type cdf_probability_less_than(const std::vector<cdf_point>& cdf, minutes_type w);

// Differences of CDF values at consecutive bin edges; one fewer value than
// edges (none for fewer than two edges).
std::vector<probability_type> cdf_histogram(const std::vector<cdf_point>& cdf, const std::vector<minutes_type>& edges);

} // namespace hdw
