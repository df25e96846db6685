#pragma once

/*
 * Common definitions for time and wait-time quantities across the
 * headway library.
 */

#include <cstdint>

namespace hdw {

// Event timestamps and durations are whole seconds (seconds since epoch
// for timestamps).

using time_type = std::int64_t;

// Wait times reported to callers are fractional minutes.

using minutes_type = double;

// Probabilities and quantiles lie in [0, 1].

using probability_type = double;

constexpr time_type seconds_per_minute = 60;

// Default step for sampled wait-time generation.

constexpr time_type default_sample_seconds = 60;

// One point of a piecewise-linear cumulative distribution of wait time:
// `probability` is the fraction of the interval with wait time less than
// `wait` minutes.

struct cdf_point {
    minutes_type wait;
    probability_type probability;
};

inline bool operator==(const cdf_point& a, const cdf_point& b) {
    return a.wait==b.wait && a.probability==b.probability;
}

inline bool operator!=(const cdf_point& a, const cdf_point& b) {
    return !(a==b);
}

} // namespace hdw
