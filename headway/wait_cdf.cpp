#include <algorithm>
#include <cstddef>
#include <optional>
#include <vector>

#include <headway/common_types.hpp>
#include <headway/hdwexcept.hpp>

#include "interval.hpp"
#include "wait_cdf.hpp"

namespace hdw {

// The total wait over the interval is the area under the sawtooth.
//
// Each in-interval headway h is a ramp from h down to 0, area h²/2. The
// tail is a trapezoid: the wait falls from end_wait+end_elapsed to
// end_wait over end_elapsed seconds, area end_wait·end_elapsed +
// end_elapsed²/2. Accumulate twice the area to stay in integers.

std::optional<minutes_type> average_wait(const arrival_interval& ival) {
    if (ival.empty) return std::nullopt;

    time_type twice_total = 0;
    for (auto h: ival.headways) {
        twice_total += h*h;
    }

    if (ival.end_wait_time) {
        const time_type e = ival.end_elapsed_time;
        twice_total += 2*(*ival.end_wait_time)*e + e*e;
    }

    return double(twice_total)/2/double(ival.elapsed())/seconds_per_minute;
}

// For a wait value w, the portion of the interval with wait less than w is
// the total length of the horizontal slice of the sawtooth below w. Between
// two consecutive breakpoints w₀ < w₁, where a breakpoint is a wait value at
// which a ramp begins or ends, the slice grows by (w₁-w₀) seconds for each
// ramp spanning [w₀, w₁].
//
// A headway h spans waits [0, h]; the tail spans [end_wait,
// end_wait+end_elapsed]. Counting breakpoints at or above w₁ counts each
// headway ramp spanning the segment once. The two tail breakpoints are also
// counted whenever w₁ ≤ end_wait, even though the tail does not reach below
// end_wait, so they are subtracted there. For w₁ > end_wait, only the upper
// tail breakpoint can be counted, and exactly when the tail spans the
// segment. The extra 0 breakpoint (present when there is an arrival) only
// ever opens the sequence.

std::optional<std::vector<cdf_point>> wait_time_cdf(const arrival_interval& ival) {
    if (ival.empty) return std::nullopt;

    const bool has_arrival = ival.has_arrival();
    const auto& end_wait = ival.end_wait_time;

    if (!has_arrival && !end_wait) return std::nullopt;

    std::vector<time_type> breakpoints = ival.headways;
    if (end_wait) {
        breakpoints.push_back(*end_wait);
        breakpoints.push_back(*end_wait+ival.end_elapsed_time);
    }
    if (has_arrival) {
        breakpoints.push_back(0);
    }
    std::sort(breakpoints.begin(), breakpoints.end());

    const std::size_t n = breakpoints.size();
    const double elapsed = double(ival.elapsed());

    std::vector<cdf_point> points;
    time_type total = 0;     // seconds with wait less than the current breakpoint
    std::optional<time_type> prev;

    for (std::size_t i = 0; i<n; ++i) {
        const time_type w = breakpoints[i];
        if (prev && w<=*prev) continue;

        if (prev) {
            time_type spanning = time_type(n-i);
            if (end_wait && w<=*end_wait) spanning -= 2;
            total += (w-*prev)*spanning;
        }

        points.push_back({double(w)/seconds_per_minute, double(total)/elapsed});
        prev = w;
    }

    if (points.front().probability!=0 || points.back().probability!=1) {
        throw invalid_cumulative_distribution(
            ival.headways, std::move(breakpoints), ival.end_elapsed_time, end_wait, std::move(points));
    }

    return points;
}

} // namespace hdw
