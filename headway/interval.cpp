#include <algorithm>
#include <iterator>
#include <optional>
#include <vector>

#include <headway/assert.hpp>
#include <headway/common_types.hpp>

#include "interval.hpp"

namespace hdw {

std::optional<interval_bounds> clip_interval(const std::vector<time_type>& times,
                                             std::optional<time_type> start,
                                             std::optional<time_type> end)
{
    if (times.empty()) return std::nullopt;

    const time_type first = times.front();
    const time_type last = times.back();

    interval_bounds b;
    b.start = start? std::max(first, *start): first;
    b.end = std::max(end? std::min(last, *end): last, b.start);

    // Left-biased for both bounds: an arrival exactly at b.end belongs to
    // the next interval.
    auto lo = std::lower_bound(times.begin(), times.end(), b.start);
    auto hi = std::lower_bound(lo, times.end(), b.end);

    b.start_index = std::distance(times.begin(), lo);
    b.end_index = std::distance(times.begin(), hi);
    return b;
}

arrival_interval resolve_interval(const std::vector<time_type>& times,
                                  std::optional<time_type> start,
                                  std::optional<time_type> end)
{
    arrival_interval ival;

    auto bounds = clip_interval(times, start, end);
    if (!bounds) return ival;

    // Provisional interval.
    time_type ival_start = bounds->start;
    time_type ival_end = bounds->end;

    ival.arrivals.assign(times.begin()+bounds->start_index, times.begin()+bounds->end_index);

    time_type prev = ival_start;
    ival.headways.reserve(ival.arrivals.size());
    for (auto t: ival.arrivals) {
        ival.headways.push_back(t-prev);
        prev = t;
    }

    // Tail state.
    ival.end_elapsed_time = ival_end-prev;

    if (bounds->end_index<times.size()) {
        ival.end_wait_time = times[bounds->end_index]-ival_end;
    }
    else if (ival.end_elapsed_time>0) {
        // Nothing is known to arrive after the interval, so the wait for
        // anyone arriving after the last observed arrival is unknown:
        // finish the interval at that arrival instead.
        ival.end_elapsed_time = 0;
        ival_end = prev;
    }

    // Final interval.
    ival.start = ival_start;
    ival.end = ival_end;
    ival.empty = ival.elapsed()<=0;

    HDW_ASSERT(ival.end_elapsed_time>=0);
    HDW_ASSERT(ival.empty || ival.end_wait_time || ival.end_elapsed_time==0);
    return ival;
}

} // namespace hdw
