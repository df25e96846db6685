#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include <headway/common_types.hpp>

namespace hdw {

// Requested interval clipped to the time range of an arrival series, with
// the index range [start_index, end_index) of the arrivals that lie within
// [start, end).
struct interval_bounds {
    time_type start;
    time_type end;
    std::size_t start_index;
    std::size_t end_index;
};

// Returns std::nullopt for an empty series. Otherwise start ≤ end, and both
// lie within [times.front(), times.back()] unless the requested start is
// past the last arrival, in which case start = end = requested start.
std::optional<interval_bounds> clip_interval(const std::vector<time_type>& times,
                                             std::optional<time_type> start,
                                             std::optional<time_type> end);

// The final interval over which wait-time statistics are computed, with the
// in-interval arrivals and the derived headways and tail state.
//
// Invariants (when not empty):
//   * sum(headways) + end_elapsed_time == end - start;
//   * if end_wait_time is unset, end_elapsed_time == 0.
struct arrival_interval {
    bool empty = true;
    time_type start = 0;
    time_type end = 0;

    std::vector<time_type> arrivals;
    std::vector<time_type> headways;

    time_type end_elapsed_time = 0;
    std::optional<time_type> end_wait_time;

    time_type elapsed() const { return end-start; }
    bool has_arrival() const { return !arrivals.empty(); }
};

// Clip, derive headways and tail state, and finalize the interval end in
// one pass; the returned value is not modified afterwards.
arrival_interval resolve_interval(const std::vector<time_type>& times,
                                  std::optional<time_type> start,
                                  std::optional<time_type> end);

} // namespace hdw
