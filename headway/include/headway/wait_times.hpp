#pragma once

#include <memory>
#include <optional>
#include <vector>

#include <headway/common_types.hpp>

// Wait-time statistics over a sorted sequence of event (arrival) times.
//
// A person arriving uniformly at random within an interval [start, end)
// waits for the next arrival. The wait as a function of the person's
// arrival time is a sawtooth: ramps of slope -1 that reach zero at each
// arrival. All statistics below are computed exactly from the areas and
// extents of these ramps, rather than by sampling.
//
// The interval is clipped to the time range of the arrival series. When no
// arrival follows the interval the wait for people arriving after the last
// observed arrival is unknown, and the interval is cut back to end at that
// arrival.
//
// Wait times are reported in minutes. A query that cannot be answered
// (no arrivals, zero-width interval, nothing from which to build a
// distribution) returns std::nullopt.

namespace hdw {

// wait_time_state comprises the private implementation for wait_time_stats.
struct wait_time_state;

class wait_time_stats {
public:
    // `times` must be sorted in ascending order; hdw::unsorted_arrivals is
    // thrown otherwise. `start` and `end` are clipped to [times.front(),
    // times.back()].
    explicit wait_time_stats(std::vector<time_type> times,
                             std::optional<time_type> start = std::nullopt,
                             std::optional<time_type> end = std::nullopt);

    wait_time_stats(const wait_time_stats&) = delete;
    wait_time_stats(wait_time_stats&&);
    wait_time_stats& operator=(wait_time_stats&&);

    ~wait_time_stats();

    // True if there is no interval over which to compute statistics.
    bool empty() const;

    // Resolved interval bounds [s].
    time_type interval_start() const;
    time_type interval_end() const;

    // Arrivals within [interval_start, interval_end).
    const std::vector<time_type>& arrivals() const;

    // Gaps between consecutive in-interval arrivals, the first measured
    // from interval_start.
    const std::vector<time_type>& headways() const;

    // Time from the last in-interval arrival to interval_end [s].
    time_type end_elapsed_time() const;

    // Time from interval_end to the next arrival after the interval [s],
    // if there is one.
    std::optional<time_type> end_wait_time() const;

    // Mean wait time [min].
    std::optional<minutes_type> average() const;

    // Exact piecewise-linear CDF of wait time. Computed on first use and
    // retained; safe to query concurrently.
    std::optional<std::vector<cdf_point>> cumulative_distribution() const;

    // Wait time [min] at each quantile q in [0, 1].
    std::optional<std::vector<minutes_type>> quantiles(const std::vector<probability_type>& qs) const;

    // Wait time [min] at each percentile p in [0, 100].
    std::optional<std::vector<minutes_type>> percentiles(const std::vector<double>& ps) const;

    // Fraction of the interval with wait time in each bin [edges[i], edges[i+1]).
    // Bin edges [min] must be non-decreasing.
    std::optional<std::vector<probability_type>> histogram(const std::vector<minutes_type>& bin_edges) const;

    std::optional<probability_type> probability_less_than(minutes_type wait) const;
    std::optional<probability_type> probability_greater_than(minutes_type wait) const;

    // Approximate waits [min], sampled every `sample_seconds` from the
    // multiple of `sample_seconds` at or before interval_start up to
    // interval_end. Samples with no following arrival are dropped.
    std::optional<std::vector<minutes_type>> sampled_waits(time_type sample_seconds = default_sample_seconds) const;

private:
    std::unique_ptr<wait_time_state> impl_;
};

// Convenience constructor.
wait_time_stats build_stats(std::vector<time_type> times,
                            std::optional<time_type> start = std::nullopt,
                            std::optional<time_type> end = std::nullopt);

} // namespace hdw
