#include <algorithm>
#include <optional>
#include <vector>

#include <headway/assert.hpp>
#include <headway/common_types.hpp>

#include "interval.hpp"
#include "sampled_waits.hpp"

namespace hdw {

std::optional<std::vector<minutes_type>> sample_waits(const arrival_interval& ival, time_type step) {
    HDW_ASSERT(step>0);
    if (ival.empty) return std::nullopt;

    std::vector<time_type> next_arrivals = ival.arrivals;
    if (ival.end_wait_time) {
        next_arrivals.push_back(ival.end+*ival.end_wait_time);
    }

    // Align down to a multiple of step, also for negative times.
    const time_type offset = ((ival.start%step)+step)%step;

    std::vector<minutes_type> waits;
    waits.reserve(std::size_t((ival.end-ival.start+offset)/step)+1);

    auto next = next_arrivals.begin();
    for (time_type t = ival.start-offset; t<ival.end; t += step) {
        next = std::lower_bound(next, next_arrivals.end(), t);
        if (next==next_arrivals.end()) break;
        waits.push_back(double(*next-t)/seconds_per_minute);
    }
    return waits;
}

} // namespace hdw
