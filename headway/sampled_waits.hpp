#pragma once

#include <optional>
#include <vector>

#include <headway/common_types.hpp>

#include "interval.hpp"

namespace hdw {

// Wait [min] to the next known arrival at each sample instant k·step with
// k·step in [⌊start/step⌋·step, end). The known arrivals are those within the
// interval and, if present, the one following it. Precondition: step > 0.
std::optional<std::vector<minutes_type>> sample_waits(const arrival_interval& ival, time_type step);

} // namespace hdw
