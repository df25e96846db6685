#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include <headway/common_types.hpp>
#include <headway/hdwexcept.hpp>
#include <headway/wait_times.hpp>

#include "cdf_query.hpp"
#include "interval.hpp"
#include "sampled_waits.hpp"
#include "util/strprintf.hpp"
#include "wait_cdf.hpp"

namespace hdw {

using util::pprintf;

static void check_sorted(const std::vector<time_type>& times) {
    for (std::size_t i = 1; i<times.size(); ++i) {
        if (times[i]<times[i-1]) throw unsorted_arrivals(i, times[i-1], times[i]);
    }
}

struct wait_time_state {
    wait_time_state(const std::vector<time_type>& times,
                    std::optional<time_type> start,
                    std::optional<time_type> end):
        ival(resolve_interval(times, start, end))
    {}

    const arrival_interval ival;

    // Memoized CDF; `cdf` is written once, under `cdf_once`.
    mutable std::once_flag cdf_once;
    mutable std::optional<std::vector<cdf_point>> cdf;

    const std::optional<std::vector<cdf_point>>& cumulative_distribution() const {
        std::call_once(cdf_once, [this] { cdf = wait_time_cdf(ival); });
        return cdf;
    }
};

wait_time_stats::wait_time_stats(std::vector<time_type> times,
                                 std::optional<time_type> start,
                                 std::optional<time_type> end)
{
    check_sorted(times);
    impl_ = std::make_unique<wait_time_state>(times, start, end);
}

wait_time_stats::wait_time_stats(wait_time_stats&&) = default;
wait_time_stats& wait_time_stats::operator=(wait_time_stats&&) = default;
wait_time_stats::~wait_time_stats() = default;

bool wait_time_stats::empty() const { return impl_->ival.empty; }
time_type wait_time_stats::interval_start() const { return impl_->ival.start; }
time_type wait_time_stats::interval_end() const { return impl_->ival.end; }
const std::vector<time_type>& wait_time_stats::arrivals() const { return impl_->ival.arrivals; }
const std::vector<time_type>& wait_time_stats::headways() const { return impl_->ival.headways; }
time_type wait_time_stats::end_elapsed_time() const { return impl_->ival.end_elapsed_time; }
std::optional<time_type> wait_time_stats::end_wait_time() const { return impl_->ival.end_wait_time; }

std::optional<minutes_type> wait_time_stats::average() const {
    return average_wait(impl_->ival);
}

std::optional<std::vector<cdf_point>> wait_time_stats::cumulative_distribution() const {
    return impl_->cumulative_distribution();
}

std::optional<std::vector<minutes_type>> wait_time_stats::quantiles(const std::vector<probability_type>& qs) const {
    const auto& cdf = impl_->cumulative_distribution();
    if (!cdf) return std::nullopt;

    std::vector<minutes_type> result;
    result.reserve(qs.size());
    for (auto q: qs) {
        if (!(q>=0 && q<=1)) throw domain_error(pprintf("quantile {} is not in [0, 1]", q));
        result.push_back(cdf_quantile(*cdf, q));
    }
    return result;
}

std::optional<std::vector<minutes_type>> wait_time_stats::percentiles(const std::vector<double>& ps) const {
    if (!impl_->cumulative_distribution()) return std::nullopt;

    std::vector<probability_type> qs;
    qs.reserve(ps.size());
    for (auto p: ps) {
        if (!(p>=0 && p<=100)) throw domain_error(pprintf("percentile {} is not in [0, 100]", p));
        qs.push_back(p/100);
    }
    return quantiles(qs);
}

std::optional<std::vector<probability_type>> wait_time_stats::histogram(const std::vector<minutes_type>& bin_edges) const {
    const auto& cdf = impl_->cumulative_distribution();
    if (!cdf) return std::nullopt;

    for (std::size_t i = 1; i<bin_edges.size(); ++i) {
        if (!(bin_edges[i-1]<=bin_edges[i])) {
            throw domain_error(pprintf("histogram bin edges must be non-decreasing: {} follows {}", bin_edges[i], bin_edges[i-1]));
        }
    }
    return cdf_histogram(*cdf, bin_edges);
}

std::optional<probability_type> wait_time_stats::probability_less_than(minutes_type wait) const {
    const auto& cdf = impl_->cumulative_distribution();
    if (!cdf) return std::nullopt;

    return cdf_probability_less_than(*cdf, wait);
}

std::optional<probability_type> wait_time_stats::probability_greater_than(minutes_type wait) const {
    auto p = probability_less_than(wait);
    if (!p) return std::nullopt;

    return 1.0-*p;
}

std::optional<std::vector<minutes_type>> wait_time_stats::sampled_waits(time_type sample_seconds) const {
    if (impl_->ival.empty) return std::nullopt;
    if (sample_seconds<=0) throw domain_error(pprintf("sample step must be positive, got {} s", sample_seconds));

    return sample_waits(impl_->ival, sample_seconds);
}

wait_time_stats build_stats(std::vector<time_type> times,
                            std::optional<time_type> start,
                            std::optional<time_type> end)
{
    return wait_time_stats(std::move(times), start, end);
}

} // namespace hdw
