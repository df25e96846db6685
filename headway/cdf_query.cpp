#include <algorithm>
#include <vector>

#include <headway/assert.hpp>
#include <headway/common_types.hpp>

#include "cdf_query.hpp"

namespace hdw {

minutes_type cdf_quantile(const std::vector<cdf_point>& cdf, probability_type q) {
    HDW_ASSERT(!cdf.empty());

    // First point with probability ≥ q.
    auto end = std::lower_bound(cdf.begin(), cdf.end(), q,
        [](const cdf_point& p, probability_type q) { return p.probability<q; });

    if (end==cdf.begin()) return cdf.front().wait;
    if (end==cdf.end()) return cdf.back().wait;

    // Then prev.probability < q ≤ end->probability.
    const auto& b = *end;
    const auto& a = *(end-1);
    return a.wait + (q-a.probability)/(b.probability-a.probability)*(b.wait-a.wait);
}

probability_type cdf_probability_less_than(const std::vector<cdf_point>& cdf, minutes_type w) {
    HDW_ASSERT(!cdf.empty());

    // First point with wait ≥ w.
    auto end = std::lower_bound(cdf.begin(), cdf.end(), w,
        [](const cdf_point& p, minutes_type w) { return p.wait<w; });

    if (end==cdf.end()) return 1.0;
    if (end==cdf.begin()) return 0.0;

    const auto& b = *end;
    const auto& a = *(end-1);
    return a.probability + (w-a.wait)/(b.wait-a.wait)*(b.probability-a.probability);
}

std::vector<probability_type> cdf_histogram(const std::vector<cdf_point>& cdf, const std::vector<minutes_type>& edges) {
    std::vector<probability_type> bins;
    if (edges.size()<2) return bins;

    bins.reserve(edges.size()-1);
    probability_type prev = cdf_probability_less_than(cdf, edges.front());
    for (auto i = edges.begin()+1; i!=edges.end(); ++i) {
        probability_type p = cdf_probability_less_than(cdf, *i);
        bins.push_back(p-prev);
        prev = p;
    }
    return bins;
}

} // namespace hdw
