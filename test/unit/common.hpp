#pragma once

/*
 * Convenience functions, structs used across
 * more than one unit test.
 */

#include <cmath>
#include <cstddef>
#include <iostream>
#include <iterator>
#include <type_traits>
#include <vector>

#include <gtest/gtest.h>

#include <headway/common_types.hpp>

namespace hdw {
    // gtest value printer for CDF points.
    inline std::ostream& operator<<(std::ostream& out, const cdf_point& p) {
        return out << '(' << p.wait << ',' << p.probability << ')';
    }
}

namespace testing {

// Google Test assertion-returning predicates:

// Assert two values are 'almost equal', with exact test for non-floating point types.
// (Uses internal class `FloatingPoint` from gtest.)

template <typename FPType>
::testing::AssertionResult almost_eq_(FPType a, FPType b, std::true_type) {
    using FP = testing::internal::FloatingPoint<FPType>;

    if ((std::isnan(a) && std::isnan(b)) || FP{a}.AlmostEquals(FP{b})) {
        return ::testing::AssertionSuccess();
    }

    return ::testing::AssertionFailure() << "floating point numbers " << a << " and " << b << " differ";
}

template <typename X>
::testing::AssertionResult almost_eq_(const X& a, const X& b, std::false_type) {
    if (a==b) {
        return ::testing::AssertionSuccess();
    }

    return ::testing::AssertionFailure() << "values " << a << " and " << b << " differ";
}

template <typename X>
::testing::AssertionResult almost_eq(const X& a, const X& b) {
    return almost_eq_(a, b, typename std::is_floating_point<X>::type{});
}

// Assert two sequences of floating point values are within `tol` of each other.

template <typename Seq1, typename Seq2>
::testing::AssertionResult seq_near(Seq1&& seq1, Seq2&& seq2, double tol) {
    using std::begin;
    using std::end;

    auto i1 = begin(seq1);
    auto i2 = begin(seq2);

    auto e1 = end(seq1);
    auto e2 = end(seq2);

    for (std::size_t j = 0; i1!=e1 && i2!=e2; ++i1, ++i2, ++j) {
        double v1 = *i1;
        double v2 = *i2;

        if (!(std::abs(v1-v2)<=tol)) {
            return ::testing::AssertionFailure() << "values " << v1 << " and " << v2 << " differ at index " << j;
        }
    }

    if (i1!=e1 || i2!=e2) {
        return ::testing::AssertionFailure() << "sequences differ in length";
    }
    return ::testing::AssertionSuccess();
}

// Assert two CDFs have the same number of points, and that the points agree
// to within `tol` in each coordinate.

inline ::testing::AssertionResult cdf_near(const std::vector<hdw::cdf_point>& a,
                                           const std::vector<hdw::cdf_point>& b,
                                           double tol = 1e-12)
{
    if (a.size()!=b.size()) {
        return ::testing::AssertionFailure() << "CDFs have " << a.size() << " and " << b.size() << " points";
    }
    for (std::size_t j = 0; j<a.size(); ++j) {
        if (!(std::abs(a[j].wait-b[j].wait)<=tol && std::abs(a[j].probability-b[j].probability)<=tol)) {
            return ::testing::AssertionFailure() << "points " << a[j] << " and " << b[j] << " differ at index " << j;
        }
    }
    return ::testing::AssertionSuccess();
}

// Assert a CDF is well formed: strictly increasing wait, non-decreasing
// probability, from exactly 0 to exactly 1.

inline ::testing::AssertionResult valid_cdf(const std::vector<hdw::cdf_point>& cdf) {
    if (cdf.size()<2) {
        return ::testing::AssertionFailure() << "CDF has " << cdf.size() << " points";
    }
    if (cdf.front().probability!=0) {
        return ::testing::AssertionFailure() << "CDF starts at " << cdf.front();
    }
    if (cdf.back().probability!=1) {
        return ::testing::AssertionFailure() << "CDF ends at " << cdf.back();
    }
    for (std::size_t j = 1; j<cdf.size(); ++j) {
        if (!(cdf[j-1].wait<cdf[j].wait) || !(cdf[j-1].probability<=cdf[j].probability)) {
            return ::testing::AssertionFailure() << "CDF decreases between " << cdf[j-1] << " and " << cdf[j];
        }
    }
    return ::testing::AssertionSuccess();
}

} // namespace testing
