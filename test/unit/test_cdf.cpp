#include <optional>
#include <vector>

#include <headway/common_types.hpp>
#include <headway/hdwexcept.hpp>

#include "interval.hpp"
#include "wait_cdf.hpp"

#include "common.hpp"

using namespace hdw;

using cdf_type = std::vector<cdf_point>;

TEST(cdf, empty) {
    EXPECT_FALSE(wait_time_cdf(resolve_interval({}, std::nullopt, std::nullopt)));
    EXPECT_FALSE(wait_time_cdf(resolve_interval({100, 300}, 0, 100)));
}

TEST(cdf, nothing_to_wait_for) {
    // Non-empty interval with neither an arrival nor a following arrival.
    arrival_interval ival;
    ival.empty = false;
    ival.start = 0;
    ival.end = 100;

    EXPECT_FALSE(wait_time_cdf(ival));
}

TEST(cdf, regular_headway) {
    // Uniform on [0, 10] minutes.
    auto cdf = wait_time_cdf(resolve_interval({0, 600, 1200}, 0, 1800));
    ASSERT_TRUE(cdf);
    EXPECT_EQ((cdf_type{{0, 0}, {10, 1}}), *cdf);
}

TEST(cdf, irregular_headway) {
    // Ramps of 1, 3 and 6 minutes over 10 minutes.
    auto cdf = wait_time_cdf(resolve_interval({0, 60, 240, 600}, std::nullopt, std::nullopt));
    ASSERT_TRUE(cdf);
    EXPECT_TRUE(testing::valid_cdf(*cdf));
    EXPECT_TRUE(testing::cdf_near(cdf_type{{0, 0}, {1, 0.3}, {3, 0.7}, {6, 1}}, *cdf));
}

TEST(cdf, partial_ramps) {
    // Interval [300, 1500): ramps 300→0, 600→0, then a tail 600→300.
    auto cdf = wait_time_cdf(resolve_interval({0, 600, 1200, 1800}, 300, 1500));
    ASSERT_TRUE(cdf);
    EXPECT_TRUE(testing::cdf_near(cdf_type{{0, 0}, {5, 0.5}, {10, 1}}, *cdf));
}

TEST(cdf, tail_only) {
    // Waits run uniformly from 10 to 15 minutes.
    auto cdf = wait_time_cdf(resolve_interval({0, 1000}, 100, 400));
    ASSERT_TRUE(cdf);
    EXPECT_EQ((cdf_type{{10, 0}, {15, 1}}), *cdf);
}

TEST(cdf, tail_above_headways) {
    // One zero-length headway, then a tail from 300 s down to 200 s:
    // no wait between 0 and 200/60 minutes.
    auto cdf = wait_time_cdf(resolve_interval({0, 300}, 0, 100));
    ASSERT_TRUE(cdf);
    EXPECT_TRUE(testing::valid_cdf(*cdf));
    EXPECT_TRUE(testing::cdf_near(cdf_type{{0, 0}, {200./60, 0}, {5, 1}}, *cdf));
}

TEST(cdf, tail_within_headways) {
    // Headways 600 and 600; tail runs 400→100 over [1200, 1500), next
    // arrival at 1600.
    auto ival = resolve_interval({0, 600, 1200, 1600}, 0, 1500);
    ASSERT_EQ(100, ival.end_wait_time.value_or(-1));

    auto cdf = wait_time_cdf(ival);
    ASSERT_TRUE(cdf);
    EXPECT_TRUE(testing::valid_cdf(*cdf));

    // Below 100 s: two ramps. 100 to 400 s: three. 400 to 600 s: two.
    // Seconds with wait < w: 200, 1100, 1500 over 1500.
    cdf_type expected = {
        {0, 0},
        {100./60, 200./1500},
        {400./60, 1100./1500},
        {10, 1}
    };
    EXPECT_TRUE(testing::cdf_near(expected, *cdf));
}

TEST(cdf, coincident_breakpoints) {
    // Tail of zero elapsed time coinciding with a headway.
    arrival_interval ival;
    ival.empty = false;
    ival.start = 0;
    ival.end = 600;
    ival.arrivals = {0, 300};
    ival.headways = {0, 300};
    ival.end_elapsed_time = 300;
    ival.end_wait_time = 0;

    auto cdf = wait_time_cdf(ival);
    ASSERT_TRUE(cdf);
    EXPECT_EQ((cdf_type{{0, 0}, {5, 1}}), *cdf);
}

TEST(cdf, inconsistent_interval) {
    // Headways do not cover the interval: the construction cannot reach 1.
    arrival_interval ival;
    ival.empty = false;
    ival.start = 0;
    ival.end = 1000;
    ival.arrivals = {100};
    ival.headways = {100};

    try {
        wait_time_cdf(ival);
        FAIL() << "expected invalid_cumulative_distribution";
    }
    catch (invalid_cumulative_distribution& e) {
        EXPECT_EQ((std::vector<time_type>{100}), e.headways);
        EXPECT_EQ((std::vector<time_type>{0, 100}), e.breakpoints);
        EXPECT_FALSE(e.end_wait_time);
        ASSERT_EQ(2u, e.points.size());
        EXPECT_EQ(0.1, e.points.back().probability);
    }
}

TEST(cdf, probability_reaches_one_exactly) {
    std::vector<time_type> times = {17, 101, 233, 239, 240, 977, 1301, 1303, 2000, 2999};

    for (time_type s: {0, 17, 50, 239, 500}) {
        for (time_type e: {1000, 1302, 2500, 5000}) {
            auto cdf = wait_time_cdf(resolve_interval(times, s, e));
            ASSERT_TRUE(cdf);
            EXPECT_TRUE(testing::valid_cdf(*cdf)) << "interval [" << s << ", " << e << ")";
        }
    }
}
