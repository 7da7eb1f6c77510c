/// @file tests/bucket/test_time_bucketer.cpp
/// @brief Unit tests for TimeBucketer.

#include "ridership/bucketer.hpp"
#include "ridership/constants.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <vector>

using namespace ridership;
using namespace ridership::bucket;

namespace {

constexpr Timestamp HOUR = 3600;

RateRecord rate(std::uint32_t device, Timestamp t, double r) {
    return RateRecord{
        .device      = DeviceId{device},
        .station     = StationId{0},
        .timestamp   = t,
        .delta_hours = 1.0,
        .rate        = r,
    };
}

}  // namespace

TEST(Bucket_Make, NonPositiveResolutionRejected) {
    EXPECT_FALSE(TimeBucketer::make(0).has_value());
    EXPECT_FALSE(TimeBucketer::make(-3600).has_value());
    ASSERT_TRUE(TimeBucketer::make(3600).has_value());
    EXPECT_EQ(TimeBucketer::make(3600)->resolution(), 3600);
}

TEST(Bucket_Snap, RoundsToNearestBoundary) {
    const auto b = *TimeBucketer::make(4 * HOUR);
    EXPECT_EQ(b.snap(0), 0);
    EXPECT_EQ(b.snap(HOUR), 0);
    EXPECT_EQ(b.snap(2 * HOUR - 1), 0);
    EXPECT_EQ(b.snap(3 * HOUR), 4 * HOUR);
    EXPECT_EQ(b.snap(5 * HOUR), 4 * HOUR);
}

TEST(Bucket_Snap, HalfwayRoundsUp) {
    const auto b = *TimeBucketer::make(4 * HOUR);
    EXPECT_EQ(b.snap(2 * HOUR), 4 * HOUR);
}

TEST(Bucket_Snap, NegativeTimestamps) {
    const auto b = *TimeBucketer::make(HOUR);
    EXPECT_EQ(b.snap(-HOUR / 2), 0);
    EXPECT_EQ(b.snap(-HOUR / 2 - 1), -HOUR);
}

TEST(Bucket_Snap, RangeEndsWithHugeResolution) {
    const auto huge = *TimeBucketer::make(std::numeric_limits<std::int64_t>::max());
    EXPECT_EQ(huge.snap(constants::MAX_TIMESTAMP), 0);
    EXPECT_EQ(huge.snap(constants::MIN_TIMESTAMP), 0);

    const auto day = *TimeBucketer::make(86400);
    EXPECT_EQ(day.snap(constants::MAX_TIMESTAMP), constants::MAX_TIMESTAMP + 1);
    EXPECT_EQ(day.snap(constants::MIN_TIMESTAMP), constants::MIN_TIMESTAMP);
}

TEST(Bucket_Snap, AlignedTimestampsUnchanged) {
    const auto b = *TimeBucketer::make(900);
    for (Timestamp t = -9000; t <= 9000; t += 900) {
        EXPECT_EQ(b.snap(t), t);
    }
}

TEST(Bucket_Merge, SameDeviceAndBucketAreSummed) {
    const auto b = *TimeBucketer::make(4 * HOUR);
    const std::vector<RateRecord> rs = {
        rate(1, 3 * HOUR, 10.0),
        rate(1, 5 * HOUR, 2.5),
        rate(1, 9 * HOUR, 1.0),
        rate(2, 4 * HOUR, 7.0),
    };

    const auto out = b.bucket(rs);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].device, DeviceId{1});
    EXPECT_EQ(out[0].bucket, 4 * HOUR);
    EXPECT_DOUBLE_EQ(out[0].rate, 12.5);
    EXPECT_EQ(out[1].bucket, 8 * HOUR);
    EXPECT_EQ(out[2].device, DeviceId{2});
    EXPECT_DOUBLE_EQ(out[2].rate, 7.0);
}

TEST(Bucket_Merge, EmptyInput) {
    const auto b = *TimeBucketer::make(HOUR);
    EXPECT_TRUE(b.bucket({}).empty());
}
