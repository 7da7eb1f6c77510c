/// @file tests/interval/test_interval_normalizer.cpp
/// @brief Unit tests for IntervalNormalizer.

#include "ridership/interval.hpp"
#include "ridership/constants.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace ridership;
using namespace ridership::interval;

namespace {

constexpr Timestamp HOUR = 3600;

Reading reading(std::uint32_t device, Timestamp t, std::uint64_t inc, std::uint32_t station = 0) {
    return Reading{
        .device        = DeviceId{device},
        .station       = StationId{station},
        .timestamp     = t,
        .net_increment = inc,
    };
}

}  // namespace

// ─── delta_hours / rate ──────────────────────────────────────────────────────

TEST(Interval_DeltaHours, PositiveIntervals) {
    EXPECT_DOUBLE_EQ(*IntervalNormalizer::delta_hours(0, 2 * HOUR), 2.0);
    EXPECT_DOUBLE_EQ(*IntervalNormalizer::delta_hours(0, 30 * 60), 0.5);
}

TEST(Interval_DeltaHours, NonIncreasingReturnsNullopt) {
    EXPECT_FALSE(IntervalNormalizer::delta_hours(100, 100).has_value());
    EXPECT_FALSE(IntervalNormalizer::delta_hours(100, 50).has_value());
}

TEST(Interval_DeltaHours, UnrepresentableDifferenceReturnsNullopt) {
    constexpr Timestamp far = 9223372036854775000;
    EXPECT_FALSE(IntervalNormalizer::delta_hours(-far, far).has_value());
    EXPECT_TRUE(IntervalNormalizer::delta_hours(constants::MIN_TIMESTAMP,
                                             constants::MAX_TIMESTAMP).has_value());
}

TEST(Interval_Rate, DividesByHours) {
    EXPECT_DOUBLE_EQ(*IntervalNormalizer::rate(150, 3.0), 50.0);
    EXPECT_FALSE(IntervalNormalizer::rate(10, 0.0).has_value());
}

// ─── normalize_device ────────────────────────────────────────────────────────

TEST(Interval_Device, HourlyReadingsGiveExpectedRates) {
    // Counter values 100, 150, 150 cleaned upstream into increments 50 and 0.
    const std::vector<Reading> rs = {
        reading(1, 0, 0),
        reading(1, HOUR, 50),
        reading(1, 2 * HOUR, 0),
    };
    DiagnosticLog log;
    const auto out = IntervalNormalizer{}.normalize_device(rs, log);

    ASSERT_EQ(out.size(), 2u);
    EXPECT_DOUBLE_EQ(out[0].delta_hours, 1.0);
    EXPECT_DOUBLE_EQ(out[0].rate, 50.0);
    EXPECT_EQ(out[0].timestamp, HOUR);
    EXPECT_DOUBLE_EQ(out[1].delta_hours, 1.0);
    EXPECT_DOUBLE_EQ(out[1].rate, 0.0);
    EXPECT_TRUE(log.empty());
}

TEST(Interval_Device, LongGapGivesAverageRate) {
    const std::vector<Reading> rs = {
        reading(1, 0, 0),
        reading(1, 4 * HOUR, 200),
    };
    DiagnosticLog log;
    const auto out = IntervalNormalizer{}.normalize_device(rs, log);

    ASSERT_EQ(out.size(), 1u);
    EXPECT_DOUBLE_EQ(out[0].delta_hours, 4.0);
    EXPECT_DOUBLE_EQ(out[0].rate, 50.0);
}

TEST(Interval_Device, OutputCountIsReadingsMinusOne) {
    std::vector<Reading> rs;
    for (int i = 0; i < 10; ++i) {
        rs.push_back(reading(4, i * HOUR, static_cast<std::uint64_t>(i)));
    }
    DiagnosticLog log;
    EXPECT_EQ(IntervalNormalizer{}.normalize_device(rs, log).size(), 9u);
}

TEST(Interval_Device, SingleReadingIsInsufficientData) {
    const std::vector<Reading> rs = {reading(7, 0, 5)};
    DiagnosticLog log;
    const auto out = IntervalNormalizer{}.normalize_device(rs, log);

    EXPECT_TRUE(out.empty());
    ASSERT_EQ(log.count(ErrorKind::InsufficientData), 1u);
    const auto& d = log.entries()[0];
    ASSERT_TRUE(d.device.has_value());
    EXPECT_EQ(d.device->value, 7u);
    EXPECT_EQ(d.batch_size, 1u);
}

TEST(Interval_Device, DuplicateTimestampDroppedAsMalformed) {
    const std::vector<Reading> rs = {
        reading(1, 0, 0),
        reading(1, HOUR, 10),
        reading(1, HOUR, 99),
        reading(1, 2 * HOUR, 20),
    };
    DiagnosticLog log;
    const auto out = IntervalNormalizer{}.normalize_device(rs, log);

    ASSERT_EQ(out.size(), 2u);
    EXPECT_DOUBLE_EQ(out[0].rate, 10.0);
    EXPECT_DOUBLE_EQ(out[1].rate, 20.0);
    EXPECT_EQ(log.count(ErrorKind::MalformedReading), 1u);
    EXPECT_EQ(log.affected_rows(ErrorKind::MalformedReading), 1u);
}

TEST(Interval_Device, BackwardTimestampDoesNotBecomeAnchor) {
    const std::vector<Reading> rs = {
        reading(1, 2 * HOUR, 0),
        reading(1, HOUR, 50),
        reading(1, 4 * HOUR, 40),
    };
    DiagnosticLog log;
    const auto out = IntervalNormalizer{}.normalize_device(rs, log);

    ASSERT_EQ(out.size(), 1u);
    EXPECT_DOUBLE_EQ(out[0].delta_hours, 2.0);
    EXPECT_DOUBLE_EQ(out[0].rate, 20.0);
    EXPECT_EQ(log.count(ErrorKind::MalformedReading), 1u);
}

TEST(Interval_Device, OutOfRangeTimestampsDroppedAsMalformed) {
    constexpr Timestamp far = 9223372036854775000;
    const std::vector<Reading> rs = {
        reading(0, -far, 0),
        reading(0, 0, 0),
        reading(0, HOUR, 40),
        reading(0, far, 10),
    };
    DiagnosticLog log;
    const auto out = IntervalNormalizer{}.normalize_device(rs, log);

    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].timestamp, HOUR);
    EXPECT_DOUBLE_EQ(out[0].rate, 40.0);
    EXPECT_EQ(log.count(ErrorKind::MalformedReading), 2u);
}

TEST(Interval_Device, DropZeroRatesWhenConfigured) {
    const std::vector<Reading> rs = {
        reading(1, 0, 0),
        reading(1, HOUR, 0),
        reading(1, 2 * HOUR, 6),
    };
    DiagnosticLog log;
    const IntervalNormalizer normalizer{IntervalConfig{.drop_zero_rates = true}};
    const auto out = normalizer.normalize_device(rs, log);

    ASSERT_EQ(out.size(), 1u);
    EXPECT_DOUBLE_EQ(out[0].rate, 6.0);
}

// ─── normalize ───────────────────────────────────────────────────────────────

TEST(Interval_Normalize, GroupsByDeviceAndSortsByTime) {
    const std::vector<Reading> rs = {
        reading(2, 2 * HOUR, 8, 1),
        reading(1, HOUR, 5),
        reading(2, 0, 0, 1),
        reading(1, 0, 0),
        reading(2, HOUR, 4, 1),
    };
    DiagnosticLog log;
    const auto out = IntervalNormalizer{}.normalize(rs, log);

    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].device, DeviceId{1});
    EXPECT_DOUBLE_EQ(out[0].rate, 5.0);
    EXPECT_EQ(out[1].device, DeviceId{2});
    EXPECT_EQ(out[1].timestamp, HOUR);
    EXPECT_EQ(out[2].timestamp, 2 * HOUR);
    EXPECT_EQ(out[2].station, StationId{1});
    EXPECT_TRUE(log.empty());
}

TEST(Interval_Normalize, OneBadDeviceDoesNotAffectOthers) {
    const std::vector<Reading> rs = {
        reading(1, 0, 0),
        reading(1, HOUR, 12),
        reading(2, 0, 3),
    };
    DiagnosticLog log;
    const auto out = IntervalNormalizer{}.normalize(rs, log);

    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].device, DeviceId{1});
    EXPECT_EQ(log.count(ErrorKind::InsufficientData), 1u);
}
