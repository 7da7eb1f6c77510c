/// @file tests/core/test_calendar.cpp
/// @brief Unit tests for the UTC calendar helpers.

#include "ridership/calendar.hpp"
#include "ridership/constants.hpp"

#include <gtest/gtest.h>

using namespace ridership;
using namespace ridership::calendar;

namespace {

constexpr Timestamp JUNE_20_2020 = 1592611200;  // Saturday 00:00:00 UTC

}  // namespace

// ─── floor_div ───────────────────────────────────────────────────────────────

TEST(Calendar_FloorDiv, PositiveValuesTruncate) {
    EXPECT_EQ(floor_div(7, 2), 3);
    EXPECT_EQ(floor_div(8, 2), 4);
}

TEST(Calendar_FloorDiv, NegativeValuesRoundTowardNegativeInfinity) {
    EXPECT_EQ(floor_div(-1, 3600), -1);
    EXPECT_EQ(floor_div(-3600, 3600), -1);
    EXPECT_EQ(floor_div(-3601, 3600), -2);
}

// ─── to_civil / from_civil ───────────────────────────────────────────────────

TEST(Calendar_Civil, EpochIsMidnightJanuaryFirst1970) {
    const auto c = to_civil(0);
    EXPECT_EQ(c, (CivilDateTime{1970, 1, 1, 0, 0, 0}));
}

TEST(Calendar_Civil, KnownDateConverts) {
    const auto c = to_civil(1582979415);
    EXPECT_EQ(c, (CivilDateTime{2020, 2, 29, 12, 30, 15}));
}

TEST(Calendar_Civil, NegativeTimestampIsPreviousDay) {
    const auto c = to_civil(-3600);
    EXPECT_EQ(c, (CivilDateTime{1969, 12, 31, 23, 0, 0}));
}

TEST(Calendar_Civil, FromCivilInvertsToCivil) {
    for (const Timestamp t : {Timestamp{0}, Timestamp{-3600}, JUNE_20_2020 + 4 * 3600 + 17}) {
        const auto back = from_civil(to_civil(t));
        ASSERT_TRUE(back.has_value());
        EXPECT_EQ(*back, t);
    }
}

TEST(Calendar_Civil, InvalidDateReturnsNullopt) {
    EXPECT_FALSE(from_civil(CivilDateTime{2021, 2, 29, 0, 0, 0}).has_value());
    EXPECT_FALSE(from_civil(CivilDateTime{2020, 13, 1, 0, 0, 0}).has_value());
    EXPECT_FALSE(from_civil(CivilDateTime{2020, 6, 20, 24, 0, 0}).has_value());
}

// ─── Day helpers ─────────────────────────────────────────────────────────────

TEST(Calendar_Day, FloorToDayDropsTimeOfDay) {
    EXPECT_EQ(floor_to_day(JUNE_20_2020 + 23 * 3600 + 59), JUNE_20_2020);
    EXPECT_EQ(floor_to_day(-1), -86400);
}

TEST(Calendar_Day, WeekdayNames) {
    EXPECT_STREQ(weekday_name(JUNE_20_2020), "Saturday");
    EXPECT_STREQ(weekday_name(JUNE_20_2020 + 86400), "Sunday");
    EXPECT_STREQ(weekday_name(0), "Thursday");
    EXPECT_STREQ(weekday_name(-1), "Wednesday");
}

// ─── format_timestamp / parse_timestamp ──────────────────────────────────────

TEST(Calendar_Format, ZeroPaddedIsoLikeOutput) {
    EXPECT_EQ(format_timestamp(JUNE_20_2020 + 4 * 3600), "2020-06-20 04:00:00");
}

TEST(Calendar_Parse, EpochSeconds) {
    EXPECT_EQ(parse_timestamp("1592611200"), JUNE_20_2020);
    EXPECT_EQ(parse_timestamp("-3600"), -3600);
}

TEST(Calendar_Parse, DateOnlyIsMidnight) {
    EXPECT_EQ(parse_timestamp("2020-06-20"), JUNE_20_2020);
}

TEST(Calendar_Parse, DateTimeWithSpaceOrT) {
    EXPECT_EQ(parse_timestamp("2020-06-20 04:00:00"), JUNE_20_2020 + 4 * 3600);
    EXPECT_EQ(parse_timestamp("2020-06-20T04:00:00"), JUNE_20_2020 + 4 * 3600);
}

TEST(Calendar_Parse, SurroundingWhitespaceIgnored) {
    EXPECT_EQ(parse_timestamp("  2020-06-20 04:00:00\r"), JUNE_20_2020 + 4 * 3600);
}

TEST(Calendar_Parse, MalformedInputReturnsNullopt) {
    EXPECT_FALSE(parse_timestamp("").has_value());
    EXPECT_FALSE(parse_timestamp("yesterday").has_value());
    EXPECT_FALSE(parse_timestamp("2020-06-20 4:00:00").has_value());
    EXPECT_FALSE(parse_timestamp("2020/06/20").has_value());
    EXPECT_FALSE(parse_timestamp("2020-02-30").has_value());
    EXPECT_FALSE(parse_timestamp("12abc").has_value());
}

TEST(Calendar_Parse, EpochOutsideYearsZeroTo9999Rejected) {
    EXPECT_TRUE(in_range(constants::MIN_TIMESTAMP));
    EXPECT_TRUE(in_range(constants::MAX_TIMESTAMP));
    EXPECT_FALSE(in_range(constants::MIN_TIMESTAMP - 1));
    EXPECT_FALSE(in_range(constants::MAX_TIMESTAMP + 1));

    EXPECT_EQ(parse_timestamp("253402300799"), constants::MAX_TIMESTAMP);
    EXPECT_FALSE(parse_timestamp("253402300800").has_value());
    EXPECT_FALSE(parse_timestamp("-62167219201").has_value());
    EXPECT_FALSE(parse_timestamp("9223372036854775000").has_value());
    EXPECT_EQ(parse_timestamp("9999-12-31 23:59:59"), constants::MAX_TIMESTAMP);
    EXPECT_EQ(parse_timestamp("0000-01-01"), constants::MIN_TIMESTAMP);
}

TEST(Calendar_Parse, FormatThenParseIsIdentity) {
    const Timestamp t = JUNE_20_2020 + 13 * 3600 + 7 * 60 + 9;
    EXPECT_EQ(parse_timestamp(format_timestamp(t)), t);
}
