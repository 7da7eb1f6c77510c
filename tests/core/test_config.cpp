/// @file tests/core/test_config.cpp
/// @brief Unit tests for PipelineConfig parsing and validation.

#include "ridership/config.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>

using namespace ridership;
using namespace ridership::core;

// ─── parse_duration ──────────────────────────────────────────────────────────

TEST(Config_ParseDuration, PlainSeconds) {
    EXPECT_EQ(parse_duration("3600"), 3600);
}

TEST(Config_ParseDuration, Suffixes) {
    EXPECT_EQ(parse_duration("90s"), 90);
    EXPECT_EQ(parse_duration("15m"), 900);
    EXPECT_EQ(parse_duration("4h"), 14400);
    EXPECT_EQ(parse_duration("1d"), 86400);
    EXPECT_EQ(parse_duration(" 2H "), 7200);
}

TEST(Config_ParseDuration, RejectsMalformed) {
    EXPECT_FALSE(parse_duration("").has_value());
    EXPECT_FALSE(parse_duration("h").has_value());
    EXPECT_FALSE(parse_duration("-1h").has_value());
    EXPECT_FALSE(parse_duration("1.5h").has_value());
    EXPECT_FALSE(parse_duration("4w").has_value());
}

TEST(Config_ParseDuration, RejectsOverflow) {
    EXPECT_FALSE(parse_duration("9223372036854775807d").has_value());
}

// ─── parse_bool ──────────────────────────────────────────────────────────────

TEST(Config_ParseBool, AcceptedSpellings) {
    EXPECT_EQ(parse_bool("TRUE"), true);
    EXPECT_EQ(parse_bool("on"), true);
    EXPECT_EQ(parse_bool("0"), false);
    EXPECT_EQ(parse_bool("no"), false);
    EXPECT_FALSE(parse_bool("maybe").has_value());
}

// ─── parse_config_string ─────────────────────────────────────────────────────

TEST(Config_Parse, FullFileOverridesDefaults) {
    const std::string text =
        "# run settings\n"
        "bucket_resolution    = 4h\n"
        "grouping_key         = Complex\n"
        "min_coverage         = 50   # flag thin buckets\n"
        "traffic_weight       = 0.5\n"
        "density_weight       = 1\n"
        "drop_zero_rates      = yes\n"
        "exclude_low_coverage = true\n"
        "device_count_source  = topology\n"
        "summary_mode         = on\n"
        "top_n                = 25\n"
        "verbose              = false\n";

    const auto result = parse_config_string(text);
    ASSERT_TRUE(result.ok());

    const auto& c = result.config;
    EXPECT_EQ(c.bucket_resolution, 14400);
    EXPECT_EQ(c.grouping_key, GroupingKey::Complex);
    EXPECT_EQ(c.min_coverage, 50u);
    EXPECT_DOUBLE_EQ(c.traffic_weight, 0.5);
    EXPECT_DOUBLE_EQ(c.density_weight, 1.0);
    EXPECT_TRUE(c.drop_zero_rates);
    EXPECT_TRUE(c.exclude_low_coverage);
    EXPECT_EQ(c.device_count_source, aggregate::DeviceCountSource::Topology);
    EXPECT_TRUE(c.summary_mode);
    EXPECT_EQ(c.top_n, 25u);
    EXPECT_FALSE(c.verbose);
}

TEST(Config_Parse, EmptyTextKeepsBase) {
    PipelineConfig base;
    base.bucket_resolution = 900;
    const auto result = parse_config_string("", base);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.config.bucket_resolution, 900);
}

TEST(Config_Parse, ErrorsCarryLineNumbers) {
    const auto result = parse_config_string(
        "bucket_resolution = 1h\n"
        "no equals sign here\n"
        "grouping_key = line\n"
        "colour = blue\n");
    ASSERT_EQ(result.errors.size(), 3u);
    EXPECT_EQ(result.errors[0].rfind("line 2:", 0), 0u);
    EXPECT_EQ(result.errors[1].rfind("line 3:", 0), 0u);
    EXPECT_EQ(result.errors[2].rfind("line 4:", 0), 0u);
    EXPECT_EQ(result.config.bucket_resolution, 3600);
}

TEST(Config_Load, MissingFileReturnsNullopt) {
    EXPECT_FALSE(load_config_file("/nonexistent/ridership.conf").has_value());
}

// ─── validate ────────────────────────────────────────────────────────────────

TEST(Config_Validate, DefaultsAreValid) {
    EXPECT_TRUE(validate(PipelineConfig{}).empty());
}

TEST(Config_Validate, DefaultWeightsAreZero) {
    const PipelineConfig c;
    EXPECT_DOUBLE_EQ(c.traffic_weight, 0.0);
    EXPECT_DOUBLE_EQ(c.density_weight, 0.0);
}

TEST(Config_Validate, NonPositiveResolutionRejected) {
    PipelineConfig c;
    c.bucket_resolution = 0;
    EXPECT_EQ(validate(c).size(), 1u);
}

TEST(Config_Validate, NegativeOrNonFiniteWeightsRejected) {
    PipelineConfig c;
    c.traffic_weight = -0.1;
    c.density_weight = std::numeric_limits<double>::infinity();
    EXPECT_EQ(validate(c).size(), 2u);
}

// ─── to_string ───────────────────────────────────────────────────────────────

TEST(Config_ToString, RenderingParsesBackToSameConfig) {
    PipelineConfig c;
    c.bucket_resolution   = 4 * 3600;
    c.grouping_key        = GroupingKey::Complex;
    c.min_coverage        = 7;
    c.traffic_weight      = 0.25;
    c.summary_mode        = true;
    c.device_count_source = aggregate::DeviceCountSource::Topology;

    const auto back = parse_config_string(to_string(c));
    ASSERT_TRUE(back.ok());
    EXPECT_EQ(back.config.bucket_resolution, c.bucket_resolution);
    EXPECT_EQ(back.config.grouping_key, c.grouping_key);
    EXPECT_EQ(back.config.min_coverage, c.min_coverage);
    EXPECT_DOUBLE_EQ(back.config.traffic_weight, c.traffic_weight);
    EXPECT_EQ(back.config.summary_mode, c.summary_mode);
    EXPECT_EQ(back.config.device_count_source, c.device_count_source);
}
