/// @file tests/projection/test_result_projector.cpp
/// @brief Unit tests for ResultProjector row shaping and CSV output.

#include "ridership/projector.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

using namespace ridership;
using namespace ridership::projection;
using ridership::scoring::ScoredRecord;

namespace {

constexpr Timestamp SATURDAY = 1592611200;  // 2020-06-20 00:00:00 UTC

ScoredRecord scored(EntityId entity, std::optional<Timestamp> bucket,
                    double traffic, double density, double priority,
                    std::size_t buckets = 1) {
    return ScoredRecord{
        .record = AggregateRecord{
            .entity         = entity,
            .bucket         = bucket,
            .total_traffic  = traffic,
            .density        = density,
            .device_count   = 2,
            .coverage       = 3,
            .low_confidence = false,
            .bucket_count   = buckets,
            .first_bucket   = bucket.value_or(SATURDAY),
            .last_bucket    = bucket.value_or(SATURDAY + 8 * 3600),
        },
        .traffic_score = 0.0,
        .density_score = 0.0,
        .raw_priority  = 0.0,
        .priority      = priority,
    };
}

NetworkTopology make_topology() {
    NetworkTopology t;
    t.register_station(StationKey{"59 ST", "NQR456W"});
    t.register_station(StationKey{"TIMES SQ, 42 ST", "1237ACENQRSW"});
    return t;
}

std::size_t line_count(const std::string& text) {
    std::size_t n = 0;
    for (const char ch : text) {
        if (ch == '\n') ++n;
    }
    return n;
}

}  // namespace

// ─── time_series ─────────────────────────────────────────────────────────────

TEST(Projection_TimeSeries, OrderedByEntityThenBucketWithLabels) {
    const auto topology = make_topology();
    const std::vector<ScoredRecord> rows = {
        scored(EntityId::of(StationId{1}), SATURDAY, 10, 5, 0.2),
        scored(EntityId::of(StationId{0}), SATURDAY + 3600, 30, 15, 1.0),
        scored(EntityId::of(StationId{0}), SATURDAY, 20, 10, 0.0),
    };

    const auto out = ResultProjector::time_series(rows, topology);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].entity, EntityId::of(StationId{0}));
    EXPECT_EQ(out[0].bucket, SATURDAY);
    EXPECT_EQ(out[1].bucket, SATURDAY + 3600);
    EXPECT_EQ(out[2].entity, EntityId::of(StationId{1}));
    EXPECT_EQ(out[0].label, "59 ST 456NQRW");
    EXPECT_EQ(out[0].weekday, "Saturday");
    EXPECT_DOUBLE_EQ(out[1].priority, 1.0);
    EXPECT_EQ(out[1].device_count, 2u);
}

TEST(Projection_TimeSeries, SummaryRecordsSkipped) {
    const auto topology = make_topology();
    const std::vector<ScoredRecord> rows = {
        scored(EntityId::of(StationId{0}), std::nullopt, 10, 5, 1.0, 4),
    };
    EXPECT_TRUE(ResultProjector::time_series(rows, topology).empty());
}

// ─── summaries ───────────────────────────────────────────────────────────────

TEST(Projection_Summary, MeansAndPriorityOrder) {
    const auto topology = make_topology();
    const std::vector<ScoredRecord> rows = {
        scored(EntityId::of(StationId{0}), std::nullopt, 40, 20, 0.0, 4),
        scored(EntityId::of(StationId{1}), std::nullopt, 90, 9, 1.0, 3),
    };

    const auto out = ResultProjector::summaries(rows, topology);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].entity, EntityId::of(StationId{1}));
    EXPECT_DOUBLE_EQ(out[0].sum_traffic, 90.0);
    EXPECT_DOUBLE_EQ(out[0].mean_traffic, 30.0);
    EXPECT_DOUBLE_EQ(out[0].mean_density, 3.0);
    EXPECT_EQ(out[1].bucket_count, 4u);
    EXPECT_DOUBLE_EQ(out[1].mean_traffic, 10.0);
    EXPECT_EQ(out[1].first_bucket, SATURDAY);
    EXPECT_EQ(out[1].last_bucket, SATURDAY + 8 * 3600);
}

TEST(Projection_Summary, ComplexLabel) {
    const auto topology = make_topology();
    const std::vector<ScoredRecord> rows = {
        scored(EntityId::of(ComplexId{613}), std::nullopt, 1, 1, 1.0, 1),
    };
    const auto out = ResultProjector::summaries(rows, topology);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].label, "complex 613");
}

// ─── CSV ─────────────────────────────────────────────────────────────────────

TEST(Projection_Csv, EscapeQuotesOnlyWhenNeeded) {
    EXPECT_EQ(ResultProjector::csv_escape("59 ST"), "59 ST");
    EXPECT_EQ(ResultProjector::csv_escape("A, B"), "\"A, B\"");
    EXPECT_EQ(ResultProjector::csv_escape("say \"hi\""), "\"say \"\"hi\"\"\"");
}

TEST(Projection_Csv, TimeSeriesHeaderAndRows) {
    const auto topology = make_topology();
    const std::vector<ScoredRecord> rows = {
        scored(EntityId::of(StationId{1}), SATURDAY + 4 * 3600, 12.5, 6.25, 1.0),
        scored(EntityId::of(StationId{0}), SATURDAY, 1, 0.5, 0.0),
    };
    const auto projected = ResultProjector::time_series(rows, topology);

    std::ostringstream out;
    ResultProjector::write_time_series_csv(out, projected);
    const std::string text = out.str();

    EXPECT_EQ(line_count(text), 3u);
    EXPECT_EQ(text.rfind("entity_kind,entity_id,entity,bucket,weekday,", 0), 0u);
    EXPECT_NE(text.find("station,1,\"TIMES SQ, 42 ST 1237ACENQRSW\",2020-06-20 04:00:00,"
                        "Saturday,12.500000,6.250000,2,3,0,1.000000\n"),
              std::string::npos);
}

TEST(Projection_Csv, SummaryHeaderAndRows) {
    const auto topology = make_topology();
    const std::vector<ScoredRecord> rows = {
        scored(EntityId::of(StationId{0}), std::nullopt, 40, 20, 1.0, 4),
    };
    const auto projected = ResultProjector::summaries(rows, topology);

    std::ostringstream out;
    ResultProjector::write_summary_csv(out, projected);
    const std::string text = out.str();

    EXPECT_EQ(line_count(text), 2u);
    EXPECT_NE(text.find("station,0,59 ST 456NQRW,4,2020-06-20 00:00:00,2020-06-20 08:00:00,"
                        "40.000000,10.000000,20.000000,5.000000,1.000000\n"),
              std::string::npos);
}
