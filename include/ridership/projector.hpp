#pragma once

/// @file include/ridership/projector.hpp
/// @brief Result Projector: caller-facing tables and their CSV form.
///
/// # Module: Result Projector
///
/// ## Responsibility
/// Reshape scored aggregates into the two exported tables:
///   - time series: one row per (entity, bucket)
///   - summaries:   one row per entity over the whole range
///
/// Pure selection and formatting. No value here is computed beyond means
/// (sum / bucket count) and labels.
///
/// ## CSV Columns
/// ```
/// entity_kind,entity_id,entity,bucket,weekday,total_traffic,density,device_count,coverage,low_confidence,priority
/// entity_kind,entity_id,entity,buckets,first_bucket,last_bucket,sum_traffic,mean_traffic,sum_density,mean_density,priority
/// ```

#include "ridership/scorer.hpp"
#include "ridership/topology.hpp"
#include "ridership/types.hpp"

#include <cstddef>
#include <ostream>
#include <span>
#include <string>
#include <vector>

namespace ridership::projection {

struct TimeSeriesRow {
    EntityId    entity;
    std::string label;
    Timestamp   bucket;
    std::string weekday;
    double      total_traffic;
    double      density;
    std::size_t device_count;
    std::size_t coverage;
    bool        low_confidence;
    double      priority;
};

struct SummaryRow {
    EntityId    entity;
    std::string label;
    std::size_t bucket_count;
    Timestamp   first_bucket;
    Timestamp   last_bucket;
    double      sum_traffic;
    double      mean_traffic;
    double      sum_density;
    double      mean_density;
    double      priority;
};

class ResultProjector {
public:
    /// Per-bucket rows ordered by (entity, bucket). Summary records in
    /// `scored` are skipped.
    [[nodiscard]] static std::vector<TimeSeriesRow>
    time_series(std::span<const scoring::ScoredRecord> scored, const NetworkTopology& topology);

    /// One row per scored summary record, ordered by priority descending,
    /// then entity. A per-bucket record is rendered as a one-bucket summary.
    [[nodiscard]] static std::vector<SummaryRow>
    summaries(std::span<const scoring::ScoredRecord> scored, const NetworkTopology& topology);

    static void write_time_series_csv(std::ostream& out, std::span<const TimeSeriesRow> rows);
    static void write_summary_csv(std::ostream& out, std::span<const SummaryRow> rows);

    /// Quote a CSV field if it contains a comma, quote or line break.
    [[nodiscard]] static std::string csv_escape(const std::string& field);
};

}  // namespace ridership::projection
