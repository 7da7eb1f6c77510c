/// @file src/projection/result_projector.cpp
/// @brief ResultProjector: row projection and CSV rendering.

#include "ridership/projector.hpp"
#include "ridership/calendar.hpp"

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <algorithm>

namespace ridership::projection {

// ─── time_series ─────────────────────────────────────────────────────────────

std::vector<TimeSeriesRow>
ResultProjector::time_series(std::span<const scoring::ScoredRecord> scored,
                             const NetworkTopology& topology) {
    std::vector<TimeSeriesRow> rows;
    rows.reserve(scored.size());

    for (const auto& s : scored) {
        const auto& r = s.record;
        if (r.is_summary()) {
            continue;
        }
        rows.push_back(TimeSeriesRow{
            .entity         = r.entity,
            .label          = topology.entity_label(r.entity),
            .bucket         = *r.bucket,
            .weekday        = calendar::weekday_name(*r.bucket),
            .total_traffic  = r.total_traffic,
            .density        = r.density,
            .device_count   = r.device_count,
            .coverage       = r.coverage,
            .low_confidence = r.low_confidence,
            .priority       = s.priority,
        });
    }

    std::sort(rows.begin(), rows.end(),
              [](const TimeSeriesRow& a, const TimeSeriesRow& b) {
                  if (a.entity != b.entity) return a.entity < b.entity;
                  return a.bucket < b.bucket;
              });
    return rows;
}

// ─── summaries ───────────────────────────────────────────────────────────────

std::vector<SummaryRow>
ResultProjector::summaries(std::span<const scoring::ScoredRecord> scored,
                           const NetworkTopology& topology) {
    std::vector<SummaryRow> rows;
    rows.reserve(scored.size());

    for (const auto& s : scored) {
        const auto& r = s.record;
        const std::size_t buckets = std::max<std::size_t>(r.bucket_count, 1);
        rows.push_back(SummaryRow{
            .entity       = r.entity,
            .label        = topology.entity_label(r.entity),
            .bucket_count = r.bucket_count,
            .first_bucket = r.bucket.value_or(r.first_bucket),
            .last_bucket  = r.bucket.value_or(r.last_bucket),
            .sum_traffic  = r.total_traffic,
            .mean_traffic = r.total_traffic / static_cast<double>(buckets),
            .sum_density  = r.density,
            .mean_density = r.density / static_cast<double>(buckets),
            .priority     = s.priority,
        });
    }

    std::sort(rows.begin(), rows.end(),
              [](const SummaryRow& a, const SummaryRow& b) {
                  if (a.priority != b.priority) return a.priority > b.priority;
                  return a.entity < b.entity;
              });
    return rows;
}

// ─── CSV ─────────────────────────────────────────────────────────────────────

std::string ResultProjector::csv_escape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    std::string out = "\"";
    for (const char ch : field) {
        if (ch == '"') out += '"';
        out += ch;
    }
    out += '"';
    return out;
}

void ResultProjector::write_time_series_csv(std::ostream& out,
                                            std::span<const TimeSeriesRow> rows) {
    fmt::print(out, "entity_kind,entity_id,entity,bucket,weekday,total_traffic,"
                    "density,device_count,coverage,low_confidence,priority\n");
    for (const auto& r : rows) {
        fmt::print(out, "{},{},{},{},{},{:.6f},{:.6f},{},{},{},{:.6f}\n",
                   ridership::to_string(r.entity.kind),
                   r.entity.value,
                   csv_escape(r.label),
                   calendar::format_timestamp(r.bucket),
                   r.weekday,
                   r.total_traffic,
                   r.density,
                   r.device_count,
                   r.coverage,
                   r.low_confidence ? 1 : 0,
                   r.priority);
    }
}

void ResultProjector::write_summary_csv(std::ostream& out,
                                        std::span<const SummaryRow> rows) {
    fmt::print(out, "entity_kind,entity_id,entity,buckets,first_bucket,last_bucket,"
                    "sum_traffic,mean_traffic,sum_density,mean_density,priority\n");
    for (const auto& r : rows) {
        fmt::print(out, "{},{},{},{},{},{},{:.6f},{:.6f},{:.6f},{:.6f},{:.6f}\n",
                   ridership::to_string(r.entity.kind),
                   r.entity.value,
                   csv_escape(r.label),
                   r.bucket_count,
                   calendar::format_timestamp(r.first_bucket),
                   calendar::format_timestamp(r.last_bucket),
                   r.sum_traffic,
                   r.mean_traffic,
                   r.sum_density,
                   r.mean_density,
                   r.priority);
    }
}

}  // namespace ridership::projection
