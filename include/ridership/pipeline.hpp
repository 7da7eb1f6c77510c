#pragma once

/// @file include/ridership/pipeline.hpp
/// @brief Pipeline orchestrator: readings in, ranked priorities out.
///
/// # Module: Pipeline
///
/// ## Responsibility
/// Run every stage over one batch of readings:
///   Readings → IntervalNormalizer → TimeBucketer → MultiKeyAggregator →
///   PriorityScorer (time-series batch and summary batch) → ResultProjector
///
/// ## Usage
/// ```cpp
/// NetworkTopology topology;
/// auto load = DataLoader::load_readings_csv("readings.csv", topology);
/// Pipeline pipeline{config};
/// if (load) {
///     auto result = pipeline.run(load->readings, topology);
///     if (result) fmt::print(stderr, "{}", result->diagnostics.to_string());
/// }
/// ```
///
/// ## Guarantees
/// - `run` returns `nullopt` only when the configuration is invalid
/// - Every dropped reading, unmapped station and degenerate batch is in
///   `PipelineResult::diagnostics`
/// - The time-series batch and the summary batch are scored independently;
///   either may be degenerate while the other succeeds

#include "ridership/aggregator.hpp"
#include "ridership/config.hpp"
#include "ridership/diagnostics.hpp"
#include "ridership/projector.hpp"
#include "ridership/scorer.hpp"
#include "ridership/share.hpp"
#include "ridership/topology.hpp"
#include "ridership/types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace ridership::core {

// ─── PipelineResult ──────────────────────────────────────────────────────────

/// Outcome of scoring one batch.
enum class BatchStatus {
    Scored,      ///< Priorities assigned
    Empty,       ///< No records reached the scorer (InsufficientData)
    Degenerate,  ///< Records present but min-max normalisation undefined
};

[[nodiscard]] const char* to_string(BatchStatus status) noexcept;

/// Everything one run produced.
struct PipelineResult {
    std::size_t reading_count{0};
    std::size_t rate_count{0};
    std::size_t bucketed_count{0};

    /// Per-bucket aggregates after the optional low-coverage exclusion.
    aggregate::AggregateTable aggregates;

    /// Whole-period summary records built from `aggregates.records`.
    std::vector<AggregateRecord> summary_records;

    /// Scored batches; `nullopt` when the batch was empty or degenerate.
    std::optional<std::vector<scoring::ScoredRecord>> series_scored;
    std::optional<std::vector<scoring::ScoredRecord>> summary_scored;

    std::vector<projection::TimeSeriesRow> series_rows;
    std::vector<projection::SummaryRow>    summary_rows;

    /// Entity shares of daily traffic, ranked by mean share.
    std::vector<share::EntityShare>          shares;
    std::vector<share::CumulativeSharePoint> share_curve;

    DiagnosticLog diagnostics;

    [[nodiscard]] BatchStatus series_status() const noexcept {
        if (series_scored) return BatchStatus::Scored;
        return aggregates.records.empty() ? BatchStatus::Empty : BatchStatus::Degenerate;
    }
    [[nodiscard]] BatchStatus summary_status() const noexcept {
        if (summary_scored) return BatchStatus::Scored;
        return summary_records.empty() ? BatchStatus::Empty : BatchStatus::Degenerate;
    }

    [[nodiscard]] bool series_degenerate() const noexcept {
        return series_status() == BatchStatus::Degenerate;
    }
    [[nodiscard]] bool summary_degenerate() const noexcept {
        return summary_status() == BatchStatus::Degenerate;
    }
};

// ─── Pipeline ────────────────────────────────────────────────────────────────

class Pipeline {
public:
    explicit Pipeline(PipelineConfig config = PipelineConfig{});

    /// Run the full pipeline.
    ///
    /// # Returns
    /// `nullopt` if `validate(config)` reports a problem.
    [[nodiscard]] std::optional<PipelineResult>
    run(std::span<const Reading> readings, const NetworkTopology& topology) const;

    [[nodiscard]] const PipelineConfig& config() const noexcept { return config_; }

private:
    PipelineConfig config_;
};

}  // namespace ridership::core
