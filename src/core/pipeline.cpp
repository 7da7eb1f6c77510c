/// @file src/core/pipeline.cpp
/// @brief Pipeline::run: stage sequencing and progress output.

#include "ridership/pipeline.hpp"
#include "ridership/bucketer.hpp"
#include "ridership/interval.hpp"

#include <fmt/format.h>

#include <utility>

namespace ridership::core {

const char* to_string(BatchStatus status) noexcept {
    switch (status) {
        case BatchStatus::Scored:     return "scored";
        case BatchStatus::Empty:      return "empty";
        case BatchStatus::Degenerate: return "degenerate";
    }
    return "unknown";
}

Pipeline::Pipeline(PipelineConfig config)
    : config_(std::move(config)) {}

std::optional<PipelineResult>
Pipeline::run(std::span<const Reading> readings, const NetworkTopology& topology) const {
    if (!validate(config_).empty()) {
        return std::nullopt;
    }

    const auto bucketer = bucket::TimeBucketer::make(config_.bucket_resolution);
    if (!bucketer) {
        return std::nullopt;
    }

    PipelineResult result;
    result.reading_count = readings.size();
    DiagnosticLog& log = result.diagnostics;

    // Step 1: readings → per-interval hourly rates
    const interval::IntervalNormalizer normalizer{
        interval::IntervalConfig{.drop_zero_rates = config_.drop_zero_rates}};
    const auto rates = normalizer.normalize(readings, log);
    result.rate_count = rates.size();
    if (config_.verbose) {
        fmt::print(stderr, "[interval] {} readings -> {} rate records\n",
                   readings.size(), rates.size());
    }

    // Step 2: rates → (device, bucket)
    const auto bucketed = bucketer->bucket(rates);
    result.bucketed_count = bucketed.size();
    if (config_.verbose) {
        fmt::print(stderr, "[bucket] resolution {}s -> {} bucketed rates\n",
                   bucketer->resolution(), bucketed.size());
    }

    // Step 3: device buckets → entity buckets
    const aggregate::MultiKeyAggregator aggregator{aggregate::AggregationConfig{
        .grouping            = config_.grouping_key,
        .min_coverage        = config_.min_coverage,
        .device_count_source = config_.device_count_source,
    }};
    const auto observed = aggregate::MultiKeyAggregator::observed_devices(readings);
    result.aggregates = aggregator.aggregate(bucketed, observed, topology, log);
    if (config_.verbose) {
        fmt::print(stderr,
                   "[aggregate] {} {} records, {} low-confidence, {} unmapped rows, "
                   "{} excluded entities\n",
                   result.aggregates.records.size(), ridership::to_string(config_.grouping_key),
                   result.aggregates.low_confidence_count(), result.aggregates.unmapped_rows,
                   result.aggregates.excluded_entities);
    }

    if (config_.exclude_low_coverage) {
        const std::size_t before = result.aggregates.records.size();
        result.aggregates.records =
            aggregate::MultiKeyAggregator::exclude_low_confidence(result.aggregates.records);
        if (config_.verbose) {
            fmt::print(stderr, "[aggregate] excluded {} low-coverage records\n",
                       before - result.aggregates.records.size());
        }
    }

    // Step 4: score the per-bucket batch and the summary batch separately
    const scoring::PriorityScorer scorer{scoring::ScoringConfig{
        .traffic_weight = config_.traffic_weight,
        .density_weight = config_.density_weight,
    }};

    result.series_scored = scorer.score(result.aggregates.records, log);
    result.summary_records = aggregate::MultiKeyAggregator::summarize(result.aggregates.records);
    result.summary_scored = scorer.score(result.summary_records, log);
    if (config_.verbose) {
        fmt::print(stderr, "[score] time series: {}, summary: {}\n",
                   result.series_scored ? "ok" : "degenerate",
                   result.summary_scored ? "ok" : "degenerate");
    }

    // Step 5: project to report rows
    if (result.series_scored) {
        result.series_rows =
            projection::ResultProjector::time_series(*result.series_scored, topology);
    }
    if (result.summary_scored) {
        result.summary_rows =
            projection::ResultProjector::summaries(*result.summary_scored, topology);
    }

    const auto daily = share::TrafficShare::daily_shares(result.aggregates.records);
    result.shares = share::TrafficShare::mean_shares(daily);
    result.share_curve = share::TrafficShare::cumulative_share_curve(result.shares);

    if (config_.verbose) {
        fmt::print(stderr, "[pipeline] {} diagnostics\n", log.size());
    }

    return result;
}

}  // namespace ridership::core
