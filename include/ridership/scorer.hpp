#pragma once

/// @file include/ridership/scorer.hpp
/// @brief Priority Scorer: bounded, batch-comparable priority per aggregate.
///
/// # Module: Priority Scorer
///
/// ## Responsibility
/// Rank aggregates so that entities that are both busy and crowded come
/// first. An entity high on only one axis (a large open station with many
/// turnstiles, or a small quiet one that is briefly crowded) scores lower.
///
/// ## Formula
/// Within one batch:
///
///     traffic_score = total_traffic / max(total_traffic)
///     density_score = density / max(density)
///     raw           = (traffic_score + w_t) · (density_score + w_d)
///     priority      = (raw − min(raw)) / (max(raw) − min(raw))
///
/// w_t and w_d default to 0 (pure multiplicative). Positive weights soften
/// the penalty for being low on one axis.
///
/// ## Edge Cases
/// - Empty batch → `nullopt`, InsufficientData
/// - All raw values equal → `nullopt`, DegenerateNormalization. No row of the
///   batch gets a priority; NaN/Inf is never produced
/// - A component whose batch maximum is 0 scores 0 for every record
///
/// ## Guarantees
/// - Every produced priority lies in [0, 1]; the batch minimum maps to
///   exactly 0.0 and the maximum to exactly 1.0
/// - Scores are comparable only within the batch they were computed in
/// - Stateless apart from the weights; safe to share across threads

#include "ridership/diagnostics.hpp"
#include "ridership/types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace ridership::scoring {

struct ScoringConfig {
    double traffic_weight = 0.0;  ///< Offset added to traffic_score (≥ 0)
    double density_weight = 0.0;  ///< Offset added to density_score (≥ 0)
};

/// An aggregate together with its score breakdown.
struct ScoredRecord {
    AggregateRecord record;
    double          traffic_score;
    double          density_score;
    double          raw_priority;
    double          priority;  ///< ∈ [0, 1]
};

class PriorityScorer {
public:
    explicit PriorityScorer(ScoringConfig config = ScoringConfig{}) noexcept;

    /// Score one batch.
    ///
    /// # Returns
    /// One ScoredRecord per input record in input order, or `nullopt` if the
    /// batch is empty or degenerate (the reason is recorded in `log`).
    [[nodiscard]] std::optional<std::vector<ScoredRecord>>
    score(std::span<const AggregateRecord> batch, DiagnosticLog& log) const;

    /// Divide each value by the maximum of `values`.
    ///
    /// Returns all zeros when the maximum is not positive.
    [[nodiscard]] static std::vector<double>
    component_scores(std::span<const double> values);

    /// Min-max normalise `raw` to [0, 1].
    ///
    /// # Returns
    /// `nullopt` if `raw` is empty, contains a non-finite value, or its
    /// spread (max − min) is ≤ DEGENERATE_SPREAD_EPSILON.
    [[nodiscard]] static std::optional<std::vector<double>>
    min_max_normalize(std::span<const double> raw);

    /// Top `n` rows by priority descending; ties by entity then bucket
    /// ascending. `n == 0` returns every row, sorted.
    [[nodiscard]] static std::vector<ScoredRecord>
    rank(std::span<const ScoredRecord> scored, std::size_t n = 0);

    [[nodiscard]] const ScoringConfig& config() const noexcept;

private:
    ScoringConfig config_;
};

}  // namespace ridership::scoring
