/// @file src/scoring/priority_scorer.cpp
/// @brief PriorityScorer: component scores, multiplicative combination and
///        min-max normalisation over one batch.
///
/// Batch columns are held in Eigen arrays so the max / min reductions and the
/// element-wise combination read like the formulas in the header.

#include "ridership/scorer.hpp"
#include "ridership/constants.hpp"

#include <Eigen/Dense>
#include <fmt/format.h>

#include <algorithm>
#include <cmath>

namespace ridership::scoring {

namespace {

Eigen::Map<const Eigen::ArrayXd> as_array(std::span<const double> values) noexcept {
    return Eigen::Map<const Eigen::ArrayXd>(values.data(),
                                            static_cast<Eigen::Index>(values.size()));
}

std::vector<double> to_vector(const Eigen::ArrayXd& a) {
    return std::vector<double>(a.data(), a.data() + a.size());
}

}  // namespace

// ─── Constructor ─────────────────────────────────────────────────────────────

PriorityScorer::PriorityScorer(ScoringConfig config) noexcept
    : config_(config) {}

const ScoringConfig& PriorityScorer::config() const noexcept {
    return config_;
}

// ─── component_scores ────────────────────────────────────────────────────────

std::vector<double> PriorityScorer::component_scores(std::span<const double> values) {
    if (values.empty()) {
        return {};
    }

    const auto v = as_array(values);
    const double max = v.maxCoeff();
    if (!(max > 0.0)) {
        return std::vector<double>(values.size(), 0.0);
    }
    const Eigen::ArrayXd scaled = v / max;
    return to_vector(scaled);
}

// ─── min_max_normalize ───────────────────────────────────────────────────────

std::optional<std::vector<double>>
PriorityScorer::min_max_normalize(std::span<const double> raw) {
    if (raw.empty()) {
        return std::nullopt;
    }

    const auto r = as_array(raw);
    if (!r.allFinite()) {
        return std::nullopt;
    }

    const double lo     = r.minCoeff();
    const double hi     = r.maxCoeff();
    const double spread = hi - lo;
    if (spread <= constants::DEGENERATE_SPREAD_EPSILON) {
        return std::nullopt;
    }

    // Plain per-element division keeps the extremes at exactly 0.0 and 1.0.
    std::vector<double> out(raw.size());
    std::transform(raw.begin(), raw.end(), out.begin(),
                   [lo, spread](double x) { return (x - lo) / spread; });
    return out;
}

// ─── score ───────────────────────────────────────────────────────────────────

std::optional<std::vector<ScoredRecord>>
PriorityScorer::score(std::span<const AggregateRecord> batch, DiagnosticLog& log) const {
    if (batch.empty()) {
        log.record(Diagnostic{
            .kind    = ErrorKind::InsufficientData,
            .message = "empty scoring batch",
        });
        return std::nullopt;
    }

    const auto n = static_cast<Eigen::Index>(batch.size());
    Eigen::ArrayXd traffic(n);
    Eigen::ArrayXd density(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        const auto& rec = batch[static_cast<std::size_t>(i)];
        traffic(i) = rec.total_traffic;
        density(i) = rec.density;
    }

    const auto ts = component_scores(std::span<const double>(traffic.data(), batch.size()));
    const auto ds = component_scores(std::span<const double>(density.data(), batch.size()));

    const Eigen::ArrayXd raw =
        (as_array(ts) + config_.traffic_weight) * (as_array(ds) + config_.density_weight);

    const auto priority =
        min_max_normalize(std::span<const double>(raw.data(), batch.size()));
    if (!priority) {
        log.record(Diagnostic{
            .kind       = ErrorKind::DegenerateNormalization,
            .message    = fmt::format("raw priorities span [{:.6g}, {:.6g}]; "
                                      "min-max normalisation undefined",
                                      raw.minCoeff(), raw.maxCoeff()),
            .batch_size = batch.size(),
        });
        return std::nullopt;
    }

    std::vector<ScoredRecord> out;
    out.reserve(batch.size());
    for (std::size_t i = 0; i < batch.size(); ++i) {
        out.push_back(ScoredRecord{
            .record        = batch[i],
            .traffic_score = ts[i],
            .density_score = ds[i],
            .raw_priority  = raw(static_cast<Eigen::Index>(i)),
            .priority      = (*priority)[i],
        });
    }
    return out;
}

// ─── rank ────────────────────────────────────────────────────────────────────

std::vector<ScoredRecord>
PriorityScorer::rank(std::span<const ScoredRecord> scored, std::size_t n) {
    std::vector<ScoredRecord> out(scored.begin(), scored.end());

    std::stable_sort(out.begin(), out.end(),
                     [](const ScoredRecord& a, const ScoredRecord& b) {
                         if (a.priority != b.priority) {
                             return a.priority > b.priority;
                         }
                         if (a.record.entity != b.record.entity) {
                             return a.record.entity < b.record.entity;
                         }
                         return a.record.bucket < b.record.bucket;
                     });

    if (n > 0 && n < out.size()) {
        out.resize(n);
    }
    return out;
}

}  // namespace ridership::scoring
