#pragma once

/// @file include/ridership/config.hpp
/// @brief PipelineConfig and its text forms (config file, CLI values).
///
/// # Config File Format
/// ```
/// # comment
/// bucket_resolution    = 4h
/// grouping_key         = complex
/// min_coverage         = 50
/// traffic_weight       = 0.0
/// density_weight       = 0.0
/// drop_zero_rates      = false
/// exclude_low_coverage = true
/// device_count_source  = observed
/// summary_mode         = true
/// top_n                = 25
/// verbose              = false
/// ```
/// Keys are the PipelineConfig field names. Durations accept a plain number
/// of seconds or a number with an `s`, `m`, `h` or `d` suffix.

#include "ridership/aggregator.hpp"
#include "ridership/constants.hpp"
#include "ridership/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ridership::core {

// ─── PipelineConfig ──────────────────────────────────────────────────────────

/// Every recognised option of one pipeline run.
struct PipelineConfig {
    /// Bucket width in seconds (> 0).
    std::int64_t bucket_resolution = constants::DEFAULT_BUCKET_RESOLUTION;

    /// Buckets with fewer distinct entities are flagged low-confidence.
    std::size_t min_coverage = constants::DEFAULT_MIN_COVERAGE;

    /// Offsets added to the component scores before multiplication (≥ 0).
    double traffic_weight = constants::DEFAULT_TRAFFIC_WEIGHT;
    double density_weight = constants::DEFAULT_DENSITY_WEIGHT;

    GroupingKey grouping_key = GroupingKey::Station;

    /// Exclude zero-rate intervals in the Interval Normalizer.
    bool drop_zero_rates = false;

    /// Remove low-confidence buckets before scoring and summarising.
    bool exclude_low_coverage = false;

    aggregate::DeviceCountSource device_count_source =
        aggregate::DeviceCountSource::Observed;

    /// Report the whole-period summary table instead of the time series.
    bool summary_mode = false;

    /// Rows printed by the CLI ranking (0 = all).
    std::size_t top_n = 0;

    /// If true, emit per-stage progress to stderr.
    bool verbose = false;
};

/// Outcome of reading configuration text.
struct ConfigLoadResult {
    PipelineConfig           config;
    std::vector<std::string> errors;  ///< "line N: ..." per rejected line

    [[nodiscard]] bool ok() const noexcept { return errors.empty(); }
};

// ─── Parsing ─────────────────────────────────────────────────────────────────

/// Parse a duration: "3600", "90s", "15m", "2h", "1d".
///
/// # Returns
/// Seconds, or `nullopt` for empty, negative, malformed or overflowing input.
[[nodiscard]] std::optional<std::int64_t> parse_duration(std::string_view text) noexcept;

/// Parse "true/false/yes/no/on/off/1/0" (case-insensitive).
[[nodiscard]] std::optional<bool> parse_bool(std::string_view text) noexcept;

/// Apply one `key = value` option to `config`.
///
/// # Returns
/// Empty string on success, otherwise a description of the problem.
[[nodiscard]] std::string
apply_option(PipelineConfig& config, std::string_view key, std::string_view value);

/// Parse config-file text on top of `base`.
[[nodiscard]] ConfigLoadResult
parse_config_string(std::string_view content, PipelineConfig base = PipelineConfig{});

/// Read and parse a config file on top of `base`.
///
/// # Returns
/// `nullopt` if the file cannot be opened.
[[nodiscard]] std::optional<ConfigLoadResult>
load_config_file(const std::string& path, PipelineConfig base = PipelineConfig{});

// ─── Validation ──────────────────────────────────────────────────────────────

/// Problems that make `config` unusable. Empty when valid.
[[nodiscard]] std::vector<std::string> validate(const PipelineConfig& config);

/// Multi-line `key = value` rendering, loadable by parse_config_string.
[[nodiscard]] std::string to_string(const PipelineConfig& config);

}  // namespace ridership::core
