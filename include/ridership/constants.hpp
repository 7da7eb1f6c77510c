#pragma once

#include <cstddef>
#include <cstdint>

/// @file include/ridership/constants.hpp
/// @brief Time, configuration and numerical constants for the ridership engine.

namespace ridership::constants {

// ─── Time ────────────────────────────────────────────────────────────────────

/// Rates are reported per hour.
static constexpr double SECONDS_PER_HOUR = 3600.0;

static constexpr std::int64_t SECONDS_PER_MINUTE = 60;
static constexpr std::int64_t SECONDS_PER_DAY    = 86400;

/// Supported timestamp range: 0000-01-01 00:00:00 to 9999-12-31 23:59:59 UTC.
static constexpr std::int64_t MIN_TIMESTAMP = -62167219200;
static constexpr std::int64_t MAX_TIMESTAMP = 253402300799;

// ─── Configuration Defaults ──────────────────────────────────────────────────

/// Default bucket resolution: one hour.
static constexpr std::int64_t DEFAULT_BUCKET_RESOLUTION = 3600;

/// Buckets seen by fewer entities than this are flagged low-confidence.
/// Zero disables the flag.
static constexpr std::size_t DEFAULT_MIN_COVERAGE = 0;

/// Additive offsets applied to the component scores before multiplication.
/// Zero gives the pure multiplicative priority.
static constexpr double DEFAULT_TRAFFIC_WEIGHT = 0.0;
static constexpr double DEFAULT_DENSITY_WEIGHT = 0.0;

// ─── Numerical Tolerances ────────────────────────────────────────────────────

/// A scoring batch whose raw priority spread (max − min) is at or below this
/// value cannot be min-max normalised.
static constexpr double DEGENERATE_SPREAD_EPSILON = 1e-12;

// ─── Reporting ───────────────────────────────────────────────────────────────

/// Number of entries per error kind rendered by DiagnosticLog::to_string.
static constexpr std::size_t DIAGNOSTIC_PREVIEW_LIMIT = 5;

}  // namespace ridership::constants
