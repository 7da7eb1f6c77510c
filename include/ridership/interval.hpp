#pragma once

/// @file include/ridership/interval.hpp
/// @brief Interval Normalizer: per-device counts to hourly rates.
///
/// # Module: Interval Normalizer
///
/// ## Responsibility
/// Turn each device's sequence of cleaned readings into hourly rates, one per
/// interval between consecutive readings:
///
///     delta_hours = (t_i − t_{i−1}) / 3600
///     rate        = net_increment_i / delta_hours
///
/// ## Edge Cases
/// - First reading of a device: no predecessor, dropped silently
/// - Duplicate timestamp (delta = 0): interval dropped, MalformedReading
/// - Timestamp before its predecessor: reading dropped, MalformedReading; it
///   does not become the predecessor of the next reading
/// - Timestamp outside [MIN_TIMESTAMP, MAX_TIMESTAMP]: reading dropped,
///   MalformedReading
/// - Long gaps (outages) pass through unchanged: the rate is the true average
///   over the gap, no interpolation
/// - Zero rates are kept unless `drop_zero_rates` is set
/// - A device with no valid interval contributes nothing (InsufficientData)
///
/// ## Guarantees
/// - Output rates are finite and ≥ 0
/// - Devices never share state, so devices can be normalised independently

#include "ridership/diagnostics.hpp"
#include "ridership/types.hpp"

#include <optional>
#include <span>
#include <vector>

namespace ridership::interval {

struct IntervalConfig {
    /// Exclude intervals whose rate is exactly 0.
    bool drop_zero_rates = false;
};

class IntervalNormalizer {
public:
    explicit IntervalNormalizer(IntervalConfig config = IntervalConfig{}) noexcept;

    /// Normalise the readings of a single device, in the order given.
    ///
    /// Precondition: every reading belongs to the same device.
    [[nodiscard]] std::vector<RateRecord>
    normalize_device(std::span<const Reading> readings, DiagnosticLog& log) const;

    /// Normalise readings from any number of devices.
    ///
    /// Readings are grouped by device and each group is stable-sorted by
    /// timestamp before `normalize_device`. Output is ordered by device, then
    /// timestamp.
    [[nodiscard]] std::vector<RateRecord>
    normalize(std::span<const Reading> readings, DiagnosticLog& log) const;

    /// Interval length in hours, or `nullopt` unless `to > from`.
    [[nodiscard]] static std::optional<double>
    delta_hours(Timestamp from, Timestamp to) noexcept;

    /// Hourly rate, or `nullopt` if `delta_hours` is not a positive finite value.
    [[nodiscard]] static std::optional<double>
    rate(std::uint64_t net_increment, double delta_hours) noexcept;

    [[nodiscard]] const IntervalConfig& config() const noexcept;

private:
    IntervalConfig config_;
};

}  // namespace ridership::interval
