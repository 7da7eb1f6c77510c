#pragma once

/// @file include/ridership/bucketer.hpp
/// @brief Time Bucketer: snaps rate records onto a uniform time grid.
///
/// # Module: Time Bucketer
///
/// ## Responsibility
/// Provider timestamps are not aligned across devices. Snapping each record
/// to the nearest grid boundary collapses thousands of distinct timestamps
/// into a small set of comparable buckets.
///
/// ## Formula
/// For resolution Δ seconds, round-half-up:
///
///     bucket(t) = ⌊(t + ⌊Δ/2⌋) / Δ⌋ · Δ
///
/// Floor division keeps the rule correct for timestamps before the epoch.
/// A bucket labelled b therefore covers original times [b − Δ/2, b + Δ/2).
///
/// Rates are hourly-normalised already, so snapping preserves them as-is.
/// Records of the same device landing in the same bucket are summed.

#include "ridership/types.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace ridership::bucket {

class TimeBucketer {
public:
    /// Construct a bucketer for `resolution_seconds`.
    ///
    /// # Returns
    /// `nullopt` if `resolution_seconds <= 0`.
    [[nodiscard]] static std::optional<TimeBucketer>
    make(std::int64_t resolution_seconds) noexcept;

    /// Snap one timestamp to its bucket boundary.
    ///
    /// Overflow-free for every `t` in [MIN_TIMESTAMP, MAX_TIMESTAMP] and every
    /// positive resolution.
    [[nodiscard]] Timestamp snap(Timestamp t) const noexcept;

    /// Snap every record and merge duplicates per (device, bucket).
    ///
    /// # Returns
    /// Records ordered by (device, bucket). The station of a merged record is
    /// the station of the first record that landed in it.
    [[nodiscard]] std::vector<BucketedRate>
    bucket(std::span<const RateRecord> records) const;

    [[nodiscard]] std::int64_t resolution() const noexcept;

private:
    explicit TimeBucketer(std::int64_t resolution_seconds) noexcept;

    std::int64_t resolution_;
};

}  // namespace ridership::bucket
