#pragma once

/// @file include/ridership/types.hpp
/// @brief Shared value types for the ridership metrics engine.
///
/// Every module includes this file. It defines the strong identifier types
/// for devices, stations, complexes and aggregation entities, and the record
/// types that flow between pipeline stages:
///
///   Reading → RateRecord → BucketedRate → AggregateRecord
///
/// All records are plain aggregates. Stages never mutate their inputs; each
/// one builds a fresh collection of the next record type.

#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace ridership {

/// UTC seconds since the Unix epoch.
using Timestamp = std::int64_t;

// ─── Strong Identifier Types ─────────────────────────────────────────────────

/// Surrogate id of one physical turnstile (control area, unit, subunit, station).
struct DeviceId {
    std::uint32_t value;

    auto operator<=>(const DeviceId&) const = default;
};

/// Surrogate id of a station (station name, line names).
struct StationId {
    std::uint32_t value;

    auto operator<=>(const StationId&) const = default;
};

/// Provider-assigned id of a station complex.
struct ComplexId {
    std::uint32_t value;

    auto operator<=>(const ComplexId&) const = default;
};

// ─── Grouping ────────────────────────────────────────────────────────────────

/// Entity level that device rates are aggregated to.
enum class GroupingKey {
    Station,  ///< One entity per StationId
    Complex,  ///< One entity per ComplexId; unmapped stations are dropped
};

/// Convert GroupingKey to its lowercase name ("station" / "complex").
[[nodiscard]] const char* to_string(GroupingKey key) noexcept;

/// Parse "station" / "complex" (case-insensitive).
[[nodiscard]] std::optional<GroupingKey>
parse_grouping_key(std::string_view text) noexcept;

/// A Station or a Complex, tagged with its kind.
///
/// Ordering is (kind, value), so a sorted container of EntityId keeps all
/// stations before all complexes and each kind in id order.
struct EntityId {
    GroupingKey   kind;
    std::uint32_t value;

    [[nodiscard]] static EntityId of(StationId s) noexcept {
        return EntityId{GroupingKey::Station, s.value};
    }
    [[nodiscard]] static EntityId of(ComplexId c) noexcept {
        return EntityId{GroupingKey::Complex, c.value};
    }

    auto operator<=>(const EntityId&) const = default;
};

// ─── Pipeline Records ────────────────────────────────────────────────────────

/// One cleaned counter reading, as delivered by the upstream cleaner.
struct Reading {
    DeviceId      device;
    StationId     station;
    Timestamp     timestamp;
    std::uint64_t net_increment;  ///< Count since the device's previous reading
};

/// Hourly rate for one valid interval between two consecutive readings.
struct RateRecord {
    DeviceId  device;
    StationId station;
    Timestamp timestamp;    ///< Timestamp of the later reading
    double    delta_hours;  ///< Interval length in hours (> 0)
    double    rate;         ///< net_increment / delta_hours
};

/// A rate record snapped onto the bucket grid.
struct BucketedRate {
    DeviceId  device;
    StationId station;
    Timestamp bucket;  ///< Grid boundary the record was snapped to
    double    rate;    ///< Sum of rates that landed in (device, bucket)
};

/// Traffic and density for one entity, either in one bucket or summarised
/// over the whole observed range.
struct AggregateRecord {
    EntityId                 entity;
    std::optional<Timestamp> bucket;        ///< nullopt for summary rows
    double                   total_traffic;  ///< Σ device rates (per hour)
    double                   density;        ///< total_traffic / device_count
    std::size_t              device_count;   ///< Density divisor for the entity
    std::size_t              coverage;       ///< Distinct entities in the bucket
    bool                     low_confidence; ///< coverage < min_coverage
    std::size_t              bucket_count;   ///< 1 for bucket rows
    Timestamp                first_bucket;
    Timestamp                last_bucket;

    [[nodiscard]] bool is_summary() const noexcept { return !bucket.has_value(); }
};

}  // namespace ridership
