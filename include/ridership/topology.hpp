#pragma once

/// @file include/ridership/topology.hpp
/// @brief Static device → station → complex mapping for one run.
///
/// # Module: Network Topology
///
/// ## Responsibility
/// Collapse composite provider keys into dense surrogate ids and answer the
/// membership questions the aggregator asks:
///   - which station a device belongs to (exactly one)
///   - which complexes a station belongs to (zero or more)
///   - how many devices a station declares (density divisor when the run is
///     configured to use declared rather than observed counts)
///
/// ## Id Assignment
/// Ids are assigned in first-registration order starting at 0, so the same
/// input file always yields the same ids. Registering a known key returns the
/// existing id.
///
/// ## Guarantees
/// - Lookups on unknown ids return `nullopt` / empty spans, never throw
/// - Read-only after construction from the caller's perspective: the
///   pipeline only takes `const NetworkTopology&`

#include "ridership/types.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ridership {

// ─── Composite Keys ──────────────────────────────────────────────────────────

/// Provider identity of one turnstile.
struct DeviceKey {
    std::string control_area;
    std::string unit;
    std::string subunit;
    std::string station;

    auto operator<=>(const DeviceKey&) const = default;
};

/// Provider identity of one station. `line_names` is stored canonicalised.
struct StationKey {
    std::string name;
    std::string line_names;

    auto operator<=>(const StationKey&) const = default;
};

/// Canonical form of a line-name string: whitespace removed, characters
/// sorted, so "NQRW" and "RWNQ" name the same station.
[[nodiscard]] std::string canonical_line_names(std::string_view lines);

// ─── NetworkTopology ─────────────────────────────────────────────────────────

class NetworkTopology {
public:
    /// Register (or look up) a station. `key.line_names` is canonicalised.
    StationId register_station(StationKey key);

    /// Register (or look up) a device belonging to `station`.
    ///
    /// A device keeps the station it was first registered with.
    DeviceId register_device(const DeviceKey& key, StationId station);

    /// Add `complex` to the complexes of `station`. Idempotent.
    ///
    /// # Returns
    /// `false` if `station` is not registered.
    bool assign_complex(StationId station, ComplexId complex);

    /// Override the device count used as density divisor for `station`.
    ///
    /// # Returns
    /// `false` if `station` is not registered.
    bool set_declared_device_count(StationId station, std::size_t count);

    [[nodiscard]] std::optional<StationId> find_station(const StationKey& key) const;
    [[nodiscard]] std::optional<DeviceId>  find_device(const DeviceKey& key) const;

    [[nodiscard]] std::optional<StationId> station_of(DeviceId device) const noexcept;

    /// Complexes containing `station`, ascending. Empty for unmapped or
    /// unknown stations.
    [[nodiscard]] std::span<const ComplexId> complexes_of(StationId station) const noexcept;

    /// Stations belonging to `complex`, ascending.
    [[nodiscard]] std::vector<StationId> stations_in(ComplexId complex) const;

    /// Declared device count: the explicit override if one was set, else the
    /// number of devices registered to the station. 0 for unknown stations.
    [[nodiscard]] std::size_t declared_device_count(StationId station) const noexcept;

    [[nodiscard]] std::size_t device_count() const noexcept;
    [[nodiscard]] std::size_t station_count() const noexcept;

    [[nodiscard]] std::string station_label(StationId station) const;
    [[nodiscard]] std::string device_label(DeviceId device) const;

    /// "NAME LINES" for stations, "complex N" for complexes.
    [[nodiscard]] std::string entity_label(EntityId entity) const;

private:
    struct StationEntry {
        StationKey                 key;
        std::vector<ComplexId>     complexes;
        std::size_t                registered_devices{0};
        std::optional<std::size_t> declared_devices;
    };

    struct DeviceEntry {
        DeviceKey key;
        StationId station;
    };

    [[nodiscard]] const StationEntry* station_entry(StationId station) const noexcept;

    std::map<StationKey, StationId> station_index_;
    std::vector<StationEntry>       stations_;
    std::map<DeviceKey, DeviceId>   device_index_;
    std::vector<DeviceEntry>        devices_;
};

}  // namespace ridership
