/// @file src/topology/topology.cpp
/// @brief NetworkTopology: surrogate id registry and membership lookups.

#include "ridership/topology.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <utility>

namespace ridership {

// ─── canonical_line_names ────────────────────────────────────────────────────

std::string canonical_line_names(std::string_view lines) {
    std::string out;
    out.reserve(lines.size());
    for (const char ch : lines) {
        if (!std::isspace(static_cast<unsigned char>(ch))) {
            out.push_back(ch);
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

// ─── Registration ────────────────────────────────────────────────────────────

StationId NetworkTopology::register_station(StationKey key) {
    key.line_names = canonical_line_names(key.line_names);

    const auto it = station_index_.find(key);
    if (it != station_index_.end()) {
        return it->second;
    }

    const StationId id{static_cast<std::uint32_t>(stations_.size())};
    station_index_.emplace(key, id);
    stations_.push_back(StationEntry{.key = std::move(key)});
    return id;
}

DeviceId NetworkTopology::register_device(const DeviceKey& key, StationId station) {
    const auto it = device_index_.find(key);
    if (it != device_index_.end()) {
        return it->second;
    }

    const DeviceId id{static_cast<std::uint32_t>(devices_.size())};
    device_index_.emplace(key, id);
    devices_.push_back(DeviceEntry{.key = key, .station = station});

    if (station.value < stations_.size()) {
        ++stations_[station.value].registered_devices;
    }
    return id;
}

bool NetworkTopology::assign_complex(StationId station, ComplexId complex) {
    if (station.value >= stations_.size()) {
        return false;
    }
    auto& complexes = stations_[station.value].complexes;
    const auto pos = std::lower_bound(complexes.begin(), complexes.end(), complex);
    if (pos == complexes.end() || *pos != complex) {
        complexes.insert(pos, complex);
    }
    return true;
}

bool NetworkTopology::set_declared_device_count(StationId station, std::size_t count) {
    if (station.value >= stations_.size()) {
        return false;
    }
    stations_[station.value].declared_devices = count;
    return true;
}

// ─── Lookups ─────────────────────────────────────────────────────────────────

const NetworkTopology::StationEntry*
NetworkTopology::station_entry(StationId station) const noexcept {
    if (station.value >= stations_.size()) {
        return nullptr;
    }
    return &stations_[station.value];
}

std::optional<StationId> NetworkTopology::find_station(const StationKey& key) const {
    StationKey canonical{key.name, canonical_line_names(key.line_names)};
    const auto it = station_index_.find(canonical);
    if (it == station_index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<DeviceId> NetworkTopology::find_device(const DeviceKey& key) const {
    const auto it = device_index_.find(key);
    if (it == device_index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<StationId> NetworkTopology::station_of(DeviceId device) const noexcept {
    if (device.value >= devices_.size()) {
        return std::nullopt;
    }
    return devices_[device.value].station;
}

std::span<const ComplexId> NetworkTopology::complexes_of(StationId station) const noexcept {
    const auto* entry = station_entry(station);
    if (entry == nullptr) {
        return {};
    }
    return entry->complexes;
}

std::vector<StationId> NetworkTopology::stations_in(ComplexId complex) const {
    std::vector<StationId> out;
    for (std::size_t i = 0; i < stations_.size(); ++i) {
        const auto& complexes = stations_[i].complexes;
        if (std::binary_search(complexes.begin(), complexes.end(), complex)) {
            out.push_back(StationId{static_cast<std::uint32_t>(i)});
        }
    }
    return out;
}

std::size_t NetworkTopology::declared_device_count(StationId station) const noexcept {
    const auto* entry = station_entry(station);
    if (entry == nullptr) {
        return 0;
    }
    return entry->declared_devices.value_or(entry->registered_devices);
}

std::size_t NetworkTopology::device_count() const noexcept {
    return devices_.size();
}

std::size_t NetworkTopology::station_count() const noexcept {
    return stations_.size();
}

// ─── Labels ──────────────────────────────────────────────────────────────────

std::string NetworkTopology::station_label(StationId station) const {
    const auto* entry = station_entry(station);
    if (entry == nullptr) {
        return fmt::format("station {}", station.value);
    }
    if (entry->key.line_names.empty()) {
        return entry->key.name;
    }
    return fmt::format("{} {}", entry->key.name, entry->key.line_names);
}

std::string NetworkTopology::device_label(DeviceId device) const {
    if (device.value >= devices_.size()) {
        return fmt::format("device {}", device.value);
    }
    const auto& k = devices_[device.value].key;
    return fmt::format("{}/{}/{}", k.control_area, k.unit, k.subunit);
}

std::string NetworkTopology::entity_label(EntityId entity) const {
    if (entity.kind == GroupingKey::Station) {
        return station_label(StationId{entity.value});
    }
    return fmt::format("complex {}", entity.value);
}

}  // namespace ridership
