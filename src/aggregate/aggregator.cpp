/// @file src/aggregate/aggregator.cpp
/// @brief MultiKeyAggregator: (entity, bucket) reduction, density and summaries.

#include "ridership/aggregator.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <set>
#include <utility>

namespace ridership::aggregate {

const char* to_string(DeviceCountSource source) noexcept {
    switch (source) {
        case DeviceCountSource::Observed: return "observed";
        case DeviceCountSource::Topology: return "topology";
    }
    return "unknown";
}

std::size_t AggregateTable::low_confidence_count() const noexcept {
    return static_cast<std::size_t>(std::count_if(
        records.begin(), records.end(),
        [](const AggregateRecord& r) { return r.low_confidence; }));
}

// ─── Constructor ─────────────────────────────────────────────────────────────

MultiKeyAggregator::MultiKeyAggregator(AggregationConfig config) noexcept
    : config_(config) {}

const AggregationConfig& MultiKeyAggregator::config() const noexcept {
    return config_;
}

// ─── entities_for / divisor_for ──────────────────────────────────────────────

std::vector<EntityId>
MultiKeyAggregator::entities_for(StationId station,
                                 const NetworkTopology& topology) const {
    if (config_.grouping == GroupingKey::Station) {
        return {EntityId::of(station)};
    }

    std::vector<EntityId> out;
    for (const ComplexId c : topology.complexes_of(station)) {
        out.push_back(EntityId::of(c));
    }
    return out;
}

std::size_t MultiKeyAggregator::divisor_for(EntityId entity,
                                            std::size_t observed,
                                            const NetworkTopology& topology) const {
    if (config_.device_count_source == DeviceCountSource::Observed) {
        return observed;
    }

    if (entity.kind == GroupingKey::Station) {
        return topology.declared_device_count(StationId{entity.value});
    }

    std::size_t total = 0;
    for (const StationId s : topology.stations_in(ComplexId{entity.value})) {
        total += topology.declared_device_count(s);
    }
    return total;
}

// ─── aggregate ───────────────────────────────────────────────────────────────

ObservedDevices
MultiKeyAggregator::observed_devices(std::span<const Reading> readings) {
    ObservedDevices out;
    for (const auto& r : readings) {
        out[r.station].insert(r.device);
    }
    return out;
}

ObservedDevices
MultiKeyAggregator::observed_devices(std::span<const BucketedRate> rates) {
    ObservedDevices out;
    for (const auto& r : rates) {
        out[r.station].insert(r.device);
    }
    return out;
}

AggregateTable
MultiKeyAggregator::aggregate(std::span<const BucketedRate> rates,
                              const NetworkTopology& topology,
                              DiagnosticLog& log) const {
    return aggregate(rates, observed_devices(rates), topology, log);
}

AggregateTable
MultiKeyAggregator::aggregate(std::span<const BucketedRate> rates,
                              const ObservedDevices& observed,
                              const NetworkTopology& topology,
                              DiagnosticLog& log) const {
    AggregateTable table;
    table.grouping = config_.grouping;

    // ── Step 1: route every device rate to its entities ──────────────────────
    std::map<std::pair<EntityId, Timestamp>, double> traffic;
    std::map<StationId, std::size_t>                  unmapped;

    for (const auto& r : rates) {
        const auto entities = entities_for(r.station, topology);
        if (entities.empty()) {
            ++unmapped[r.station];
            continue;
        }
        for (const EntityId e : entities) {
            traffic[{e, r.bucket}] += r.rate;
        }
    }

    // Device census per entity, independent of which intervals survived.
    std::map<EntityId, std::set<DeviceId>> devices;
    for (const auto& [station, seen] : observed) {
        for (const EntityId e : entities_for(station, topology)) {
            devices[e].insert(seen.begin(), seen.end());
        }
    }

    for (const auto& [station, rows] : unmapped) {
        table.unmapped_rows += rows;
        log.record(Diagnostic{
            .kind          = ErrorKind::UnmappedEntity,
            .message       = "station has no complex mapping",
            .entity        = EntityId::of(station),
            .affected_rows = rows,
        });
    }

    // ── Step 2: density divisors; exclude entities without one ───────────────
    std::set<EntityId> entities;
    for (const auto& [key, total] : traffic) {
        entities.insert(key.first);
    }
    for (const EntityId entity : entities) {
        const auto seen = devices.find(entity);
        const std::size_t observed_count = seen == devices.end() ? 0 : seen->second.size();
        const std::size_t divisor = divisor_for(entity, observed_count, topology);
        if (divisor == 0) {
            ++table.excluded_entities;
            log.record(Diagnostic{
                .kind    = ErrorKind::InsufficientData,
                .message = "device count is 0, density undefined; entity excluded",
                .entity  = entity,
            });
            continue;
        }
        table.device_counts.emplace(entity, divisor);
    }

    // ── Step 3: bucket coverage over included entities ───────────────────────
    for (const auto& [key, total] : traffic) {
        if (table.device_counts.contains(key.first)) {
            ++table.coverage[key.second];
        }
    }

    // ── Step 4: emit records in (entity, bucket) order ───────────────────────
    table.records.reserve(traffic.size());
    for (const auto& [key, total] : traffic) {
        const auto& [entity, bucket] = key;
        const auto dc = table.device_counts.find(entity);
        if (dc == table.device_counts.end()) {
            continue;
        }

        const std::size_t coverage = table.coverage[bucket];
        table.records.push_back(AggregateRecord{
            .entity         = entity,
            .bucket         = bucket,
            .total_traffic  = total,
            .density        = total / static_cast<double>(dc->second),
            .device_count   = dc->second,
            .coverage       = coverage,
            .low_confidence = coverage < config_.min_coverage,
            .bucket_count   = 1,
            .first_bucket   = bucket,
            .last_bucket    = bucket,
        });
    }

    if (table.records.empty()) {
        log.record(Diagnostic{
            .kind       = ErrorKind::InsufficientData,
            .message    = fmt::format("no {} aggregates produced",
                                      ridership::to_string(config_.grouping)),
            .batch_size = rates.size(),
        });
    }

    return table;
}

// ─── summarize ───────────────────────────────────────────────────────────────

std::vector<AggregateRecord>
MultiKeyAggregator::summarize(std::span<const AggregateRecord> records) {
    std::map<EntityId, AggregateRecord> by_entity;

    for (const auto& r : records) {
        const Timestamp first = r.bucket.value_or(r.first_bucket);
        const Timestamp last  = r.bucket.value_or(r.last_bucket);

        auto [it, inserted] = by_entity.try_emplace(r.entity, AggregateRecord{
            .entity         = r.entity,
            .bucket         = std::nullopt,
            .total_traffic  = 0.0,
            .density        = 0.0,
            .device_count   = r.device_count,
            .coverage       = 0,
            .low_confidence = false,
            .bucket_count   = 0,
            .first_bucket   = first,
            .last_bucket    = last,
        });

        auto& s = it->second;
        s.total_traffic += r.total_traffic;
        s.density       += r.density;
        s.bucket_count  += r.bucket_count;
        if (!inserted) {
            s.first_bucket = std::min(s.first_bucket, first);
            s.last_bucket  = std::max(s.last_bucket, last);
        }
    }

    std::vector<AggregateRecord> out;
    out.reserve(by_entity.size());
    for (auto& [entity, s] : by_entity) {
        s.coverage = by_entity.size();
        out.push_back(s);
    }
    return out;
}

// ─── exclude_low_confidence ──────────────────────────────────────────────────

std::vector<AggregateRecord>
MultiKeyAggregator::exclude_low_confidence(std::span<const AggregateRecord> records) {
    std::vector<AggregateRecord> out;
    out.reserve(records.size());
    std::copy_if(records.begin(), records.end(), std::back_inserter(out),
                 [](const AggregateRecord& r) { return !r.low_confidence; });
    return out;
}

}  // namespace ridership::aggregate
