#pragma once

/// @file include/ridership/aggregator.hpp
/// @brief Multi-Key Aggregator: device rates to station/complex traffic and density.
///
/// # Module: Multi-Key Aggregator
///
/// ## Responsibility
/// Reduce bucketed per-device rates to one AggregateRecord per
/// (entity, bucket), where the entity is a Station or a Complex:
///
///     total_traffic[e, b] = Σ rate over devices of e in bucket b
///     device_count[e]     = distinct devices of e over the whole run
///     density[e, b]       = total_traffic[e, b] / device_count[e]
///
/// This is the reduce step of the pipeline: device_count is only known once
/// every device shard has been merged, so density is computed last.
///
/// ## Policies
/// - device_count == 0 → entity excluded (InsufficientData), never density 0
/// - Complex grouping: a station in several complexes contributes to each;
///   a station in none is dropped and counted (UnmappedEntity)
/// - Each record carries the coverage of its bucket (distinct entities seen
///   in that bucket); coverage < min_coverage sets `low_confidence`
///
/// ## Summary Mode
/// `summarize` collapses every bucket of an entity into one row with summed
/// traffic and density, so the whole-period view equals the sum of the
/// per-bucket view.

#include "ridership/diagnostics.hpp"
#include "ridership/topology.hpp"
#include "ridership/types.hpp"

#include <cstddef>
#include <map>
#include <set>
#include <span>
#include <vector>

namespace ridership::aggregate {

/// Where the density divisor comes from.
enum class DeviceCountSource {
    Observed,  ///< Distinct devices seen in the run's readings
    Topology,  ///< NetworkTopology::declared_device_count (summed per complex)
};

[[nodiscard]] const char* to_string(DeviceCountSource source) noexcept;

/// Devices observed per station over a whole run.
using ObservedDevices = std::map<StationId, std::set<DeviceId>>;

struct AggregationConfig {
    GroupingKey       grouping            = GroupingKey::Station;
    std::size_t       min_coverage        = 0;
    DeviceCountSource device_count_source = DeviceCountSource::Observed;
};

/// Output of one aggregation pass.
struct AggregateTable {
    GroupingKey                       grouping = GroupingKey::Station;
    std::vector<AggregateRecord>      records;        ///< Ordered by (entity, bucket)
    std::map<Timestamp, std::size_t>  coverage;       ///< bucket → distinct entities
    std::map<EntityId, std::size_t>   device_counts;  ///< Included entities only
    std::size_t                       unmapped_rows{0};
    std::size_t                       excluded_entities{0};

    /// Number of records flagged low-confidence.
    [[nodiscard]] std::size_t low_confidence_count() const noexcept;
};

class MultiKeyAggregator {
public:
    explicit MultiKeyAggregator(AggregationConfig config = AggregationConfig{}) noexcept;

    /// Aggregate bucketed device rates to the configured grouping key.
    ///
    /// `observed` is the device census of the run (see `observed_devices`)
    /// and is the density divisor under `DeviceCountSource::Observed`. It does
    /// not depend on which intervals survived normalisation, so devices that
    /// never produced a rate still count.
    ///
    /// `topology` supplies station → complex membership and, for
    /// `DeviceCountSource::Topology`, the declared device counts.
    [[nodiscard]] AggregateTable
    aggregate(std::span<const BucketedRate> rates,
              const ObservedDevices& observed,
              const NetworkTopology& topology,
              DiagnosticLog& log) const;

    /// As above, with the device census taken from `rates` themselves.
    [[nodiscard]] AggregateTable
    aggregate(std::span<const BucketedRate> rates,
              const NetworkTopology& topology,
              DiagnosticLog& log) const;

    /// Distinct devices per station across every reading.
    [[nodiscard]] static ObservedDevices
    observed_devices(std::span<const Reading> readings);

    /// Distinct devices per station across every bucketed rate.
    [[nodiscard]] static ObservedDevices
    observed_devices(std::span<const BucketedRate> rates);

    /// Collapse all records of each entity into one summary row.
    ///
    /// Traffic and density are summed; `bucket_count`, `first_bucket` and
    /// `last_bucket` describe the range. `coverage` of every summary row is
    /// the number of entities in the summary. Output is ordered by entity.
    [[nodiscard]] static std::vector<AggregateRecord>
    summarize(std::span<const AggregateRecord> records);

    /// Copy of `records` without low-confidence rows.
    [[nodiscard]] static std::vector<AggregateRecord>
    exclude_low_confidence(std::span<const AggregateRecord> records);

    [[nodiscard]] const AggregationConfig& config() const noexcept;

private:
    /// Entities a station's devices contribute to under the configured key.
    [[nodiscard]] std::vector<EntityId>
    entities_for(StationId station, const NetworkTopology& topology) const;

    /// Density divisor for `entity` under the configured source.
    [[nodiscard]] std::size_t
    divisor_for(EntityId entity,
                std::size_t observed,
                const NetworkTopology& topology) const;

    AggregationConfig config_;
};

}  // namespace ridership::aggregate
