#pragma once

/// @file include/ridership/share.hpp
/// @brief Traffic Share: how concentrated daily traffic is across entities.
///
/// # Module: Traffic Share
///
/// ## Responsibility
/// Answer "how many stations carry most of the riders?":
///   1. daily_totals:  Σ traffic over all entities per UTC day
///   2. daily_shares:  entity_day_traffic / day_total per (entity, day)
///   3. mean_shares:   average daily share per entity, largest first
///   4. cumulative_share_curve: fraction of traffic carried by the top N
///
/// Input is per-bucket AggregateRecords; summary rows are ignored. Days with
/// zero total traffic have no defined share and are skipped.

#include "ridership/types.hpp"

#include <cstddef>
#include <span>
#include <vector>

namespace ridership::share {

struct DailyTotal {
    Timestamp day;  ///< Midnight UTC
    double    total_traffic;
};

struct DailyShare {
    EntityId  entity;
    Timestamp day;
    double    entity_traffic;
    double    day_total;
    double    share;  ///< entity_traffic / day_total ∈ [0, 1]
};

struct EntityShare {
    EntityId    entity;
    double      mean_share;
    std::size_t days;  ///< Days the entity had traffic records
};

struct CumulativeSharePoint {
    std::size_t entities;          ///< Top-N count
    double      cumulative_share;  ///< ∈ [0, 1], non-decreasing in N
};

class TrafficShare {
public:
    /// Daily totals ordered by day.
    [[nodiscard]] static std::vector<DailyTotal>
    daily_totals(std::span<const AggregateRecord> records);

    /// Shares ordered by (day, entity).
    [[nodiscard]] static std::vector<DailyShare>
    daily_shares(std::span<const AggregateRecord> records);

    /// Mean share per entity across the days it appears in, ordered by
    /// mean share descending, then entity.
    [[nodiscard]] static std::vector<EntityShare>
    mean_shares(std::span<const DailyShare> shares);

    /// Running fraction of Σ mean_share carried by the first N entries of
    /// `ranked` (expected in mean_shares order). The last point is 1.0
    /// whenever any share is positive.
    [[nodiscard]] static std::vector<CumulativeSharePoint>
    cumulative_share_curve(std::span<const EntityShare> ranked);
};

}  // namespace ridership::share
