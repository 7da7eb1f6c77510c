/// @file src/share/traffic_share.cpp
/// @brief TrafficShare: daily totals, per-entity shares and concentration curve.

#include "ridership/share.hpp"
#include "ridership/calendar.hpp"

#include <algorithm>
#include <map>
#include <utility>

namespace ridership::share {

// ─── daily_totals ────────────────────────────────────────────────────────────

std::vector<DailyTotal>
TrafficShare::daily_totals(std::span<const AggregateRecord> records) {
    std::map<Timestamp, double> totals;
    for (const auto& r : records) {
        if (r.is_summary()) continue;
        totals[calendar::floor_to_day(*r.bucket)] += r.total_traffic;
    }

    std::vector<DailyTotal> out;
    out.reserve(totals.size());
    for (const auto& [day, total] : totals) {
        out.push_back(DailyTotal{.day = day, .total_traffic = total});
    }
    return out;
}

// ─── daily_shares ────────────────────────────────────────────────────────────

std::vector<DailyShare>
TrafficShare::daily_shares(std::span<const AggregateRecord> records) {
    std::map<std::pair<Timestamp, EntityId>, double> per_entity;
    std::map<Timestamp, double>                      per_day;

    for (const auto& r : records) {
        if (r.is_summary()) continue;
        const Timestamp day = calendar::floor_to_day(*r.bucket);
        per_entity[{day, r.entity}] += r.total_traffic;
        per_day[day]                += r.total_traffic;
    }

    std::vector<DailyShare> out;
    out.reserve(per_entity.size());
    for (const auto& [key, traffic] : per_entity) {
        const double total = per_day[key.first];
        if (!(total > 0.0)) {
            continue;
        }
        out.push_back(DailyShare{
            .entity         = key.second,
            .day            = key.first,
            .entity_traffic = traffic,
            .day_total      = total,
            .share          = traffic / total,
        });
    }
    return out;
}

// ─── mean_shares ─────────────────────────────────────────────────────────────

std::vector<EntityShare>
TrafficShare::mean_shares(std::span<const DailyShare> shares) {
    std::map<EntityId, std::pair<double, std::size_t>> acc;
    for (const auto& s : shares) {
        auto& [sum, days] = acc[s.entity];
        sum  += s.share;
        days += 1;
    }

    std::vector<EntityShare> out;
    out.reserve(acc.size());
    for (const auto& [entity, a] : acc) {
        out.push_back(EntityShare{
            .entity     = entity,
            .mean_share = a.first / static_cast<double>(a.second),
            .days       = a.second,
        });
    }

    std::stable_sort(out.begin(), out.end(),
                     [](const EntityShare& a, const EntityShare& b) {
                         return a.mean_share > b.mean_share;
                     });
    return out;
}

// ─── cumulative_share_curve ──────────────────────────────────────────────────

std::vector<CumulativeSharePoint>
TrafficShare::cumulative_share_curve(std::span<const EntityShare> ranked) {
    double total = 0.0;
    for (const auto& e : ranked) {
        total += e.mean_share;
    }

    std::vector<CumulativeSharePoint> out;
    out.reserve(ranked.size());

    double running = 0.0;
    for (std::size_t i = 0; i < ranked.size(); ++i) {
        running += ranked[i].mean_share;
        const double frac = total > 0.0 ? std::min(running / total, 1.0) : 0.0;
        out.push_back(CumulativeSharePoint{.entities = i + 1, .cumulative_share = frac});
    }
    if (!out.empty() && total > 0.0) {
        out.back().cumulative_share = 1.0;
    }
    return out;
}

}  // namespace ridership::share
