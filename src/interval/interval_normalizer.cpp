/// @file src/interval/interval_normalizer.cpp
/// @brief IntervalNormalizer: hourly rates from consecutive device readings.

#include "ridership/interval.hpp"
#include "ridership/calendar.hpp"
#include "ridership/constants.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>

namespace ridership::interval {

// ─── Constructor ─────────────────────────────────────────────────────────────

IntervalNormalizer::IntervalNormalizer(IntervalConfig config) noexcept
    : config_(config) {}

const IntervalConfig& IntervalNormalizer::config() const noexcept {
    return config_;
}

// ─── delta_hours / rate ──────────────────────────────────────────────────────

std::optional<double> IntervalNormalizer::delta_hours(Timestamp from, Timestamp to) noexcept {
    if (to <= from) {
        return std::nullopt;
    }
    // to - from overflows when the two lie far apart on opposite sides of 0.
    if (from < 0 && to > std::numeric_limits<Timestamp>::max() + from) {
        return std::nullopt;
    }
    return static_cast<double>(to - from) / constants::SECONDS_PER_HOUR;
}

std::optional<double> IntervalNormalizer::rate(std::uint64_t net_increment,
                                               double delta_hours) noexcept {
    if (!std::isfinite(delta_hours) || delta_hours <= 0.0) {
        return std::nullopt;
    }
    return static_cast<double>(net_increment) / delta_hours;
}

// ─── normalize_device ────────────────────────────────────────────────────────

std::vector<RateRecord>
IntervalNormalizer::normalize_device(std::span<const Reading> readings,
                                     DiagnosticLog& log) const {
    std::vector<RateRecord> out;
    if (readings.empty()) {
        return out;
    }

    const DeviceId device = readings.front().device;
    out.reserve(readings.size() - 1);

    // The anchor is the most recent reading accepted as in order.
    const Reading* anchor = nullptr;

    for (const Reading& curr : readings) {
        if (!calendar::in_range(curr.timestamp)) {
            log.record(Diagnostic{
                .kind          = ErrorKind::MalformedReading,
                .message       = fmt::format("timestamp {} outside the supported range, "
                                             "reading dropped", curr.timestamp),
                .device        = device,
                .entity        = EntityId::of(curr.station),
                .affected_rows = 1,
            });
            continue;
        }
        if (anchor == nullptr) {
            anchor = &curr;
            continue;
        }

        if (curr.timestamp == anchor->timestamp) {
            log.record(Diagnostic{
                .kind          = ErrorKind::MalformedReading,
                .message       = fmt::format("duplicate timestamp {}, interval dropped",
                                             curr.timestamp),
                .device        = device,
                .entity        = EntityId::of(curr.station),
                .affected_rows = 1,
            });
            continue;
        }
        if (curr.timestamp < anchor->timestamp) {
            log.record(Diagnostic{
                .kind          = ErrorKind::MalformedReading,
                .message       = fmt::format("timestamp {} precedes {}, reading dropped",
                                             curr.timestamp, anchor->timestamp),
                .device        = device,
                .entity        = EntityId::of(curr.station),
                .affected_rows = 1,
            });
            continue;
        }

        const auto dh = delta_hours(anchor->timestamp, curr.timestamp);
        anchor = &curr;
        if (!dh) {
            continue;
        }
        const auto r = rate(curr.net_increment, *dh);
        if (!r) {
            continue;
        }
        if (config_.drop_zero_rates && *r == 0.0) {
            continue;
        }

        out.push_back(RateRecord{
            .device      = device,
            .station     = curr.station,
            .timestamp   = curr.timestamp,
            .delta_hours = *dh,
            .rate        = *r,
        });
    }

    if (out.empty()) {
        log.record(Diagnostic{
            .kind       = ErrorKind::InsufficientData,
            .message    = fmt::format("no valid intervals from {} readings", readings.size()),
            .device     = device,
            .entity     = EntityId::of(readings.front().station),
            .batch_size = readings.size(),
        });
    }

    return out;
}

// ─── normalize ───────────────────────────────────────────────────────────────

std::vector<RateRecord>
IntervalNormalizer::normalize(std::span<const Reading> readings,
                              DiagnosticLog& log) const {
    std::map<DeviceId, std::vector<Reading>> by_device;
    for (const auto& r : readings) {
        by_device[r.device].push_back(r);
    }

    std::vector<RateRecord> out;
    out.reserve(readings.size());

    for (auto& [device, group] : by_device) {
        std::stable_sort(group.begin(), group.end(),
                         [](const Reading& a, const Reading& b) {
                             return a.timestamp < b.timestamp;
                         });
        auto rates = normalize_device(group, log);
        out.insert(out.end(), rates.begin(), rates.end());
    }

    return out;
}

}  // namespace ridership::interval
