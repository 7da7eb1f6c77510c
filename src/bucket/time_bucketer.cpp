/// @file src/bucket/time_bucketer.cpp
/// @brief TimeBucketer: round-half-up snapping to a fixed grid.

#include "ridership/bucketer.hpp"

#include <map>
#include <utility>

namespace ridership::bucket {

TimeBucketer::TimeBucketer(std::int64_t resolution_seconds) noexcept
    : resolution_(resolution_seconds) {}

std::optional<TimeBucketer> TimeBucketer::make(std::int64_t resolution_seconds) noexcept {
    if (resolution_seconds <= 0) {
        return std::nullopt;
    }
    return TimeBucketer(resolution_seconds);
}

std::int64_t TimeBucketer::resolution() const noexcept {
    return resolution_;
}

// ─── snap ────────────────────────────────────────────────────────────────────

Timestamp TimeBucketer::snap(Timestamp t) const noexcept {
    // floor((t + res/2) / res) * res, split into quotient and remainder so
    // t + res/2 is never formed.
    std::int64_t q = t / resolution_;
    std::int64_t r = t % resolution_;
    if (r < 0) {
        r += resolution_;
        --q;
    }
    if (r >= resolution_ - resolution_ / 2) {
        ++q;
    }
    return q * resolution_;
}

// ─── bucket ──────────────────────────────────────────────────────────────────

std::vector<BucketedRate>
TimeBucketer::bucket(std::span<const RateRecord> records) const {
    std::map<std::pair<DeviceId, Timestamp>, BucketedRate> merged;

    for (const auto& r : records) {
        const Timestamp b = snap(r.timestamp);
        auto it = merged.try_emplace(
            std::pair{r.device, b},
            BucketedRate{.device = r.device, .station = r.station, .bucket = b, .rate = 0.0})
            .first;
        it->second.rate += r.rate;
    }

    std::vector<BucketedRate> out;
    out.reserve(merged.size());
    for (const auto& [key, rec] : merged) {
        out.push_back(rec);
    }
    return out;
}

}  // namespace ridership::bucket
