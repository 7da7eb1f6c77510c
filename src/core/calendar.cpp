/// @file src/core/calendar.cpp
/// @brief UTC calendar helpers on top of the C++20 chrono calendar types.

#include "ridership/calendar.hpp"
#include "ridership/constants.hpp"

#include <fmt/format.h>

#include <array>
#include <charconv>
#include <chrono>

namespace ridership::calendar {

namespace {

using constants::SECONDS_PER_DAY;

/// Trim spaces, tabs and line endings from both ends.
std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

/// Parse an unsigned decimal field that must consume all of `s`.
std::optional<unsigned> parse_field(std::string_view s) noexcept {
    if (s.empty()) {
        return std::nullopt;
    }
    unsigned value = 0;
    const auto* end = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(s.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

// ─── to_civil / from_civil ───────────────────────────────────────────────────

CivilDateTime to_civil(Timestamp t) noexcept {
    const std::int64_t days = floor_div(t, SECONDS_PER_DAY);
    const std::int64_t secs = t - days * SECONDS_PER_DAY;

    const std::chrono::sys_days day_point{std::chrono::days{days}};
    const std::chrono::year_month_day ymd{day_point};

    return CivilDateTime{
        .year   = static_cast<int>(ymd.year()),
        .month  = static_cast<unsigned>(ymd.month()),
        .day    = static_cast<unsigned>(ymd.day()),
        .hour   = static_cast<unsigned>(secs / 3600),
        .minute = static_cast<unsigned>((secs % 3600) / 60),
        .second = static_cast<unsigned>(secs % 60),
    };
}

std::optional<Timestamp> from_civil(const CivilDateTime& c) noexcept {
    const std::chrono::year_month_day ymd{
        std::chrono::year{c.year},
        std::chrono::month{c.month},
        std::chrono::day{c.day}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    if (c.hour > 23 || c.minute > 59 || c.second > 59) {
        return std::nullopt;
    }

    const std::int64_t days =
        std::chrono::sys_days{ymd}.time_since_epoch().count();
    return days * SECONDS_PER_DAY
         + static_cast<std::int64_t>(c.hour) * 3600
         + static_cast<std::int64_t>(c.minute) * 60
         + static_cast<std::int64_t>(c.second);
}

bool in_range(Timestamp t) noexcept {
    return t >= constants::MIN_TIMESTAMP && t <= constants::MAX_TIMESTAMP;
}

// ─── Day helpers ─────────────────────────────────────────────────────────────

Timestamp floor_to_day(Timestamp t) noexcept {
    return floor_div(t, SECONDS_PER_DAY) * SECONDS_PER_DAY;
}

const char* weekday_name(Timestamp t) noexcept {
    static constexpr std::array<const char*, 7> NAMES = {
        "Sunday", "Monday", "Tuesday", "Wednesday",
        "Thursday", "Friday", "Saturday",
    };
    const std::chrono::sys_days day_point{
        std::chrono::days{floor_div(t, SECONDS_PER_DAY)}};
    const std::chrono::weekday wd{day_point};
    return NAMES[wd.c_encoding()];
}

// ─── Formatting / parsing ────────────────────────────────────────────────────

std::string format_timestamp(Timestamp t) {
    const auto c = to_civil(t);
    return fmt::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}",
                       c.year, c.month, c.day, c.hour, c.minute, c.second);
}

std::optional<Timestamp> parse_timestamp(std::string_view text) noexcept {
    const std::string_view s = trim(text);
    if (s.empty()) {
        return std::nullopt;
    }

    // Epoch seconds.
    if (s.find('-', 1) == std::string_view::npos) {
        Timestamp value = 0;
        const auto* end = s.data() + s.size();
        const auto [ptr, ec] = std::from_chars(s.data(), end, value);
        if (ec != std::errc{} || ptr != end) {
            return std::nullopt;
        }
        if (!in_range(value)) {
            return std::nullopt;
        }
        return value;
    }

    // YYYY-MM-DD[( |T)HH:MM:SS]
    if (s.size() != 10 && s.size() != 19) {
        return std::nullopt;
    }
    if (s[4] != '-' || s[7] != '-') {
        return std::nullopt;
    }

    const auto year  = parse_field(s.substr(0, 4));
    const auto month = parse_field(s.substr(5, 2));
    const auto day   = parse_field(s.substr(8, 2));
    if (!year || !month || !day) {
        return std::nullopt;
    }

    CivilDateTime c{
        .year   = static_cast<int>(*year),
        .month  = *month,
        .day    = *day,
        .hour   = 0,
        .minute = 0,
        .second = 0,
    };

    if (s.size() == 19) {
        if ((s[10] != ' ' && s[10] != 'T') || s[13] != ':' || s[16] != ':') {
            return std::nullopt;
        }
        const auto hour   = parse_field(s.substr(11, 2));
        const auto minute = parse_field(s.substr(14, 2));
        const auto second = parse_field(s.substr(17, 2));
        if (!hour || !minute || !second) {
            return std::nullopt;
        }
        c.hour   = *hour;
        c.minute = *minute;
        c.second = *second;
    }

    return from_civil(c);
}

}  // namespace ridership::calendar
