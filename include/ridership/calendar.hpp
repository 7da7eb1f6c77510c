#pragma once

/// @file include/ridership/calendar.hpp
/// @brief UTC calendar helpers for epoch-second timestamps.
///
/// Turnstile readings carry second-precision UTC timestamps. These helpers
/// convert between epoch seconds and civil date/time, floor to calendar
/// days, and render the `YYYY-MM-DD HH:MM:SS` form used in exported tables.
///
/// Built on the C++20 `<chrono>` calendar types; no time-zone database is
/// consulted because everything is UTC.

#include "ridership/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace ridership::calendar {

/// Broken-down UTC date and time.
struct CivilDateTime {
    int      year;
    unsigned month;   ///< 1..12
    unsigned day;     ///< 1..31
    unsigned hour;    ///< 0..23
    unsigned minute;  ///< 0..59
    unsigned second;  ///< 0..59

    auto operator<=>(const CivilDateTime&) const = default;
};

/// Floor division that rounds toward negative infinity.
/// Precondition: `divisor > 0`.
[[nodiscard]] constexpr std::int64_t
floor_div(std::int64_t value, std::int64_t divisor) noexcept {
    const std::int64_t q = value / divisor;
    return (value % divisor != 0 && value < 0) ? q - 1 : q;
}

/// Convert epoch seconds to civil UTC date/time.
[[nodiscard]] CivilDateTime to_civil(Timestamp t) noexcept;

/// Convert civil UTC date/time to epoch seconds.
///
/// # Returns
/// `nullopt` if the date does not exist (e.g. Feb 30) or any time field is
/// out of range.
[[nodiscard]] std::optional<Timestamp> from_civil(const CivilDateTime& c) noexcept;

/// Start of the UTC day containing `t`.
[[nodiscard]] Timestamp floor_to_day(Timestamp t) noexcept;

/// English weekday name ("Monday" ... "Sunday") of the UTC day containing `t`.
[[nodiscard]] const char* weekday_name(Timestamp t) noexcept;

/// True if `t` lies within [MIN_TIMESTAMP, MAX_TIMESTAMP], the years 0 to 9999.
[[nodiscard]] bool in_range(Timestamp t) noexcept;

/// Render `t` as `YYYY-MM-DD HH:MM:SS`.
[[nodiscard]] std::string format_timestamp(Timestamp t);

/// Parse a timestamp.
///
/// Accepted forms:
///   - integer epoch seconds, optionally signed (`1593216000`), within
///     [MIN_TIMESTAMP, MAX_TIMESTAMP]
///   - `YYYY-MM-DD HH:MM:SS` or `YYYY-MM-DDTHH:MM:SS`
///   - `YYYY-MM-DD` (midnight)
///
/// Leading and trailing whitespace is ignored.
[[nodiscard]] std::optional<Timestamp> parse_timestamp(std::string_view text) noexcept;

}  // namespace ridership::calendar
