#pragma once

// Cardline - Algorithm Utilities
// Small, header-only helpers for date parsing and rectangle geometry.
// Pure C++ with no framework dependencies.
//
// Public API (cardline):
//   - parse_date_ms, parse_time_of_day_ms, event_timestamp_ms
//   - format_date
//   - rects_overlap
//
// Internal API (cardline::detail):
//   - Fixed-width digit parsing
//
// Calendar arithmetic uses the proleptic Gregorian calendar of <chrono>.

#include "constants.h"
#include "types.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>

#include <glm/vec2.hpp>

namespace cardline {

// =============================================================================
// Internal API
// =============================================================================

namespace detail {

inline bool parse_digits(std::string_view s, std::size_t pos, std::size_t count, int& out)
{
    if (pos + count > s.size()) {
        return false;
    }
    int value = 0;
    for (std::size_t i = pos; i < pos + count; ++i) {
        const char c = s[i];
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

// Suffixes allowed after a time of day inside an ISO timestamp
// (fractional seconds, 'Z', or an offset, all ignored).
inline bool is_time_suffix(std::string_view rest)
{
    if (rest.empty()) {
        return true;
    }
    const char c = rest.front();
    return c == '.' || c == 'Z' || c == 'z' || c == '+' || c == '-';
}

} // namespace detail

// =============================================================================
// Public API
// =============================================================================

// Parses "HH:MM" or "HH:MM:SS" into milliseconds since midnight.
inline std::optional<int64_t> parse_time_of_day_ms(std::string_view s, bool allow_suffix = false)
{
    int hh = 0;
    int mm = 0;
    int ss = 0;
    if (!detail::parse_digits(s, 0, 2, hh) || s.size() < 5 || s[2] != ':' ||
        !detail::parse_digits(s, 3, 2, mm))
    {
        return std::nullopt;
    }

    std::size_t consumed = 5;
    if (s.size() >= 8 && s[5] == ':') {
        if (!detail::parse_digits(s, 6, 2, ss)) {
            return std::nullopt;
        }
        consumed = 8;
    }

    const std::string_view rest = s.substr(consumed);
    if (allow_suffix ? !detail::is_time_suffix(rest) : !rest.empty()) {
        return std::nullopt;
    }
    if (hh > 23 || mm > 59 || ss > 59) {
        return std::nullopt;
    }

    return hh * constants::k_ms_per_hour + mm * constants::k_ms_per_minute + ss * constants::k_ms_per_second;
}

// Parses "YYYY-MM-DD" (optionally followed by 'T' or ' ' and a time of day)
// into milliseconds since the epoch, UTC.
inline std::optional<int64_t> parse_date_ms(std::string_view s)
{
    int y = 0;
    int m = 0;
    int d = 0;
    if (s.size() < 10 || s[4] != '-' || s[7] != '-' ||
        !detail::parse_digits(s, 0, 4, y) ||
        !detail::parse_digits(s, 5, 2, m) ||
        !detail::parse_digits(s, 8, 2, d))
    {
        return std::nullopt;
    }
    const std::chrono::year_month_day ymd{
        std::chrono::year{y}, std::chrono::month{static_cast<unsigned>(m)}, std::chrono::day{static_cast<unsigned>(d)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }

    const std::chrono::sys_days days{ymd};
    int64_t ms = std::chrono::duration_cast<std::chrono::milliseconds>(days.time_since_epoch()).count();
    if (s.size() == 10) {
        return ms;
    }

    if (s[10] != 'T' && s[10] != 't' && s[10] != ' ') {
        return std::nullopt;
    }
    const auto tod = parse_time_of_day_ms(s.substr(11), true);
    if (!tod) {
        return std::nullopt;
    }
    return ms + *tod;
}

// Timestamp of an event: its date combined with the optional time of day.
// A time of day that does not parse falls back to the date alone.
inline std::optional<int64_t> event_timestamp_ms(const event_t& event)
{
    const auto date_ms = parse_date_ms(event.date);
    if (!date_ms) {
        return std::nullopt;
    }
    if (!event.time || event.time->empty()) {
        return date_ms;
    }

    const auto tod = parse_time_of_day_ms(*event.time);
    if (!tod) {
        return date_ms;
    }
    const auto midnight = std::chrono::floor<std::chrono::days>(
        std::chrono::sys_time<std::chrono::milliseconds>{std::chrono::milliseconds{*date_ms}});
    return std::chrono::duration_cast<std::chrono::milliseconds>(midnight.time_since_epoch()).count() + *tod;
}

// "YYYY-MM-DD" for a timestamp, UTC.
inline std::string format_date(int64_t timestamp_ms)
{
    const std::chrono::year_month_day ymd{std::chrono::floor<std::chrono::days>(
        std::chrono::sys_time<std::chrono::milliseconds>{std::chrono::milliseconds{timestamp_ms}})};

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u",
        static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
    return buf;
}

// Axis-aligned rectangles given as top-left + size. Shared edges do not count.
inline bool rects_overlap(const glm::dvec2& pos_a, const glm::dvec2& size_a,
                          const glm::dvec2& pos_b, const glm::dvec2& size_b)
{
    const glm::dvec2 max_a = pos_a + size_a;
    const glm::dvec2 max_b = pos_b + size_b;
    return pos_a.x < max_b.x - constants::k_eps && pos_b.x < max_a.x - constants::k_eps &&
           pos_a.y < max_b.y - constants::k_eps && pos_b.y < max_a.y - constants::k_eps;
}

inline bool rects_overlap(const positioned_card_t& a, const positioned_card_t& b)
{
    return rects_overlap(a.position, a.size, b.position, b.size);
}

} // namespace cardline
