#pragma once
// Cardline - Core Types
// Input events, card types and the geometry emitted by a layout pass.
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <glm/vec2.hpp>

namespace cardline {

// -----------------------------------------------------------------------------
// Size2d - Viewport dimensions in pixels
// -----------------------------------------------------------------------------
struct Size2d
{
    double width  = 0.0;
    double height = 0.0;

    constexpr Size2d() = default;
    constexpr Size2d(double w, double h) : width(w), height(h) {}
};

// -----------------------------------------------------------------------------
// event_t: Caller-owned input record
// -----------------------------------------------------------------------------
// `date` is "YYYY-MM-DD" (an ISO timestamp such as "2024-03-01T10:30:00Z" is
// accepted too). `time` is an optional "HH:MM" or "HH:MM:SS" time of day that
// overrides the time part of `date`. All times are interpreted as UTC.
struct event_t
{
    std::string                id;
    std::string                date;
    std::optional<std::string> time;
    std::string                title;
    std::optional<std::string> description;
    std::vector<std::string>   sources;
};

// Event with its parsed timestamp (milliseconds since the Unix epoch).
struct timed_event_t
{
    std::string id;
    int64_t     timestamp_ms = 0;
    std::size_t input_index  = 0;    ///< Position in the caller's event list
};

// -----------------------------------------------------------------------------
// Card types and sides
// -----------------------------------------------------------------------------

// Ordered from highest to lowest fidelity. The numeric order is the
// degradation order.
enum class Card_type
{
    FULL,
    COMPACT,
    TITLE_ONLY,
    MULTI_EVENT,
    INFINITE
};

constexpr std::size_t k_card_type_count = 5;

constexpr std::array<Card_type, k_card_type_count> k_degradation_order = {
    Card_type::FULL,
    Card_type::COMPACT,
    Card_type::TITLE_ONLY,
    Card_type::MULTI_EVENT,
    Card_type::INFINITE
};

[[nodiscard]] constexpr std::size_t card_type_index(Card_type type) noexcept
{
    return static_cast<std::size_t>(type);
}

// True for types that show a single event per card.
[[nodiscard]] constexpr bool is_individual(Card_type type) noexcept
{
    return type == Card_type::FULL || type == Card_type::COMPACT || type == Card_type::TITLE_ONLY;
}

[[nodiscard]] constexpr bool is_lower_fidelity(Card_type a, Card_type b) noexcept
{
    return card_type_index(a) > card_type_index(b);
}

inline const char* to_string(Card_type type)
{
    switch (type) {
        case Card_type::FULL:        return "full";
        case Card_type::COMPACT:     return "compact";
        case Card_type::TITLE_ONLY:  return "title-only";
        case Card_type::MULTI_EVENT: return "multi-event";
        case Card_type::INFINITE:    return "infinite";
    }
    return "unknown";
}

enum class Side
{
    ABOVE,
    BELOW
};

inline const char* to_string(Side side)
{
    return side == Side::ABOVE ? "above" : "below";
}

// -----------------------------------------------------------------------------
// Pipeline records
// -----------------------------------------------------------------------------

/// Event mapped onto the timeline
struct distributed_event_t
{
    std::string id;
    int64_t     timestamp_ms = 0;
    double      x            = 0.0;  ///< Horizontal position in pixels
    double      density      = 0.0;  ///< Events per day around this event
    std::size_t input_index  = 0;
};

/// Representative point of a cluster
struct anchor_t
{
    std::string              id;
    double                   x              = 0.0;  ///< Mean x of the members
    double                   y              = 0.0;  ///< Axis y
    int64_t                  timestamp_ms   = 0;    ///< Mean member timestamp
    std::vector<std::string> event_ids;
    std::size_t              event_count    = 0;
    std::size_t              visible_count  = 0;    ///< Events shown in individual cards
    std::size_t              overflow_count = 0;    ///< Events folded into summary cards
};

/// Events grouped around one anchor
struct cluster_t
{
    std::string                      id;
    anchor_t                         anchor;
    std::vector<distributed_event_t> events;    ///< Chronological
    std::vector<std::string>         card_ids;  ///< Cards holding any member event
};

/// Discrete placement unit above or below the axis
struct slot_t
{
    glm::dvec2  position{0.0, 0.0};
    Side        side      = Side::ABOVE;
    int         column    = 0;
    int         row       = 0;        ///< 0 is nearest to the axis
    bool        occupied  = false;
    std::string card_id;
    Card_type   card_type = Card_type::FULL;
};

/// Output unit of a layout pass
struct positioned_card_t
{
    std::string              id;
    std::vector<std::string> event_ids;             ///< Chronological
    glm::dvec2               position{0.0, 0.0};    ///< Top-left corner
    glm::dvec2               size{0.0, 0.0};
    Card_type                type        = Card_type::FULL;
    std::string              cluster_id;
    int                      column      = 0;
    Side                     side        = Side::ABOVE;
    std::size_t              event_count = 0;
    bool                     promoted    = false;
    bool                     slotted     = true;    ///< False when no slot could be reserved

    [[nodiscard]] double left() const noexcept   { return position.x; }
    [[nodiscard]] double right() const noexcept  { return position.x + size.x; }
    [[nodiscard]] double top() const noexcept    { return position.y; }
    [[nodiscard]] double bottom() const noexcept { return position.y + size.y; }
};

/// Slot usage across a grid
struct utilization_t
{
    int    total_slots = 0;
    int    used_slots  = 0;
    double percentage  = 0.0;
};

} // namespace cardline
