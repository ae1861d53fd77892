#pragma once

// Cardline - Configuration
// Injectable configuration for host-specific behavior: card metrics,
// spacing, capacity, logging and profiling hooks.

#include "constants.h"
#include "types.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace cardline {

// -----------------------------------------------------------------------------
// Profiling Interface (optional)
// -----------------------------------------------------------------------------
// Hosts can inject profiling by implementing this interface.
// If not provided, profiling is a no-op.
class Profiler
{
public:
    virtual ~Profiler() = default;
    virtual void begin_scope(const char* name) = 0;
    virtual void end_scope() = 0;
};

// RAII scope guard for profiling
class Profile_scope
{
public:
    Profile_scope(Profiler* profiler, const char* name)
    :
        m_profiler(profiler)
    {
        if (m_profiler) {
            m_profiler->begin_scope(name);
        }
    }

    ~Profile_scope()
    {
        if (m_profiler) {
            m_profiler->end_scope();
        }
    }

    Profile_scope(const Profile_scope&) = delete;
    Profile_scope& operator=(const Profile_scope&) = delete;

private:
    Profiler* m_profiler;
};

// Macro helpers for proper __LINE__ expansion
#define CARDLINE_CONCAT_IMPL(a, b) a##b
#define CARDLINE_CONCAT(a, b) CARDLINE_CONCAT_IMPL(a, b)

// Macro for scoped profiling (no-op if profiler is null)
#define CARDLINE_PROFILE_SCOPE(profiler, name) \
    ::cardline::Profile_scope CARDLINE_CONCAT(cardline_profile_scope_, __LINE__)((profiler), (name))

// -----------------------------------------------------------------------------
// Algorithm variants (chosen when an engine is constructed)
// -----------------------------------------------------------------------------
enum class Degradation_mode
{
    // One card type per half-column, picked by the cascade.
    UNIFORM,
    // Earlier events get higher-fidelity cards than later ones, as long as
    // every event of the half-column still fits an individual card.
    MIXED
};

enum class Positioner_kind
{
    // One column per cluster, events split between both sides.
    SINGLE_COLUMN,
    // Clusters alternate between independent above and below tracks.
    DUAL_COLUMN
};

enum class Viewport_category
{
    MOBILE,
    TABLET,
    DESKTOP,
    ULTRAWIDE
};

inline Viewport_category viewport_category_for(double width)
{
    if (width >= 2560.0) {
        return Viewport_category::ULTRAWIDE;
    }
    if (width >= 1440.0) {
        return Viewport_category::DESKTOP;
    }
    if (width >= 1024.0) {
        return Viewport_category::TABLET;
    }
    return Viewport_category::MOBILE;
}

// -----------------------------------------------------------------------------
// Card Type Configuration
// -----------------------------------------------------------------------------
struct card_type_config_t
{
    double width               = 0.0;  ///< Pixels
    double height              = 0.0;  ///< Pixels
    int    footprint_cells     = 1;    ///< Slots consumed on one side
    int    max_events_per_card = 1;
    int    max_cards_per_side  = 0;    ///< 0 = limited by capacity only
};

using card_type_table_t = std::array<card_type_config_t, k_card_type_count>;

inline card_type_table_t default_card_types()
{
    card_type_table_t table{};
    table[card_type_index(Card_type::FULL)]        = {260.0, 169.0, 4, 1, 0};
    table[card_type_index(Card_type::COMPACT)]     = {260.0,  82.0, 2, 1, 3};
    table[card_type_index(Card_type::TITLE_ONLY)]  = {260.0,  32.0, 1, 1, 0};
    table[card_type_index(Card_type::MULTI_EVENT)] = {260.0,  82.0, 2, constants::k_max_events_per_multi, 0};
    table[card_type_index(Card_type::INFINITE)]    = {260.0,  32.0, 1, 0, 1};
    return table;
}

// Scales card sizes to the viewport, relative to a 1200x800 reference.
inline card_type_table_t adaptive_card_types(double viewport_width, double viewport_height)
{
    double scale = std::min(viewport_width / 1200.0, viewport_height / 800.0);
    if (!std::isfinite(scale)) {
        scale = 1.0;
    }
    scale = std::clamp(scale, 0.7, 1.2);

    card_type_table_t table = default_card_types();
    for (auto& card : table) {
        card.width  = std::round(card.width * scale);
        card.height = std::round(card.height * scale);
    }
    return table;
}

// -----------------------------------------------------------------------------
// Layout Configuration
// -----------------------------------------------------------------------------
// All host-specific configuration that can be injected into cardline
// components.
struct Layout_config
{
    // --- Cards ---
    card_type_table_t card_types = default_card_types();

    // --- Horizontal ---
    double cluster_threshold_px = constants::k_cluster_threshold_px;
    double column_spacing_px    = constants::k_base_column_gap_px;
    double timeline_margin_px   = constants::k_timeline_margin_px;  // left and right
    double min_event_pitch_px   = constants::k_min_event_pitch_px;
    double density_window_days  = constants::k_density_window_days;

    // --- Vertical ---
    double header_safe_zone_px  = constants::k_header_safe_zone_px;
    double above_axis_margin_px = constants::k_above_axis_margin_px;
    double below_axis_margin_px = constants::k_below_axis_margin_px;
    double card_gap_px          = constants::k_card_gap_px;

    // --- Capacity ---
    // Used as is when adaptive_capacity is off.
    int  cells_per_side     = constants::k_cells_per_side;
    // When true, cells per side are derived from the room between the
    // header safe zone, the axis and the bottom edge, and clamped to
    // [min_cells_per_side, max_cells_per_side].
    bool adaptive_capacity  = true;
    int  min_cells_per_side = constants::k_min_cells_per_side;
    int  max_cells_per_side = constants::k_max_cells_per_side;

    // --- Promotion ---
    bool   enable_promotion   = true;
    double promotion_low_water = constants::k_promotion_low_water;  // fraction 0..1
    double promotion_budget    = constants::k_promotion_budget;     // fraction of free slots

    // --- Clock ---
    // Milliseconds since the epoch, used for the default window of an empty
    // layout. If null, the system clock is used.
    std::function<int64_t()> now_ms;

    // --- Profiling (optional) ---
    std::shared_ptr<Profiler> profiler;

    // --- Logging (optional) ---
    // Debug messages (column merges, degradation, promotion) are only
    // emitted when debug_layout is set.
    bool debug_layout = false;
    std::function<void(const std::string&)> log_debug;
    std::function<void(const std::string&)> log_error;

    [[nodiscard]] const card_type_config_t& card(Card_type type) const
    {
        return card_types[card_type_index(type)];
    }

    [[nodiscard]] double max_card_width() const
    {
        double w = 0.0;
        for (const auto& c : card_types) {
            w = std::max(w, c.width);
        }
        return w;
    }

    // Axis sits halfway down the area below the header safe zone.
    [[nodiscard]] double axis_y(double viewport_height) const
    {
        const double h = std::max(0.0, viewport_height);
        return header_safe_zone_px + (h - header_safe_zone_px) / 2.0;
    }

    // Tallest stack any card type needs per cell, trailing gap included.
    [[nodiscard]] double stack_px_per_cell() const
    {
        double px = 0.0;
        for (const auto& c : card_types) {
            if (c.footprint_cells > 0) {
                px = std::max(px, (c.height + card_gap_px) / c.footprint_cells);
            }
        }
        return px;
    }

    // Full half-columns of any card mix stay between the header safe zone
    // and the bottom edge, unless the minimum forces more cells.
    [[nodiscard]] int cells_per_side_for_height(double viewport_height) const
    {
        if (!adaptive_capacity) {
            return cells_per_side;
        }
        const double h = std::max(0.0, viewport_height);
        const double axis = axis_y(h);
        const double above = axis - above_axis_margin_px - header_safe_zone_px;
        const double below = h - axis - below_axis_margin_px;
        const double avail = std::min(above, below) + card_gap_px;
        const double cell_px = stack_px_per_cell();

        int cells = (cell_px > 0.0 && avail > 0.0) ? static_cast<int>(std::floor(avail / cell_px)) : 0;
        return std::clamp(cells, min_cells_per_side, std::max(min_cells_per_side, max_cells_per_side));
    }

    void debug(const std::string& message) const
    {
        if (debug_layout && log_debug) {
            log_debug(message);
        }
    }

    void error(const std::string& message) const
    {
        if (log_error) {
            log_error(message);
        }
    }

    // Default configuration
    static Layout_config make_default()
    {
        Layout_config cfg;
        cfg.card_types = default_card_types();
        cfg.cluster_threshold_px = constants::k_cluster_threshold_px;
        cfg.column_spacing_px = constants::k_base_column_gap_px;
        cfg.cells_per_side = constants::k_cells_per_side;
        cfg.adaptive_capacity = true;
        cfg.enable_promotion = true;
        cfg.promotion_low_water = constants::k_promotion_low_water;
        cfg.debug_layout = false;
        return cfg;
    }

    // Thresholds, spacing and card scale tuned per viewport category
    static Layout_config make_for_viewport(double width, double height)
    {
        Layout_config cfg = make_default();
        switch (viewport_category_for(width)) {
            case Viewport_category::MOBILE:
                cfg.cluster_threshold_px = 80.0;
                cfg.column_spacing_px = 12.0;
                cfg.card_gap_px = 8.0;
                cfg.card_types = adaptive_card_types(width, height);
                break;
            case Viewport_category::TABLET:
                cfg.cluster_threshold_px = 100.0;
                cfg.column_spacing_px = 16.0;
                cfg.card_gap_px = 10.0;
                cfg.card_types = adaptive_card_types(width, height);
                break;
            case Viewport_category::DESKTOP:
                cfg.cluster_threshold_px = 120.0;
                cfg.column_spacing_px = 20.0;
                break;
            case Viewport_category::ULTRAWIDE:
                cfg.cluster_threshold_px = 140.0;
                cfg.column_spacing_px = 24.0;
                break;
        }
        return cfg;
    }
};

} // namespace cardline
