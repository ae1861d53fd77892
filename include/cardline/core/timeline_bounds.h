#pragma once
// Cardline - Timeline Bounds
// Visible time window and the time <-> pixel mapping.

#include "layout_config.h"
#include "types.h"

#include <cstdint>
#include <vector>

namespace cardline {

/// Visible time window
struct timeline_bounds_t
{
    int64_t start_ms          = 0;
    int64_t end_ms            = 0;
    int64_t padding_ms        = 0;    ///< (zoomed - base) / 2, negative when zoomed in
    int64_t base_duration_ms  = 0;    ///< max - min event timestamp
    int64_t unzoomed_duration_ms = 0; ///< base + 2 x padding at zoom 1.0
    double  zoom              = 1.0;

    [[nodiscard]] int64_t duration_ms() const noexcept { return end_ms - start_ms; }
    [[nodiscard]] int64_t center_ms() const noexcept { return start_ms + duration_ms() / 2; }
};

/// Time <-> pixel mapping for one viewport width
struct viewport_mapping_t
{
    timeline_bounds_t bounds;
    double viewport_width    = 0.0;
    double left_margin_px    = 0.0;
    double timeline_width_px = 0.0;

    [[nodiscard]] double left_edge() const noexcept  { return left_margin_px; }
    [[nodiscard]] double right_edge() const noexcept { return left_margin_px + timeline_width_px; }

    [[nodiscard]] double time_to_x(int64_t timestamp_ms) const;
    [[nodiscard]] int64_t x_to_time(double x) const;
    [[nodiscard]] bool is_time_in_bounds(int64_t timestamp_ms) const noexcept;
};

// -----------------------------------------------------------------------------
// Timeline Bounds Calculator
// -----------------------------------------------------------------------------
// Stateless apart from configuration. Never fails: invalid zoom factors and
// degenerate ranges are clamped.
class Timeline_bounds_calculator
{
public:
    explicit Timeline_bounds_calculator(const Layout_config& config);

    timeline_bounds_t calculate(const std::vector<timed_event_t>& events, double zoom) const;

    // Window for an empty event set: one year around "now".
    timeline_bounds_t default_bounds(double zoom) const;

    // Rescales an existing window to a new zoom factor around a pivot time.
    timeline_bounds_t update_for_zoom(const timeline_bounds_t& bounds, double zoom, int64_t pivot_ms) const;

    viewport_mapping_t make_mapping(const timeline_bounds_t& bounds, double viewport_width) const;

    // Column width between 150 and 300 px depending on events per pixel.
    double optimal_column_width(std::size_t event_count, const viewport_mapping_t& mapping) const;

private:
    double sanitize_zoom(double zoom) const;
    timeline_bounds_t centered_window(int64_t center_ms, int64_t unzoomed_ms, int64_t base_ms, double zoom) const;

    Layout_config m_config;
};

} // namespace cardline
