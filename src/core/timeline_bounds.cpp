#include <cardline/core/timeline_bounds.h>
#include <cardline/core/constants.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>
#include <string>

namespace cardline {

namespace {

int64_t system_now_ms()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

// -----------------------------------------------------------------------------
// viewport_mapping_t
// -----------------------------------------------------------------------------

double viewport_mapping_t::time_to_x(int64_t timestamp_ms) const
{
    const int64_t duration = bounds.duration_ms();
    if (duration <= 0 || timeline_width_px <= 0.0) {
        return left_margin_px;
    }
    const double ratio = timeline_width_px / static_cast<double>(duration);
    return static_cast<double>(timestamp_ms - bounds.start_ms) * ratio + left_margin_px;
}

int64_t viewport_mapping_t::x_to_time(double x) const
{
    if (timeline_width_px <= 0.0 || !std::isfinite(x)) {
        return bounds.start_ms;
    }
    const double offset = (x - left_margin_px) / timeline_width_px;
    return bounds.start_ms + static_cast<int64_t>(std::llround(offset * static_cast<double>(bounds.duration_ms())));
}

bool viewport_mapping_t::is_time_in_bounds(int64_t timestamp_ms) const noexcept
{
    return timestamp_ms >= bounds.start_ms && timestamp_ms <= bounds.end_ms;
}

// -----------------------------------------------------------------------------
// Timeline_bounds_calculator
// -----------------------------------------------------------------------------

Timeline_bounds_calculator::Timeline_bounds_calculator(const Layout_config& config)
:
    m_config(config)
{
}

double Timeline_bounds_calculator::sanitize_zoom(double zoom) const
{
    if (!std::isfinite(zoom) || zoom <= 0.0) {
        m_config.debug("cardline: invalid zoom factor " + std::to_string(zoom) + ", using 1.0");
        return 1.0;
    }
    return zoom;
}

timeline_bounds_t Timeline_bounds_calculator::centered_window(
    int64_t center_ms, int64_t unzoomed_ms, int64_t base_ms, double zoom) const
{
    const double zoomed = static_cast<double>(unzoomed_ms) / zoom;
    int64_t duration = constants::k_min_duration_ms;
    if (zoomed > static_cast<double>(constants::k_min_duration_ms)) {
        // Keep far from int64 overflow for absurdly small zoom factors.
        const double cap = static_cast<double>(std::numeric_limits<int64_t>::max() / 4);
        duration = static_cast<int64_t>(std::llround(std::min(zoomed, cap)));
    }

    timeline_bounds_t out;
    out.start_ms = center_ms - duration / 2;
    out.end_ms = out.start_ms + duration;
    out.padding_ms = (duration - base_ms) / 2;
    out.base_duration_ms = base_ms;
    out.unzoomed_duration_ms = unzoomed_ms;
    out.zoom = zoom;
    return out;
}

timeline_bounds_t Timeline_bounds_calculator::default_bounds(double zoom) const
{
    const int64_t now = m_config.now_ms ? m_config.now_ms() : system_now_ms();
    return centered_window(now, constants::k_default_window_ms, 0, sanitize_zoom(zoom));
}

timeline_bounds_t Timeline_bounds_calculator::calculate(
    const std::vector<timed_event_t>& events, double zoom) const
{
    if (events.empty()) {
        return default_bounds(zoom);
    }

    const auto [min_it, max_it] = std::minmax_element(events.begin(), events.end(),
        [](const timed_event_t& a, const timed_event_t& b) {
            return a.timestamp_ms < b.timestamp_ms;
        });

    const int64_t min_ms = min_it->timestamp_ms;
    const int64_t base = max_it->timestamp_ms - min_ms;

    const int64_t ten_percent = static_cast<int64_t>(static_cast<double>(base) * constants::k_padding_ratio);
    const int64_t padding = std::max(constants::k_min_padding_ms, std::min(constants::k_max_padding_ms, ten_percent));

    const int64_t midpoint = min_ms + base / 2;
    return centered_window(midpoint, base + 2 * padding, base, sanitize_zoom(zoom));
}

timeline_bounds_t Timeline_bounds_calculator::update_for_zoom(
    const timeline_bounds_t& bounds, double zoom, int64_t pivot_ms) const
{
    int64_t unzoomed = bounds.unzoomed_duration_ms;
    if (unzoomed <= 0) {
        unzoomed = static_cast<int64_t>(std::llround(static_cast<double>(bounds.duration_ms()) * bounds.zoom));
    }
    return centered_window(pivot_ms, unzoomed, bounds.base_duration_ms, sanitize_zoom(zoom));
}

viewport_mapping_t Timeline_bounds_calculator::make_mapping(
    const timeline_bounds_t& bounds, double viewport_width) const
{
    viewport_mapping_t mapping;
    mapping.bounds = bounds;
    mapping.viewport_width = std::isfinite(viewport_width) ? std::max(0.0, viewport_width) : 0.0;
    mapping.left_margin_px = m_config.timeline_margin_px;
    mapping.timeline_width_px = std::max(0.0, mapping.viewport_width - 2.0 * m_config.timeline_margin_px);
    return mapping;
}

double Timeline_bounds_calculator::optimal_column_width(
    std::size_t event_count, const viewport_mapping_t& mapping) const
{
    if (mapping.timeline_width_px <= 0.0) {
        return constants::k_base_column_width_px;
    }

    const double density = static_cast<double>(event_count) / mapping.timeline_width_px;
    double width = constants::k_base_column_width_px;

    if (density > constants::k_high_density_per_px) {
        width = std::max(constants::k_min_column_width_px,
            constants::k_base_column_width_px * (constants::k_high_density_per_px / density));
    }
    else if (density < constants::k_low_density_per_px) {
        width = density > 0.0
            ? std::min(constants::k_max_column_width_px,
                  constants::k_base_column_width_px * (constants::k_low_density_per_px / density))
            : constants::k_max_column_width_px;
    }

    return std::round(width);
}

} // namespace cardline
