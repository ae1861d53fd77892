#include <cardline/core/event_distribution.h>
#include <cardline/core/constants.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>

namespace cardline {

Event_distribution_engine::Event_distribution_engine(const Layout_config& config)
:
    m_density_window_days(config.density_window_days > 0.0
        ? config.density_window_days
        : constants::k_density_window_days),
    m_min_event_pitch_px(std::max(0.0, config.min_event_pitch_px))
{
}

std::vector<distributed_event_t> Event_distribution_engine::distribute(
    const std::vector<timed_event_t>& events,
    const viewport_mapping_t& mapping) const
{
    std::vector<distributed_event_t> out;
    if (events.empty()) {
        return out;
    }

    out.reserve(events.size());
    for (const auto& e : events) {
        distributed_event_t de;
        de.id = e.id;
        de.timestamp_ms = e.timestamp_ms;
        de.input_index = e.input_index;
        de.x = std::clamp(mapping.time_to_x(e.timestamp_ms), mapping.left_edge(), mapping.right_edge());
        out.push_back(std::move(de));
    }

    std::stable_sort(out.begin(), out.end(),
        [](const distributed_event_t& a, const distributed_event_t& b) {
            return a.timestamp_ms < b.timestamp_ms;
        });

    compute_densities(out);

    if (out.size() > 1 && needs_spacing(out.size(), mapping)) {
        apply_spacing(out, mapping);
    }
    return out;
}

// Two-pointer sweep over the sorted timestamps; the window is centered on
// each event and inclusive at both ends.
void Event_distribution_engine::compute_densities(std::vector<distributed_event_t>& events) const
{
    const double window_ms = m_density_window_days * static_cast<double>(constants::k_ms_per_day);
    const int64_t half = static_cast<int64_t>(window_ms / 2.0);

    std::size_t lo = 0;
    std::size_t hi = 0;
    for (std::size_t i = 0; i < events.size(); ++i) {
        const int64_t t = events[i].timestamp_ms;
        while (events[lo].timestamp_ms < t - half) {
            ++lo;
        }
        if (hi < i) {
            hi = i;
        }
        while (hi + 1 < events.size() && events[hi + 1].timestamp_ms <= t + half) {
            ++hi;
        }
        events[i].density = static_cast<double>(hi - lo + 1) / m_density_window_days;
    }
}

bool Event_distribution_engine::needs_spacing(std::size_t event_count, const viewport_mapping_t& mapping) const
{
    if (event_count < 2) {
        return false;
    }
    const auto alloc = space_allocation(event_count, mapping);
    return static_cast<double>(alloc.recommended_column_count) < static_cast<double>(event_count) / 4.0;
}

// Pushes each event right of its predecessor by at least the minimum pitch,
// capped at the right timeline edge. Order is preserved.
void Event_distribution_engine::apply_spacing(
    std::vector<distributed_event_t>& events,
    const viewport_mapping_t& mapping) const
{
    const double right = mapping.right_edge();
    for (std::size_t i = 1; i < events.size(); ++i) {
        const double min_x = events[i - 1].x + m_min_event_pitch_px;
        if (events[i].x < min_x) {
            events[i].x = std::min(min_x, right);
        }
    }
}

space_allocation_t Event_distribution_engine::space_allocation(
    std::size_t event_count, const viewport_mapping_t& mapping) const
{
    space_allocation_t alloc;
    alloc.utilization_target = constants::k_utilization_target;
    alloc.spacing_px = constants::k_base_column_gap_px;

    const double available = mapping.timeline_width_px * alloc.utilization_target;
    const int max_columns = static_cast<int>(std::floor(
        available / (constants::k_base_column_width_px + constants::k_base_column_gap_px)));
    const int ideal_columns = static_cast<int>(
        (event_count + constants::k_events_per_column - 1) / constants::k_events_per_column);

    alloc.recommended_column_count = std::max(0, std::min(max_columns, ideal_columns));

    double width = constants::k_base_column_width_px;
    if (alloc.recommended_column_count > 0) {
        const double n = static_cast<double>(alloc.recommended_column_count);
        width = std::min(width, (available - (n - 1.0) * alloc.spacing_px) / n);
    }
    alloc.column_width_px = std::max(constants::k_min_column_width_px, width);
    return alloc;
}

density_analysis_t Event_distribution_engine::analyze_density(
    std::size_t event_count, const timeline_bounds_t& bounds) const
{
    density_analysis_t out;
    const double days = static_cast<double>(bounds.duration_ms()) / static_cast<double>(constants::k_ms_per_day);
    if (days <= 0.0) {
        return out;
    }

    out.events_per_day = static_cast<double>(event_count) / days;
    if (out.events_per_day > constants::k_high_events_per_day) {
        out.level = Density_level::HIGH;
    }
    else if (out.events_per_day > constants::k_low_events_per_day) {
        out.level = Density_level::MEDIUM;
    }
    return out;
}

distribution_metrics_t Event_distribution_engine::calculate_metrics(
    const std::vector<distributed_event_t>& events,
    const viewport_mapping_t& mapping) const
{
    distribution_metrics_t m;
    if (events.empty()) {
        return m;
    }

    m.total_events = events.size();
    m.max_density = events.front().density;
    m.min_density = events.front().density;
    double sum = 0.0;
    double min_x = events.front().x;
    double max_x = events.front().x;
    std::size_t close_pairs = 0;

    for (std::size_t i = 0; i < events.size(); ++i) {
        const auto& e = events[i];
        sum += e.density;
        m.max_density = std::max(m.max_density, e.density);
        m.min_density = std::min(m.min_density, e.density);
        min_x = std::min(min_x, e.x);
        max_x = std::max(max_x, e.x);
        if (i + 1 < events.size() &&
            std::llabs(events[i + 1].timestamp_ms - e.timestamp_ms) < constants::k_ms_per_day)
        {
            ++close_pairs;
        }
    }
    m.average_density = sum / static_cast<double>(events.size());

    const double width = mapping.timeline_width_px;
    const double per_px = width > 0.0 ? static_cast<double>(events.size()) / width : 0.0;
    m.horizontal_utilization = width > 0.0 ? (max_x - min_x) / width * 100.0 : 0.0;

    m.clustering_recommended =
        width <= 0.0 ||
        per_px > constants::k_high_density_per_px ||
        m.horizontal_utilization < 60.0 ||
        static_cast<double>(close_pairs) > static_cast<double>(events.size()) * 0.3;

    m.spacing_applied = needs_spacing(events.size(), mapping);
    return m;
}

} // namespace cardline
