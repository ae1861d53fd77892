#pragma once
// Cardline - Event Distribution
// Maps events onto the timeline, measures local density and spreads
// crowded positions apart.

#include "layout_config.h"
#include "timeline_bounds.h"
#include "types.h"

#include <cstddef>
#include <vector>

namespace cardline {

struct space_allocation_t
{
    int    recommended_column_count = 0;
    double column_width_px          = 0.0;
    double spacing_px               = 0.0;
    double utilization_target       = 0.0;
};

enum class Density_level
{
    LOW,
    MEDIUM,
    HIGH
};

struct density_analysis_t
{
    Density_level level          = Density_level::LOW;
    double        events_per_day = 0.0;
};

struct distribution_metrics_t
{
    std::size_t total_events           = 0;
    double      average_density        = 0.0;  ///< Events per day
    double      max_density            = 0.0;
    double      min_density            = 0.0;
    double      horizontal_utilization = 0.0;  ///< Percent of the timeline width spanned
    bool        clustering_recommended = false;
    bool        spacing_applied        = false;
};

// -----------------------------------------------------------------------------
// Event Distribution Engine
// -----------------------------------------------------------------------------
class Event_distribution_engine
{
public:
    explicit Event_distribution_engine(const Layout_config& config);

    // Chronological (stable) list with x and density. Events outside the
    // visible window are pinned to the nearest timeline edge.
    std::vector<distributed_event_t> distribute(
        const std::vector<timed_event_t>& events,
        const viewport_mapping_t& mapping) const;

    // True when distribute() would run the spacing pass for this many events.
    bool needs_spacing(std::size_t event_count, const viewport_mapping_t& mapping) const;

    space_allocation_t space_allocation(std::size_t event_count, const viewport_mapping_t& mapping) const;

    density_analysis_t analyze_density(std::size_t event_count, const timeline_bounds_t& bounds) const;

    distribution_metrics_t calculate_metrics(
        const std::vector<distributed_event_t>& events,
        const viewport_mapping_t& mapping) const;

private:
    void compute_densities(std::vector<distributed_event_t>& events) const;
    void apply_spacing(std::vector<distributed_event_t>& events, const viewport_mapping_t& mapping) const;

    double m_density_window_days;
    double m_min_event_pitch_px;
};

} // namespace cardline
