#pragma once
// Cardline - Layout Result
// Everything a layout pass produces: geometry for the renderer plus
// statistics for debug and telemetry views.

#include "degradation_engine.h"
#include "event_clustering.h"
#include "event_distribution.h"
#include "layout_config.h"
#include "slot_grid.h"
#include "timeline_bounds.h"
#include "types.h"

#include <cstddef>
#include <string>
#include <vector>

namespace cardline {

/// How clusters were spread into columns
struct dispatch_metrics_t
{
    std::size_t group_count            = 0;    ///< Clusters
    std::size_t column_count           = 0;    ///< Distinct columns opened
    std::size_t merged_clusters        = 0;    ///< Clusters folded into a neighbour column
    double      avg_events_per_cluster = 0.0;
    std::size_t largest_cluster        = 0;
    double      min_anchor_pitch_px    = 0.0;  ///< Between consecutive anchors
    double      max_anchor_pitch_px    = 0.0;
    double      avg_anchor_pitch_px    = 0.0;
    double      horizontal_space_usage = 0.0;  ///< Percent of the viewport width covered by cards
};

struct layout_metrics_t
{
    dispatch_metrics_t     dispatch;
    distribution_metrics_t distribution;
    degradation_metrics_t  degradation;
    cluster_stats_t        clusters;
};

struct layout_result_t
{
    std::vector<positioned_card_t> cards;
    std::vector<anchor_t>          anchors;
    std::vector<cluster_t>         clusters;
    utilization_t                  utilization;

    timeline_bounds_t              bounds;
    Size2d                         viewport;
    double                         axis_y           = 0.0;
    int                            cells_per_side   = 0;
    Degradation_mode               degradation_mode = Degradation_mode::UNIFORM;
    Positioner_kind                positioner       = Positioner_kind::DUAL_COLUMN;
    Slot_grid                      grid;

    std::size_t                    accepted_event_count = 0;
    std::vector<std::string>       skipped_event_ids;   ///< Unparseable date or repeated id

    layout_metrics_t               metrics;
};

} // namespace cardline
