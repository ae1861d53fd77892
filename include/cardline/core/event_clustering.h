#pragma once
// Cardline - Event Clustering
// Greedy left-to-right grouping of distributed events around anchors.

#include "layout_config.h"
#include "types.h"

#include <algorithm>
#include <cstddef>
#include <vector>

namespace cardline {

struct cluster_stats_t
{
    std::size_t total_clusters         = 0;
    std::size_t total_events           = 0;
    double      avg_events_per_cluster = 0.0;
    std::size_t largest_cluster        = 0;
};

// -----------------------------------------------------------------------------
// Event Clustering
// -----------------------------------------------------------------------------
// Each call is a full run; nothing is retained between calls, so clustering
// the same view twice yields the same clusters.
class Event_clustering
{
public:
    explicit Event_clustering(double threshold_px);

    // `events` must be in chronological order (as produced by
    // Event_distribution_engine::distribute).
    std::vector<cluster_t> cluster(const std::vector<distributed_event_t>& events) const;

    // Full re-run over the members of previous clusters, re-positioned by
    // `reposition` for the new view.
    template<typename Reposition>
    std::vector<cluster_t> recluster(const std::vector<cluster_t>& previous, Reposition&& reposition) const
    {
        std::vector<distributed_event_t> events;
        for (const auto& c : previous) {
            for (const auto& e : c.events) {
                events.push_back(reposition(e));
            }
        }
        std::stable_sort(events.begin(), events.end(),
            [](const distributed_event_t& a, const distributed_event_t& b) {
                return a.timestamp_ms < b.timestamp_ms;
            });
        return cluster(events);
    }

    [[nodiscard]] double threshold_px() const noexcept { return m_threshold_px; }

    static cluster_stats_t stats(const std::vector<cluster_t>& clusters);

private:
    double m_threshold_px;
};

} // namespace cardline
