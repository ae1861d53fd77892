#include <cardline/core/event_clustering.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

namespace cardline {

namespace {

// Running means so that anchors are exact without rescanning members.
// The timestamp mean is kept as quotient and remainder of the offset sum,
// which never grows past the spread of the member timestamps.
struct anchor_accumulator_t
{
    double  sum_x       = 0.0;
    int64_t base_ts     = 0;
    int64_t mean_offset = 0;
    int64_t remainder   = 0;    // offset sum == mean_offset * n + remainder, 0 <= remainder < n

    void add(const distributed_event_t& e, int64_t n)
    {
        sum_x += e.x;
        const int64_t delta = (e.timestamp_ms - base_ts) - mean_offset + remainder;
        int64_t q = delta / n;
        int64_t r = delta % n;
        if (r < 0) {
            r += n;
            --q;
        }
        mean_offset += q;
        remainder = r;
    }
};

void refresh_anchor(cluster_t& c, const anchor_accumulator_t& acc)
{
    c.anchor.x = acc.sum_x / static_cast<double>(c.events.size());
    c.anchor.timestamp_ms = acc.base_ts + acc.mean_offset;
    c.anchor.event_count = c.events.size();
}

} // namespace

Event_clustering::Event_clustering(double threshold_px)
:
    m_threshold_px(std::isfinite(threshold_px) ? std::max(0.0, threshold_px) : 0.0)
{
}

std::vector<cluster_t> Event_clustering::cluster(const std::vector<distributed_event_t>& events) const
{
    std::vector<cluster_t> clusters;
    std::vector<anchor_accumulator_t> sums;

    for (const auto& e : events) {
        // Nearest existing anchor within the threshold; earliest cluster wins ties.
        std::size_t best = clusters.size();
        double best_dist = std::numeric_limits<double>::infinity();
        for (std::size_t i = clusters.size(); i-- > 0;) {
            const double dist = std::abs(e.x - clusters[i].anchor.x);
            if (dist <= m_threshold_px && dist <= best_dist) {
                best = i;
                best_dist = dist;
            }
        }

        if (best == clusters.size()) {
            cluster_t c;
            c.id = "cluster-" + std::to_string(clusters.size());
            c.anchor.id = "anchor-" + std::to_string(clusters.size());
            clusters.push_back(std::move(c));

            anchor_accumulator_t acc;
            acc.base_ts = e.timestamp_ms;
            sums.push_back(acc);
        }

        cluster_t& target = clusters[best];
        anchor_accumulator_t& acc = sums[best];
        target.events.push_back(e);
        target.anchor.event_ids.push_back(e.id);
        acc.add(e, static_cast<int64_t>(target.events.size()));
        refresh_anchor(target, acc);
    }

    return clusters;
}

cluster_stats_t Event_clustering::stats(const std::vector<cluster_t>& clusters)
{
    cluster_stats_t s;
    s.total_clusters = clusters.size();
    for (const auto& c : clusters) {
        s.total_events += c.events.size();
        s.largest_cluster = std::max(s.largest_cluster, c.events.size());
    }
    if (s.total_clusters > 0) {
        s.avg_events_per_cluster = static_cast<double>(s.total_events) / static_cast<double>(s.total_clusters);
    }
    return s;
}

} // namespace cardline
