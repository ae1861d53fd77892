#include <cardline/core/layout_engine.h>
#include <cardline/core/algo.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <unordered_set>
#include <utility>

namespace cardline {

namespace {

double sanitize_extent(double v)
{
    return std::isfinite(v) ? std::max(0.0, v) : 0.0;
}

} // namespace

Layout_engine::Layout_engine(
    Layout_config config,
    Degradation_mode mode,
    Positioner_kind positioner)
:
    Layout_engine(std::move(config), mode, std::shared_ptr<const Positioner>(make_positioner(positioner)))
{
}

Layout_engine::Layout_engine(
    Layout_config config,
    Degradation_mode mode,
    std::shared_ptr<const Positioner> positioner)
:
    m_config(std::move(config)),
    m_mode(mode),
    m_positioner(positioner ? std::move(positioner) : std::shared_ptr<const Positioner>(make_positioner(Positioner_kind::DUAL_COLUMN))),
    m_bounds(m_config),
    m_distribution(m_config),
    m_clustering(m_config.cluster_threshold_px),
    m_coordinator(m_config, m_mode, m_positioner),
    m_validator(m_config)
{
}

std::vector<timed_event_t> Layout_engine::accept_events(
    const std::vector<event_t>& events,
    std::vector<std::string>& skipped) const
{
    std::vector<timed_event_t> out;
    out.reserve(events.size());
    std::unordered_set<std::string> ids;

    for (std::size_t i = 0; i < events.size(); ++i) {
        const event_t& e = events[i];

        if (e.id.empty()) {
            m_config.error("cardline: skipping event #" + std::to_string(i) + ": empty id");
            skipped.push_back(e.id);
            continue;
        }

        const auto ts = event_timestamp_ms(e);
        if (!ts) {
            m_config.error("cardline: skipping event '" + e.id + "': unparseable date '" + e.date + "'");
            skipped.push_back(e.id);
            continue;
        }

        if (!ids.insert(e.id).second) {
            m_config.error("cardline: skipping event '" + e.id + "': duplicate id");
            skipped.push_back(e.id);
            continue;
        }

        timed_event_t te;
        te.id = e.id;
        te.timestamp_ms = *ts;
        te.input_index = i;
        out.push_back(std::move(te));
    }
    return out;
}

layout_result_t Layout_engine::layout(
    const std::vector<event_t>& events,
    const Size2d& viewport,
    double zoom) const
{
    Profiler* profiler = m_config.profiler.get();
    CARDLINE_PROFILE_SCOPE(profiler, "cardline.layout");

    layout_result_t result;
    result.viewport = Size2d(sanitize_extent(viewport.width), sanitize_extent(viewport.height));
    result.axis_y = m_config.axis_y(result.viewport.height);
    result.cells_per_side = m_config.cells_per_side_for_height(result.viewport.height);
    result.degradation_mode = m_mode;
    result.positioner = m_positioner->kind();

    std::vector<timed_event_t> timed;
    {
        CARDLINE_PROFILE_SCOPE(profiler, "cardline.layout.accept");
        timed = accept_events(events, result.skipped_event_ids);
    }
    result.accepted_event_count = timed.size();

    {
        CARDLINE_PROFILE_SCOPE(profiler, "cardline.layout.bounds");
        result.bounds = m_bounds.calculate(timed, zoom);
    }
    if (timed.empty()) {
        return result;
    }

    const viewport_mapping_t mapping = m_bounds.make_mapping(result.bounds, result.viewport.width);

    std::vector<distributed_event_t> distributed;
    {
        CARDLINE_PROFILE_SCOPE(profiler, "cardline.layout.distribution");
        distributed = m_distribution.distribute(timed, mapping);
        result.metrics.distribution = m_distribution.calculate_metrics(distributed, mapping);
    }

    std::vector<cluster_t> clusters;
    {
        CARDLINE_PROFILE_SCOPE(profiler, "cardline.layout.clustering");
        clusters = m_clustering.cluster(distributed);
        result.metrics.clusters = Event_clustering::stats(clusters);
    }

    Degradation_coordinator::result_t assembled;
    {
        CARDLINE_PROFILE_SCOPE(profiler, "cardline.layout.assembly");
        Degradation_coordinator::parameters_t params;
        params.viewport = result.viewport;
        params.axis_y = result.axis_y;
        params.cells_per_side = result.cells_per_side;
        assembled = m_coordinator.assemble(std::move(clusters), params);
    }

    result.cards = std::move(assembled.cards);
    result.clusters = std::move(assembled.clusters);
    result.grid = std::move(assembled.grid);
    result.utilization = utilization(result.grid);
    result.metrics.degradation = std::move(assembled.degradation);

    result.anchors.reserve(result.clusters.size());
    for (auto& c : result.clusters) {
        c.anchor.y = result.axis_y;
        result.anchors.push_back(c.anchor);
    }

    result.metrics.dispatch = dispatch_metrics(result);
    result.metrics.dispatch.merged_clusters = assembled.merged_clusters;
    std::unordered_set<int> columns;
    for (const auto& plan : assembled.columns) {
        columns.insert(plan.column);
    }
    result.metrics.dispatch.column_count = columns.size();

    return result;
}

validation_report_t Layout_engine::validate(const layout_result_t& result) const
{
    return m_validator.validate(result);
}

dispatch_metrics_t Layout_engine::dispatch_metrics(const layout_result_t& result) const
{
    dispatch_metrics_t m;
    m.group_count = result.clusters.size();
    m.avg_events_per_cluster = result.metrics.clusters.avg_events_per_cluster;
    m.largest_cluster = result.metrics.clusters.largest_cluster;

    std::vector<double> xs;
    xs.reserve(result.anchors.size());
    for (const auto& a : result.anchors) {
        xs.push_back(a.x);
    }
    std::sort(xs.begin(), xs.end());
    if (xs.size() > 1) {
        m.min_anchor_pitch_px = std::numeric_limits<double>::max();
        double sum = 0.0;
        for (std::size_t i = 1; i < xs.size(); ++i) {
            const double d = xs[i] - xs[i - 1];
            m.min_anchor_pitch_px = std::min(m.min_anchor_pitch_px, d);
            m.max_anchor_pitch_px = std::max(m.max_anchor_pitch_px, d);
            sum += d;
        }
        m.avg_anchor_pitch_px = sum / static_cast<double>(xs.size() - 1);
    }

    if (!result.cards.empty() && result.viewport.width > 0.0) {
        double left = result.cards.front().left();
        double right = result.cards.front().right();
        for (const auto& c : result.cards) {
            left = std::min(left, c.left());
            right = std::max(right, c.right());
        }
        m.horizontal_space_usage = std::min(100.0, (right - left) / result.viewport.width * 100.0);
    }
    return m;
}

} // namespace cardline
