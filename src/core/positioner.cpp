#include <cardline/core/positioner.h>
#include <cardline/core/constants.h>

#include <algorithm>
#include <array>
#include <utility>

namespace cardline {

namespace {

struct tracked_event_t
{
    distributed_event_t event;
    bool                carried = false;
};

struct column_draft_t
{
    int                          column   = 0;
    double                       center_x = 0.0;
    std::string                  cluster_id;
    std::vector<tracked_event_t> events;
    std::vector<std::string>     merged_cluster_ids;
};

double clamp_center(double x, double left, double right)
{
    if (right < left) {
        return left;
    }
    return std::clamp(x, left, right);
}

// Opens a column for the cluster at max(anchor, previous + pitch), or merges
// the cluster into the previous column when that would leave the viewport.
void place_in_track(
    std::vector<column_draft_t>& track,
    const cluster_t& cluster,
    const placement_context_t& ctx,
    int& next_column)
{
    const double half = ctx.card_width / 2.0;
    const double left = half;
    const double right = ctx.viewport_width - half;

    double center = clamp_center(cluster.anchor.x, left, right);
    if (!track.empty()) {
        center = std::max(center, track.back().center_x + ctx.column_pitch());
        if (center > right + constants::k_eps) {
            column_draft_t& prev = track.back();
            for (const auto& e : cluster.events) {
                prev.events.push_back({e, true});
            }
            prev.merged_cluster_ids.push_back(cluster.id);
            return;
        }
    }

    column_draft_t draft;
    draft.column = next_column++;
    draft.center_x = center;
    draft.cluster_id = cluster.id;
    for (const auto& e : cluster.events) {
        draft.events.push_back({e, false});
    }
    track.push_back(std::move(draft));
}

column_plan_t make_plan(
    const column_draft_t& draft, Side side,
    std::vector<tracked_event_t>::const_iterator first,
    std::vector<tracked_event_t>::const_iterator last)
{
    column_plan_t plan;
    plan.column = draft.column;
    plan.side = side;
    plan.center_x = draft.center_x;
    plan.cluster_id = draft.cluster_id;
    plan.merged_cluster_ids = draft.merged_cluster_ids;
    for (auto it = first; it != last; ++it) {
        plan.events.push_back(it->event);
        if (it->carried) {
            ++plan.overflow_count;
        }
    }
    return plan;
}

void sort_chronologically(column_draft_t& draft)
{
    std::stable_sort(draft.events.begin(), draft.events.end(),
        [](const tracked_event_t& a, const tracked_event_t& b) {
            return a.event.timestamp_ms < b.event.timestamp_ms;
        });
}

} // namespace

// -----------------------------------------------------------------------------
// Single_column_positioner
// -----------------------------------------------------------------------------

std::vector<column_plan_t> Single_column_positioner::plan_columns(
    const std::vector<cluster_t>& clusters,
    const placement_context_t& context) const
{
    std::vector<column_draft_t> track;
    int next_column = 0;
    for (const auto& c : clusters) {
        place_in_track(track, c, context, next_column);
    }

    std::vector<column_plan_t> plans;
    plans.reserve(track.size() * 2);
    for (auto& draft : track) {
        sort_chronologically(draft);
        const auto split = draft.events.begin() +
            static_cast<std::ptrdiff_t>((draft.events.size() + 1) / 2);
        plans.push_back(make_plan(draft, Side::ABOVE, draft.events.cbegin(), split));
        plans.push_back(make_plan(draft, Side::BELOW, split, draft.events.cend()));
    }
    return plans;
}

// -----------------------------------------------------------------------------
// Dual_column_positioner
// -----------------------------------------------------------------------------

std::vector<column_plan_t> Dual_column_positioner::plan_columns(
    const std::vector<cluster_t>& clusters,
    const placement_context_t& context) const
{
    std::array<std::vector<column_draft_t>, 2> tracks;
    int next_column = 0;
    for (std::size_t i = 0; i < clusters.size(); ++i) {
        place_in_track(tracks[i % 2], clusters[i], context, next_column);
    }

    std::vector<column_plan_t> plans;
    for (std::size_t t = 0; t < tracks.size(); ++t) {
        const Side side = t == 0 ? Side::ABOVE : Side::BELOW;
        for (auto& draft : tracks[t]) {
            sort_chronologically(draft);
            plans.push_back(make_plan(draft, side, draft.events.cbegin(), draft.events.cend()));
        }
    }

    std::sort(plans.begin(), plans.end(),
        [](const column_plan_t& a, const column_plan_t& b) {
            return a.column < b.column;
        });
    return plans;
}

std::unique_ptr<Positioner> make_positioner(Positioner_kind kind)
{
    switch (kind) {
        case Positioner_kind::SINGLE_COLUMN:
            return std::make_unique<Single_column_positioner>();
        case Positioner_kind::DUAL_COLUMN:
            return std::make_unique<Dual_column_positioner>();
    }
    return std::make_unique<Dual_column_positioner>();
}

} // namespace cardline
