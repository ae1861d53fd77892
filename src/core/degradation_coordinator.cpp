#include <cardline/core/degradation_coordinator.h>

#include <algorithm>
#include <string>
#include <unordered_map>
#include <utility>

namespace cardline {

namespace {

std::string make_card_id(int column, Side side, std::size_t index)
{
    return "card-" + std::to_string(column) + (side == Side::ABOVE ? "a-" : "b-") + std::to_string(index);
}

} // namespace

Degradation_coordinator::Degradation_coordinator(
    const Layout_config& config,
    Degradation_mode mode,
    std::shared_ptr<const Positioner> positioner)
:
    m_config(config),
    m_degradation(config, mode),
    m_positioner(positioner ? std::move(positioner) : std::shared_ptr<const Positioner>(make_positioner(Positioner_kind::DUAL_COLUMN)))
{
}

Slot_grid Degradation_coordinator::build_grid(
    const std::vector<column_plan_t>& plans, const parameters_t& params) const
{
    const double cell_h = m_config.card(Card_type::TITLE_ONLY).height;
    const double pitch = cell_h + m_config.card_gap_px;

    std::vector<pool_spec_t> specs;
    specs.reserve(plans.size());
    for (const auto& plan : plans) {
        pool_spec_t spec;
        spec.column = plan.column;
        spec.side = plan.side;
        spec.center_x = plan.center_x;
        spec.capacity = params.cells_per_side;
        spec.row_pitch = pitch;
        spec.first_row_y = plan.side == Side::ABOVE
            ? params.axis_y - m_config.above_axis_margin_px - cell_h / 2.0
            : params.axis_y + m_config.below_axis_margin_px + cell_h / 2.0;
        specs.push_back(spec);
    }
    return Slot_grid(m_config.card_types, specs);
}

Degradation_coordinator::result_t Degradation_coordinator::assemble(
    std::vector<cluster_t> clusters, const parameters_t& params) const
{
    result_t out;

    placement_context_t ctx;
    ctx.viewport_width = std::max(0.0, params.viewport.width);
    ctx.card_width = m_config.max_card_width();
    ctx.column_spacing = m_config.column_spacing_px;

    out.columns = m_positioner->plan_columns(clusters, ctx);

    for (const auto& plan : out.columns) {
        // Single-column plans list the same merges on both sides.
        if (plan.side == Side::BELOW && m_positioner->kind() == Positioner_kind::SINGLE_COLUMN) {
            continue;
        }
        out.merged_clusters += plan.merged_cluster_ids.size();
        for (const auto& id : plan.merged_cluster_ids) {
            m_config.debug("cardline: " + id + " merged into column " + std::to_string(plan.column) + " as overflow");
        }
    }

    Profiler* profiler = m_config.profiler.get();
    Slot_grid grid = build_grid(out.columns, params);

    std::vector<column_assignment_t> assignments;
    assignments.reserve(out.columns.size());
    {
        CARDLINE_PROFILE_SCOPE(profiler, "cardline.layout.assembly.degradation");
        for (const auto& plan : out.columns) {
            column_assignment_t a;
            a.column = plan.column;
            a.side = plan.side;
            a.cluster_id = plan.cluster_id;

            const int capacity = grid.available(plan.column, plan.side);
            const degradation_plan_t dp = m_degradation.plan(plan.events.size(), capacity);

            for (std::size_t k = 0; k < dp.cards.size(); ++k) {
                const planned_card_t& card = dp.cards[k];
                std::string id = make_card_id(plan.column, plan.side, k);

                occupy_result_t r = occupy(std::move(grid), plan.column, card.type, id, plan.side);
                grid = std::move(r.grid);
                if (!r.success) {
                    m_config.debug("cardline: " + id + " (" + to_string(card.type) + ") left unslotted: " + r.reason);
                }

                a.cards.push_back(card);
                a.card_ids.push_back(std::move(id));
                a.slotted.push_back(r.success);
            }

            if (!dp.cards.empty() && dp.cards.back().type != Card_type::FULL) {
                m_config.debug("cardline: column " + std::to_string(plan.column) + " " + to_string(plan.side) +
                    " degraded to " + to_string(dp.cards.back().type) + " for " +
                    std::to_string(plan.events.size()) + " events in " + std::to_string(capacity) + " cells");
            }
            assignments.push_back(std::move(a));
        }
    }

    {
        CARDLINE_PROFILE_SCOPE(profiler, "cardline.layout.assembly.promotion");
        promotion_result_t promoted = m_degradation.promote(std::move(grid), std::move(assignments));
        out.grid = std::move(promoted.grid);
        out.assignments = std::move(promoted.columns);
        out.degradation = m_degradation.metrics(out.assignments);
        out.degradation.promotion_cells = promoted.cells_spent;
    }

    out.cards = stack_cards(out.columns, out.assignments, params.axis_y);

    // Back-references from clusters to the cards showing their events
    std::unordered_map<std::string, std::size_t> owner;
    for (std::size_t i = 0; i < clusters.size(); ++i) {
        for (const auto& e : clusters[i].events) {
            owner.emplace(e.id, i);
        }
    }
    for (const auto& card : out.cards) {
        for (const auto& event_id : card.event_ids) {
            const auto it = owner.find(event_id);
            if (it == owner.end()) {
                continue;
            }
            cluster_t& c = clusters[it->second];
            if (c.card_ids.empty() || c.card_ids.back() != card.id) {
                c.card_ids.push_back(card.id);
            }
            if (is_individual(card.type)) {
                ++c.anchor.visible_count;
            }
            else {
                ++c.anchor.overflow_count;
            }
        }
    }
    out.clusters = std::move(clusters);
    return out;
}

std::vector<positioned_card_t> Degradation_coordinator::stack_cards(
    const std::vector<column_plan_t>& plans,
    const std::vector<column_assignment_t>& assignments,
    double axis_y) const
{
    std::vector<positioned_card_t> cards;

    for (std::size_t i = 0; i < plans.size() && i < assignments.size(); ++i) {
        const column_plan_t& plan = plans[i];
        const column_assignment_t& a = assignments[i];

        // Edge nearest the axis for the next card
        double edge = plan.side == Side::ABOVE
            ? axis_y - m_config.above_axis_margin_px
            : axis_y + m_config.below_axis_margin_px;

        for (std::size_t k = 0; k < a.cards.size(); ++k) {
            const planned_card_t& pc = a.cards[k];
            const card_type_config_t& cfg = m_config.card(pc.type);

            positioned_card_t card;
            card.id = a.card_ids[k];
            card.type = pc.type;
            card.cluster_id = plan.cluster_id;
            card.column = plan.column;
            card.side = plan.side;
            card.event_count = pc.event_count;
            card.promoted = pc.promoted;
            card.slotted = a.slotted[k];
            card.size = glm::dvec2(cfg.width, cfg.height);

            for (std::size_t e = pc.first_event; e < pc.first_event + pc.event_count && e < plan.events.size(); ++e) {
                card.event_ids.push_back(plan.events[e].id);
            }

            double top = edge;
            if (plan.side == Side::ABOVE) {
                top = edge - cfg.height;
                edge = top - m_config.card_gap_px;
            }
            else {
                edge += cfg.height + m_config.card_gap_px;
            }
            card.position = glm::dvec2(plan.center_x - cfg.width / 2.0, top);

            cards.push_back(std::move(card));
        }
    }
    return cards;
}

} // namespace cardline
