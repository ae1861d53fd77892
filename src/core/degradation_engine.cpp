#include <cardline/core/degradation_engine.h>

#include <algorithm>
#include <cmath>
#include <set>
#include <string>

namespace cardline {

namespace {

constexpr std::array<Card_type, 3> k_individual_types = {
    Card_type::FULL,
    Card_type::COMPACT,
    Card_type::TITLE_ONLY
};

std::size_t ceil_div(std::size_t a, std::size_t b)
{
    return b == 0 ? 0 : (a + b - 1) / b;
}

bool within_card_limit(const card_type_config_t& cfg, std::size_t cards)
{
    return cfg.max_cards_per_side <= 0 || cards <= static_cast<std::size_t>(cfg.max_cards_per_side);
}

} // namespace

Degradation_engine::Degradation_engine(const Layout_config& config, Degradation_mode mode)
:
    m_config(config),
    m_mode(mode)
{
}

int Degradation_engine::footprint(Card_type type) const
{
    return std::max(0, m_config.card(type).footprint_cells);
}

bool Degradation_engine::fits_uniform(Card_type type, std::size_t event_count, int capacity) const
{
    const card_type_config_t& cfg = m_config.card(type);
    std::size_t cards = event_count;
    if (type == Card_type::MULTI_EVENT) {
        cards = ceil_div(event_count, static_cast<std::size_t>(std::max(1, cfg.max_events_per_card)));
    }
    const long long need = static_cast<long long>(cards) * footprint(type);
    return need <= capacity && within_card_limit(cfg, cards);
}

Card_type Degradation_engine::uniform_type_for(std::size_t event_count, int capacity) const
{
    for (Card_type t : k_individual_types) {
        if (fits_uniform(t, event_count, capacity)) {
            return t;
        }
    }
    return Card_type::MULTI_EVENT;
}

degradation_plan_t Degradation_engine::plan(std::size_t event_count, int capacity) const
{
    if (event_count == 0) {
        return {};
    }
    capacity = std::max(0, capacity);
    if (m_mode == Degradation_mode::MIXED &&
        static_cast<long long>(event_count) * footprint(Card_type::TITLE_ONLY) <= capacity)
    {
        return plan_mixed(event_count, capacity);
    }
    return plan_uniform(event_count, capacity);
}

degradation_plan_t Degradation_engine::plan_uniform(std::size_t event_count, int capacity) const
{
    degradation_plan_t out;

    for (Card_type t : k_individual_types) {
        if (!fits_uniform(t, event_count, capacity)) {
            continue;
        }
        for (std::size_t i = 0; i < event_count; ++i) {
            out.cards.push_back({t, i, 1, false});
        }
        out.cells_required = static_cast<int>(event_count) * footprint(t);
        return out;
    }

    if (fits_uniform(Card_type::MULTI_EVENT, event_count, capacity)) {
        const auto per_card = static_cast<std::size_t>(std::max(1, m_config.card(Card_type::MULTI_EVENT).max_events_per_card));
        for (std::size_t first = 0; first < event_count; first += per_card) {
            out.cards.push_back({Card_type::MULTI_EVENT, first, std::min(per_card, event_count - first), false});
        }
        out.cells_required = static_cast<int>(out.cards.size()) * footprint(Card_type::MULTI_EVENT);
        return out;
    }

    return plan_summary(event_count, capacity);
}

// As many multi-event cards as fit next to one infinite card; the infinite
// card takes every remaining event.
degradation_plan_t Degradation_engine::plan_summary(std::size_t event_count, int capacity) const
{
    degradation_plan_t out;
    const int inf_cells = footprint(Card_type::INFINITE);

    if (capacity < inf_cells) {
        out.cards.push_back({Card_type::INFINITE, 0, event_count, false});
        out.cells_required = 0;
        out.fits = false;
        return out;
    }

    const card_type_config_t& multi = m_config.card(Card_type::MULTI_EVENT);
    const auto per_card = static_cast<std::size_t>(std::max(1, multi.max_events_per_card));
    const int multi_cells = footprint(Card_type::MULTI_EVENT);

    std::size_t multi_cards = 0;
    if (multi_cells > 0) {
        multi_cards = static_cast<std::size_t>((capacity - inf_cells) / multi_cells);
    }
    if (multi.max_cards_per_side > 0) {
        multi_cards = std::min(multi_cards, static_cast<std::size_t>(multi.max_cards_per_side));
    }
    // Leave at least one event for the infinite card.
    multi_cards = std::min(multi_cards, (event_count - 1) / per_card);

    std::size_t first = 0;
    for (std::size_t i = 0; i < multi_cards; ++i) {
        out.cards.push_back({Card_type::MULTI_EVENT, first, per_card, false});
        first += per_card;
    }
    out.cards.push_back({Card_type::INFINITE, first, event_count - first, false});
    out.cells_required = static_cast<int>(multi_cards) * multi_cells + inf_cells;
    return out;
}

// Each event takes the highest-fidelity type, not above its predecessor's,
// that still leaves one title-only cell for every later event.
degradation_plan_t Degradation_engine::plan_mixed(std::size_t event_count, int capacity) const
{
    degradation_plan_t out;
    const int title_cells = footprint(Card_type::TITLE_ONLY);
    std::array<std::size_t, k_card_type_count> used{};

    int remaining = capacity;
    std::size_t floor_index = 0;
    for (std::size_t i = 0; i < event_count; ++i) {
        const long long later = static_cast<long long>(event_count - i - 1) * title_cells;
        Card_type chosen = Card_type::TITLE_ONLY;
        for (std::size_t t = floor_index; t < k_individual_types.size(); ++t) {
            const Card_type type = k_individual_types[t];
            const card_type_config_t& cfg = m_config.card(type);
            if (footprint(type) + later <= remaining && within_card_limit(cfg, used[t] + 1)) {
                chosen = type;
                floor_index = t;
                break;
            }
        }
        ++used[card_type_index(chosen)];
        remaining -= footprint(chosen);
        out.cells_required += footprint(chosen);
        out.cards.push_back({chosen, i, 1, false});
    }
    return out;
}

promotion_result_t Degradation_engine::promote(Slot_grid grid, std::vector<column_assignment_t> columns) const
{
    promotion_result_t out;

    const utilization_t u = utilization(grid);
    const bool sparse = u.total_slots > 0 &&
        static_cast<double>(u.used_slots) < m_config.promotion_low_water * static_cast<double>(u.total_slots);

    if (!m_config.enable_promotion || !sparse) {
        out.grid = std::move(grid);
        out.columns = std::move(columns);
        return out;
    }

    int budget = static_cast<int>(std::floor(
        static_cast<double>(u.total_slots - u.used_slots) * m_config.promotion_budget));

    for (auto& col : columns) {
        if (col.cards.empty()) {
            continue;
        }
        const Card_type current = col.cards.front().type;
        const bool uniform = std::all_of(col.cards.begin(), col.cards.end(),
            [current](const planned_card_t& c) { return c.type == current; });
        const bool all_slotted = std::all_of(col.slotted.begin(), col.slotted.end(),
            [](bool s) { return s; });
        if (!uniform || !all_slotted || current == Card_type::FULL || !is_individual(current)) {
            continue;
        }

        const auto target = static_cast<Card_type>(card_type_index(current) - 1);
        const int n = static_cast<int>(col.cards.size());
        const int needed = n * footprint(target);
        const int extra = needed - n * footprint(current);
        if (needed > grid.capacity(col.column, col.side) || extra > budget) {
            continue;
        }

        Slot_grid next = grid;
        for (const auto& id : col.card_ids) {
            next = release(std::move(next), id);
        }
        bool ok = true;
        for (const auto& id : col.card_ids) {
            occupy_result_t r = occupy(std::move(next), col.column, target, id, col.side);
            ok = ok && r.success;
            next = std::move(r.grid);
        }
        if (!ok) {
            continue;
        }

        grid = std::move(next);
        for (auto& c : col.cards) {
            c.type = target;
            c.promoted = true;
        }
        budget -= extra;
        out.cells_spent += extra;
        ++out.promoted_groups;

        m_config.debug("cardline: promoted column " + std::to_string(col.column) + " " +
            to_string(col.side) + " from " + to_string(current) + " to " + to_string(target));
    }

    out.grid = std::move(grid);
    out.columns = std::move(columns);
    return out;
}

degradation_metrics_t Degradation_engine::metrics(const std::vector<column_assignment_t>& columns) const
{
    degradation_metrics_t m;
    const double full_height = m_config.card(Card_type::FULL).height;

    for (const auto& col : columns) {
        if (col.cards.empty()) {
            continue;
        }
        ++m.total_groups;

        std::set<Card_type> types;
        std::size_t events = 0;
        double height = 0.0;
        Card_type lowest = Card_type::FULL;
        bool promoted = false;
        for (const auto& c : col.cards) {
            types.insert(c.type);
            ++m.cards_by_type[card_type_index(c.type)];
            events += c.event_count;
            height += m_config.card(c.type).height;
            if (is_lower_fidelity(c.type, lowest)) {
                lowest = c.type;
            }
            promoted = promoted || c.promoted;
        }

        ++m.groups_by_type[card_type_index(lowest)];
        if (types.size() > 1) {
            ++m.mixed_groups;
        }
        if (promoted) {
            ++m.promoted_groups;
        }
        m.degradation_level = std::max(m.degradation_level, static_cast<int>(card_type_index(lowest)));

        if (lowest != Card_type::FULL) {
            degradation_trigger_t trigger;
            trigger.cluster_id = col.cluster_id;
            trigger.column = col.column;
            trigger.side = col.side;
            trigger.event_count = events;
            trigger.selected = lowest;
            trigger.space_reclaimed_px = std::max(0.0, static_cast<double>(events) * full_height - height);
            m.space_reclaimed_px += trigger.space_reclaimed_px;
            m.triggers.push_back(std::move(trigger));
        }
    }

    m.has_infinite_cards = m.cards_by_type[card_type_index(Card_type::INFINITE)] > 0;
    return m;
}

} // namespace cardline
