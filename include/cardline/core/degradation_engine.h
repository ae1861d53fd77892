#pragma once
// Cardline - Degradation Engine
// Chooses card types per half-column so its events fit the slot budget,
// and promotes half-columns back up when the whole layout is sparse.

#include "layout_config.h"
#include "slot_grid.h"
#include "types.h"

#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace cardline {

/// A card chosen for a run of consecutive (chronological) events
struct planned_card_t
{
    Card_type   type        = Card_type::FULL;
    std::size_t first_event = 0;
    std::size_t event_count = 0;
    bool        promoted    = false;
};

/// Outcome of planning one half-column
struct degradation_plan_t
{
    std::vector<planned_card_t> cards;
    int  cells_required = 0;
    bool fits           = true;   ///< False only when not even an infinite card fits
};

/// Cards assigned to one side of one column
struct column_assignment_t
{
    int                         column = 0;
    Side                        side   = Side::ABOVE;
    std::string                 cluster_id;
    std::vector<planned_card_t> cards;
    std::vector<std::string>    card_ids;   ///< Parallel to `cards`
    std::vector<bool>           slotted;    ///< Parallel to `cards`
};

struct degradation_trigger_t
{
    std::string cluster_id;
    int         column            = 0;
    Side        side              = Side::ABOVE;
    std::size_t event_count       = 0;
    Card_type   selected          = Card_type::FULL;
    double      space_reclaimed_px = 0.0;  ///< Height saved against all-full cards
};

struct degradation_metrics_t
{
    std::size_t total_groups = 0;
    std::array<std::size_t, k_card_type_count> groups_by_type{};  ///< Keyed by lowest type in the group
    std::array<std::size_t, k_card_type_count> cards_by_type{};
    std::vector<degradation_trigger_t> triggers;
    double      space_reclaimed_px = 0.0;
    std::size_t promoted_groups    = 0;
    int         promotion_cells    = 0;
    std::size_t mixed_groups       = 0;
    int         degradation_level  = 0;    ///< 0 full only ... 4 infinite present
    bool        has_infinite_cards = false;
};

struct promotion_result_t
{
    Slot_grid                        grid;
    std::vector<column_assignment_t> columns;
    std::size_t                      promoted_groups = 0;
    int                              cells_spent     = 0;
};

// -----------------------------------------------------------------------------
// Degradation Engine
// -----------------------------------------------------------------------------
// Deterministic: the same counts and capacities always give the same plan.
// Never fails; a zero capacity still yields a single infinite card.
class Degradation_engine
{
public:
    Degradation_engine(const Layout_config& config, Degradation_mode mode);

    [[nodiscard]] Degradation_mode mode() const noexcept { return m_mode; }

    // Cards for `event_count` events with `capacity` free cells on one side.
    degradation_plan_t plan(std::size_t event_count, int capacity) const;

    // First type in the cascade whose uniform use fits, or MULTI_EVENT when
    // only the summary types fit.
    Card_type uniform_type_for(std::size_t event_count, int capacity) const;

    // Runs when global utilization is below the low-water mark: uniform
    // half-columns move one step up (title-only to compact, compact to full)
    // while the footprint fits and the budget lasts, left to right.
    promotion_result_t promote(Slot_grid grid, std::vector<column_assignment_t> columns) const;

    degradation_metrics_t metrics(const std::vector<column_assignment_t>& columns) const;

private:
    int  footprint(Card_type type) const;
    bool fits_uniform(Card_type type, std::size_t event_count, int capacity) const;
    degradation_plan_t plan_uniform(std::size_t event_count, int capacity) const;
    degradation_plan_t plan_mixed(std::size_t event_count, int capacity) const;
    degradation_plan_t plan_summary(std::size_t event_count, int capacity) const;

    Layout_config    m_config;
    Degradation_mode m_mode;
};

} // namespace cardline
