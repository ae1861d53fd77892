#pragma once
// Cardline - Degradation Coordinator
// Assembles a layout from clusters: asks the positioner for columns, builds
// the slot grid, degrades and promotes card types, and stacks card
// rectangles outward from the axis. All slot mutation happens here.

#include "degradation_engine.h"
#include "layout_config.h"
#include "positioner.h"
#include "slot_grid.h"
#include "types.h"

#include <cstddef>
#include <memory>
#include <vector>

namespace cardline {

class Degradation_coordinator
{
public:
    struct parameters_t
    {
        Size2d viewport;
        double axis_y         = 0.0;
        int    cells_per_side = 0;
    };

    struct result_t
    {
        std::vector<positioned_card_t>   cards;
        std::vector<cluster_t>           clusters;   ///< Input clusters with card ids and counts filled in
        std::vector<column_plan_t>       columns;
        std::vector<column_assignment_t> assignments;
        Slot_grid                        grid;
        degradation_metrics_t            degradation;
        std::size_t                      merged_clusters = 0;
    };

    Degradation_coordinator(
        const Layout_config& config,
        Degradation_mode mode,
        std::shared_ptr<const Positioner> positioner);

    result_t assemble(std::vector<cluster_t> clusters, const parameters_t& params) const;

    [[nodiscard]] const Positioner& positioner() const noexcept { return *m_positioner; }
    [[nodiscard]] const Degradation_engine& degradation() const noexcept { return m_degradation; }

private:
    Slot_grid build_grid(const std::vector<column_plan_t>& plans, const parameters_t& params) const;

    std::vector<positioned_card_t> stack_cards(
        const std::vector<column_plan_t>& plans,
        const std::vector<column_assignment_t>& assignments,
        double axis_y) const;

    Layout_config                     m_config;
    Degradation_engine                m_degradation;
    std::shared_ptr<const Positioner> m_positioner;
};

} // namespace cardline
