#pragma once
// Cardline - Positioners
// Strategies that turn clusters into columns: where each column sits on the
// x axis, which side(s) it uses and which events it carries.

#include "layout_config.h"
#include "types.h"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace cardline {

/// Inputs shared by all positioners
struct placement_context_t
{
    double viewport_width  = 0.0;
    double card_width      = 0.0;   ///< Widest card type
    double column_spacing  = 0.0;

    [[nodiscard]] double column_pitch() const noexcept { return card_width + column_spacing; }
};

/// One side of one column with the events it must show
struct column_plan_t
{
    int                              column   = 0;
    Side                             side     = Side::ABOVE;
    double                           center_x = 0.0;
    std::string                      cluster_id;              ///< Cluster that opened the column
    std::vector<distributed_event_t> events;                  ///< Chronological
    std::size_t                      overflow_count = 0;      ///< Events carried over from merged clusters
    std::vector<std::string>         merged_cluster_ids;
};

// -----------------------------------------------------------------------------
// Positioner Interface
// -----------------------------------------------------------------------------
// Columns within a track are at least one pitch apart. A cluster whose column
// would leave the viewport is merged into the previous column of its track.
class Positioner
{
public:
    virtual ~Positioner() = default;

    [[nodiscard]] virtual Positioner_kind kind() const noexcept = 0;

    // Plans are ordered by column index, above before below.
    [[nodiscard]] virtual std::vector<column_plan_t> plan_columns(
        const std::vector<cluster_t>& clusters,
        const placement_context_t& context) const = 0;
};

// One column per cluster; the first half of its events (rounded up) go
// above the axis, the rest below.
class Single_column_positioner : public Positioner
{
public:
    Positioner_kind kind() const noexcept override { return Positioner_kind::SINGLE_COLUMN; }

    std::vector<column_plan_t> plan_columns(
        const std::vector<cluster_t>& clusters,
        const placement_context_t& context) const override;
};

// Clusters alternate between an above track and a below track; each cluster
// fills one half-column and the two tracks are spaced independently.
class Dual_column_positioner : public Positioner
{
public:
    Positioner_kind kind() const noexcept override { return Positioner_kind::DUAL_COLUMN; }

    std::vector<column_plan_t> plan_columns(
        const std::vector<cluster_t>& clusters,
        const placement_context_t& context) const override;
};

std::unique_ptr<Positioner> make_positioner(Positioner_kind kind);

} // namespace cardline
