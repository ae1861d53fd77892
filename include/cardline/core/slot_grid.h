#pragma once
// Cardline - Slot Grid
// Per-column pools of fixed-size slots above and below the axis.
//
// Slot_grid is a value type. Operations that change occupancy take a grid
// and return a new one, so callers always hold an explicit state and
// failed operations leave nothing half-applied.

#include "layout_config.h"
#include "types.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace cardline {

/// Description of one side pool used to build a grid
struct pool_spec_t
{
    int    column      = 0;
    Side   side        = Side::ABOVE;
    double center_x    = 0.0;
    int    capacity    = 0;
    double first_row_y = 0.0;   ///< Center y of the row nearest the axis
    double row_pitch   = 0.0;   ///< Distance between row centers (away from the axis)
};

/// One side of one column
struct side_pool_t
{
    int         column     = 0;
    Side        side       = Side::ABOVE;
    int         capacity   = 0;
    int         occupied   = 0;
    std::size_t first_slot = 0;   ///< Index into Slot_grid::slots()
};

struct availability_t
{
    bool can_fit   = false;
    int  required  = 0;
    int  available = 0;
    int  capacity  = 0;
};

struct occupy_result_t;

// -----------------------------------------------------------------------------
// Slot Grid
// -----------------------------------------------------------------------------
class Slot_grid
{
public:
    Slot_grid() = default;
    Slot_grid(const card_type_table_t& card_types, const std::vector<pool_spec_t>& pools);

    [[nodiscard]] const std::vector<slot_t>& slots() const noexcept { return m_slots; }
    [[nodiscard]] const std::vector<side_pool_t>& pools() const noexcept { return m_pools; }
    [[nodiscard]] bool empty() const noexcept { return m_pools.empty(); }

    [[nodiscard]] const side_pool_t* find_pool(int column, Side side) const;
    [[nodiscard]] int footprint(Card_type type) const;
    [[nodiscard]] int capacity(int column, Side side) const;
    [[nodiscard]] int available(int column, Side side) const;
    [[nodiscard]] int total_slots() const;
    [[nodiscard]] int used_slots() const;

    // Slots held by a card, in row order.
    [[nodiscard]] std::vector<std::size_t> slots_of(const std::string& card_id) const;

    friend occupy_result_t occupy(Slot_grid grid, int column, Card_type type,
                                  const std::string& card_id, Side side);
    friend Slot_grid release(Slot_grid grid, const std::string& card_id);

private:
    side_pool_t* find_pool_mut(int column, Side side);

    card_type_table_t        m_card_types{};
    std::vector<slot_t>      m_slots;
    std::vector<side_pool_t> m_pools;
};

struct occupy_result_t
{
    bool                     success = false;
    Slot_grid                grid;       ///< Unchanged input grid on failure
    std::vector<std::size_t> slot_indices;
    std::string              reason;
};

// Whether a card of `type` fits on one side of a column. No mutation.
availability_t check_availability(const Slot_grid& grid, int column, Card_type type, Side side);

// Reserves the type's footprint for `card_id` using the free rows nearest
// the axis. Fails without mutation when not enough slots are free, the pool
// does not exist, or the id is already placed.
occupy_result_t occupy(Slot_grid grid, int column, Card_type type,
                       const std::string& card_id, Side side);

// Frees every slot held by `card_id`.
Slot_grid release(Slot_grid grid, const std::string& card_id);

utilization_t utilization(const Slot_grid& grid);

// Checks that each pool's cached occupied count equals its occupied flags
// and never exceeds its capacity. Returns a description of the first
// violation, or nothing when consistent.
std::optional<std::string> validate_occupancy(const Slot_grid& grid);

} // namespace cardline
