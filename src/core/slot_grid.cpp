#include <cardline/core/slot_grid.h>

#include <algorithm>
#include <string>

namespace cardline {

Slot_grid::Slot_grid(const card_type_table_t& card_types, const std::vector<pool_spec_t>& pools)
:
    m_card_types(card_types)
{
    for (const auto& spec : pools) {
        if (find_pool(spec.column, spec.side)) {
            continue;
        }

        side_pool_t pool;
        pool.column = spec.column;
        pool.side = spec.side;
        pool.capacity = std::max(0, spec.capacity);
        pool.first_slot = m_slots.size();
        m_pools.push_back(pool);

        // Rows grow away from the axis: upward above it, downward below it.
        const double dir = spec.side == Side::ABOVE ? -1.0 : 1.0;
        for (int row = 0; row < pool.capacity; ++row) {
            slot_t slot;
            slot.position = glm::dvec2(spec.center_x, spec.first_row_y + dir * spec.row_pitch * row);
            slot.side = spec.side;
            slot.column = spec.column;
            slot.row = row;
            m_slots.push_back(slot);
        }
    }
}

const side_pool_t* Slot_grid::find_pool(int column, Side side) const
{
    for (const auto& p : m_pools) {
        if (p.column == column && p.side == side) {
            return &p;
        }
    }
    return nullptr;
}

side_pool_t* Slot_grid::find_pool_mut(int column, Side side)
{
    return const_cast<side_pool_t*>(static_cast<const Slot_grid&>(*this).find_pool(column, side));
}

int Slot_grid::footprint(Card_type type) const
{
    return std::max(0, m_card_types[card_type_index(type)].footprint_cells);
}

int Slot_grid::capacity(int column, Side side) const
{
    const side_pool_t* p = find_pool(column, side);
    return p ? p->capacity : 0;
}

int Slot_grid::available(int column, Side side) const
{
    const side_pool_t* p = find_pool(column, side);
    return p ? p->capacity - p->occupied : 0;
}

int Slot_grid::total_slots() const
{
    int total = 0;
    for (const auto& p : m_pools) {
        total += p.capacity;
    }
    return total;
}

int Slot_grid::used_slots() const
{
    int used = 0;
    for (const auto& p : m_pools) {
        used += p.occupied;
    }
    return used;
}

std::vector<std::size_t> Slot_grid::slots_of(const std::string& card_id) const
{
    std::vector<std::size_t> out;
    for (std::size_t i = 0; i < m_slots.size(); ++i) {
        if (m_slots[i].occupied && m_slots[i].card_id == card_id) {
            out.push_back(i);
        }
    }
    return out;
}

// -----------------------------------------------------------------------------
// Operations
// -----------------------------------------------------------------------------

availability_t check_availability(const Slot_grid& grid, int column, Card_type type, Side side)
{
    availability_t out;
    out.required = grid.footprint(type);
    const side_pool_t* pool = grid.find_pool(column, side);
    if (!pool) {
        return out;
    }
    out.capacity = pool->capacity;
    out.available = pool->capacity - pool->occupied;
    out.can_fit = out.required <= out.available;
    return out;
}

occupy_result_t occupy(Slot_grid grid, int column, Card_type type,
                       const std::string& card_id, Side side)
{
    occupy_result_t result;

    const availability_t avail = check_availability(grid, column, type, side);
    if (!grid.find_pool(column, side)) {
        result.reason = "no pool for column " + std::to_string(column) + " " + to_string(side);
    }
    else if (!avail.can_fit) {
        result.reason = "need " + std::to_string(avail.required) + " slots, " +
                        std::to_string(avail.available) + " free";
    }
    else if (card_id.empty() || !grid.slots_of(card_id).empty()) {
        result.reason = "card id '" + card_id + "' is empty or already placed";
    }

    if (!result.reason.empty()) {
        result.grid = std::move(grid);
        return result;
    }

    side_pool_t* pool = grid.find_pool_mut(column, side);
    int remaining = avail.required;
    for (int row = 0; row < pool->capacity && remaining > 0; ++row) {
        const std::size_t idx = pool->first_slot + static_cast<std::size_t>(row);
        slot_t& slot = grid.m_slots[idx];
        if (slot.occupied) {
            continue;
        }
        slot.occupied = true;
        slot.card_id = card_id;
        slot.card_type = type;
        result.slot_indices.push_back(idx);
        --remaining;
    }
    pool->occupied += avail.required;

    result.success = true;
    result.grid = std::move(grid);
    return result;
}

Slot_grid release(Slot_grid grid, const std::string& card_id)
{
    for (auto& pool : grid.m_pools) {
        for (int row = 0; row < pool.capacity; ++row) {
            slot_t& slot = grid.m_slots[pool.first_slot + static_cast<std::size_t>(row)];
            if (slot.occupied && slot.card_id == card_id) {
                slot.occupied = false;
                slot.card_id.clear();
                slot.card_type = Card_type::FULL;
                --pool.occupied;
            }
        }
    }
    return grid;
}

utilization_t utilization(const Slot_grid& grid)
{
    utilization_t u;
    u.total_slots = grid.total_slots();
    u.used_slots = grid.used_slots();
    u.percentage = u.total_slots > 0
        ? static_cast<double>(u.used_slots) / static_cast<double>(u.total_slots) * 100.0
        : 0.0;
    return u;
}

std::optional<std::string> validate_occupancy(const Slot_grid& grid)
{
    for (const auto& pool : grid.pools()) {
        int flags = 0;
        for (int row = 0; row < pool.capacity; ++row) {
            if (grid.slots()[pool.first_slot + static_cast<std::size_t>(row)].occupied) {
                ++flags;
            }
        }

        const std::string where = "column " + std::to_string(pool.column) + " " + to_string(pool.side);
        if (flags != pool.occupied) {
            return where + ": occupied count " + std::to_string(pool.occupied) +
                   " differs from " + std::to_string(flags) + " occupied slots";
        }
        if (pool.occupied > pool.capacity) {
            return where + ": " + std::to_string(pool.occupied) + " slots used of " +
                   std::to_string(pool.capacity);
        }
    }
    return std::nullopt;
}

} // namespace cardline
