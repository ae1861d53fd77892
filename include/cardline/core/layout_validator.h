#pragma once
// Cardline - Layout Validator
// Read-only diagnostics for a finished layout. Problems are reported, never
// thrown; the layout stays usable so the host can decide what to do.

#include "layout_config.h"
#include "layout_result.h"

#include <cstddef>
#include <string>
#include <vector>

namespace cardline {

struct validation_report_t
{
    bool                     is_valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    std::size_t overlap_count         = 0;
    std::size_t represented_events    = 0;  ///< Sum of card event counts
    std::size_t card_count            = 0;
    bool        has_infinite_cards    = false;
    bool        has_multi_event_cards = false;
};

class Layout_validator
{
public:
    explicit Layout_validator(const Layout_config& config);

    // Errors: overlapping cards, events missing or repeated, card event counts
    // out of range, slot capacity exceeded, inconsistent slot grid, card types
    // out of degradation order, cards outside the viewport or inside the
    // header safe zone. Warnings: unslotted cards.
    validation_report_t validate(const layout_result_t& result) const;

    // O(n^2) pairwise check; returns the number of overlapping pairs.
    static std::size_t count_overlaps(
        const std::vector<positioned_card_t>& cards,
        std::vector<std::string>* descriptions = nullptr);

private:
    void check_events(const layout_result_t& result, validation_report_t& report) const;
    void check_capacity(const layout_result_t& result, validation_report_t& report) const;
    void check_degradation_order(const layout_result_t& result, validation_report_t& report) const;
    void check_viewport(const layout_result_t& result, validation_report_t& report) const;

    Layout_config m_config;
};

} // namespace cardline
