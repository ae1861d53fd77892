#include <cardline/core/layout_validator.h>
#include <cardline/core/algo.h>
#include <cardline/core/constants.h>

#include <map>
#include <string>
#include <unordered_map>
#include <utility>

namespace cardline {

Layout_validator::Layout_validator(const Layout_config& config)
:
    m_config(config)
{
}

std::size_t Layout_validator::count_overlaps(
    const std::vector<positioned_card_t>& cards,
    std::vector<std::string>* descriptions)
{
    std::size_t count = 0;
    for (std::size_t i = 0; i < cards.size(); ++i) {
        for (std::size_t j = i + 1; j < cards.size(); ++j) {
            if (!rects_overlap(cards[i], cards[j])) {
                continue;
            }
            ++count;
            if (descriptions) {
                descriptions->push_back("cards " + cards[i].id + " and " + cards[j].id + " overlap");
            }
        }
    }
    return count;
}

validation_report_t Layout_validator::validate(const layout_result_t& result) const
{
    CARDLINE_PROFILE_SCOPE(m_config.profiler.get(), "cardline.validate");

    validation_report_t report;
    report.card_count = result.cards.size();

    report.overlap_count = count_overlaps(result.cards, &report.errors);

    for (const auto& card : result.cards) {
        report.represented_events += card.event_count;
        report.has_infinite_cards = report.has_infinite_cards || card.type == Card_type::INFINITE;
        report.has_multi_event_cards = report.has_multi_event_cards || card.type == Card_type::MULTI_EVENT;
    }

    check_events(result, report);
    check_capacity(result, report);
    check_degradation_order(result, report);
    check_viewport(result, report);

    report.is_valid = report.errors.empty();
    return report;
}

void Layout_validator::check_events(const layout_result_t& result, validation_report_t& report) const
{
    if (report.represented_events != result.accepted_event_count) {
        report.errors.push_back("cards represent " + std::to_string(report.represented_events) +
            " events, expected " + std::to_string(result.accepted_event_count));
    }

    std::unordered_map<std::string, int> seen;
    for (const auto& c : result.clusters) {
        for (const auto& e : c.events) {
            seen.emplace(e.id, 0);
        }
    }

    for (const auto& card : result.cards) {
        if (card.event_ids.size() != card.event_count) {
            report.errors.push_back("card " + card.id + " lists " + std::to_string(card.event_ids.size()) +
                " events but counts " + std::to_string(card.event_count));
        }

        const card_type_config_t& cfg = m_config.card(card.type);
        bool count_ok = card.event_count >= 1;
        if (is_individual(card.type)) {
            count_ok = card.event_count == 1;
        }
        else if (card.type == Card_type::MULTI_EVENT && cfg.max_events_per_card > 0) {
            count_ok = count_ok && card.event_count <= static_cast<std::size_t>(cfg.max_events_per_card);
        }
        if (!count_ok) {
            report.errors.push_back("card " + card.id + " (" + to_string(card.type) + ") holds " +
                std::to_string(card.event_count) + " events");
        }

        for (const auto& id : card.event_ids) {
            auto it = seen.find(id);
            if (it == seen.end()) {
                report.errors.push_back("card " + card.id + " shows unknown event " + id);
                continue;
            }
            if (++it->second == 2) {
                report.errors.push_back("event " + id + " appears in more than one card");
            }
        }
    }

    for (const auto& c : result.clusters) {
        for (const auto& e : c.events) {
            if (seen[e.id] == 0) {
                report.errors.push_back("event " + e.id + " is not shown by any card");
            }
        }
    }
}

void Layout_validator::check_capacity(const layout_result_t& result, validation_report_t& report) const
{
    if (const auto problem = validate_occupancy(result.grid)) {
        report.errors.push_back("slot grid inconsistent: " + *problem);
    }

    for (const auto& card : result.cards) {
        if (!card.slotted) {
            report.warnings.push_back("card " + card.id + " has no reserved slots");
            continue;
        }
        const std::size_t held = result.grid.slots_of(card.id).size();
        const auto expected = static_cast<std::size_t>(result.grid.footprint(card.type));
        if (held != expected) {
            report.errors.push_back("card " + card.id + " holds " + std::to_string(held) +
                " slots, footprint is " + std::to_string(expected));
        }
    }
}

void Layout_validator::check_degradation_order(const layout_result_t& result, validation_report_t& report) const
{
    std::map<std::pair<int, Side>, std::vector<const positioned_card_t*>> groups;
    for (const auto& card : result.cards) {
        groups[{card.column, card.side}].push_back(&card);
    }

    for (const auto& [key, cards] : groups) {
        const std::string where = "column " + std::to_string(key.first) + " " + to_string(key.second);
        for (std::size_t i = 1; i < cards.size(); ++i) {
            const Card_type prev = cards[i - 1]->type;
            const Card_type cur = cards[i]->type;
            if (is_lower_fidelity(prev, cur)) {
                report.errors.push_back(where + ": " + to_string(cur) + " follows " + to_string(prev));
            }
            if (result.degradation_mode == Degradation_mode::UNIFORM &&
                is_individual(prev) && is_individual(cur) && prev != cur)
            {
                report.errors.push_back(where + ": mixes " + to_string(prev) + " and " + to_string(cur));
            }
        }
    }
}

void Layout_validator::check_viewport(const layout_result_t& result, validation_report_t& report) const
{
    const double eps = constants::k_eps;
    for (const auto& card : result.cards) {
        if (card.left() < -eps || card.right() > result.viewport.width + eps ||
            card.top() < -eps || card.bottom() > result.viewport.height + eps)
        {
            report.errors.push_back("card " + card.id + " extends outside the viewport");
        }
        else if (card.top() < m_config.header_safe_zone_px - eps) {
            report.errors.push_back("card " + card.id + " enters the header safe zone");
        }
    }
}

} // namespace cardline
