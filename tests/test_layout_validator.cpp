// cardline layout validator tests

#include <cardline/core/layout_engine.h>
#include <cardline/core/layout_validator.h>

#include <iostream>
#include <string>
#include <vector>

namespace cl = cardline;

namespace {

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " (line " << __LINE__ << ")" << std::endl; \
            return false; \
        } \
    } while (0)

#define RUN_TEST(test_fn) \
    do { \
        std::cout << "Running " << #test_fn << "... "; \
        if (test_fn()) { \
            std::cout << "OK" << std::endl; \
            ++passed; \
        } else { \
            std::cout << "FAIL" << std::endl; \
            ++failed; \
        } \
    } while (0)

cl::event_t make_event(const std::string& id, const std::string& date)
{
    cl::event_t e;
    e.id = id;
    e.date = date;
    e.title = "Event " + id;
    return e;
}

// Three events on one day: a single column of three compact cards above the axis.
cl::layout_result_t compact_column()
{
    const cl::Layout_engine engine;
    return engine.layout(
        {make_event("a", "2024-03-01"), make_event("b", "2024-03-01"), make_event("c", "2024-03-01")},
        cl::Size2d(1200.0, 800.0));
}

bool has_message(const std::vector<std::string>& messages, const std::string& needle)
{
    for (const auto& m : messages) {
        if (m.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

cl::positioned_card_t rect(const std::string& id, double x, double y, double w, double h)
{
    cl::positioned_card_t c;
    c.id = id;
    c.position = glm::dvec2(x, y);
    c.size = glm::dvec2(w, h);
    return c;
}

bool test_engine_layout_is_valid()
{
    const cl::layout_result_t result = compact_column();
    TEST_ASSERT(result.cards.size() == 3, "three cards");

    const cl::Layout_validator validator(cl::Layout_config::make_default());
    const auto report = validator.validate(result);
    TEST_ASSERT(report.is_valid, "engine output is valid");
    TEST_ASSERT(report.errors.empty(), "no errors");
    TEST_ASSERT(report.warnings.empty(), "no warnings");
    TEST_ASSERT(report.card_count == 3, "card count");
    TEST_ASSERT(report.represented_events == 3, "represented events");
    TEST_ASSERT(report.overlap_count == 0, "no overlaps");
    TEST_ASSERT(!report.has_infinite_cards && !report.has_multi_event_cards, "individual cards only");
    return true;
}

bool test_missing_card_detected()
{
    cl::layout_result_t result = compact_column();
    result.cards.pop_back();

    const auto report = cl::Layout_validator(cl::Layout_config::make_default()).validate(result);
    TEST_ASSERT(!report.is_valid, "invalid");
    TEST_ASSERT(has_message(report.errors, "expected 3"), "coverage mismatch reported");
    TEST_ASSERT(has_message(report.errors, "is not shown by any card"), "missing event reported");
    return true;
}

bool test_duplicate_and_unknown_events()
{
    cl::layout_result_t result = compact_column();
    result.cards[1].event_ids.push_back(result.cards[0].event_ids[0]);
    result.cards[1].event_count = 2;
    result.cards[2].event_ids[0] = "ghost";

    const auto report = cl::Layout_validator(cl::Layout_config::make_default()).validate(result);
    TEST_ASSERT(!report.is_valid, "invalid");
    TEST_ASSERT(has_message(report.errors, "appears in more than one card"), "duplicate reported");
    TEST_ASSERT(has_message(report.errors, "unknown event ghost"), "unknown event reported");
    TEST_ASSERT(has_message(report.errors, "holds 2 events"), "individual card with two events");
    return true;
}

bool test_event_count_mismatch()
{
    cl::layout_result_t result = compact_column();
    result.cards[0].event_count = 0;
    result.accepted_event_count = 2;

    const auto report = cl::Layout_validator(cl::Layout_config::make_default()).validate(result);
    TEST_ASSERT(!report.is_valid, "invalid");
    TEST_ASSERT(has_message(report.errors, "lists 1 events but counts 0"), "list/count mismatch");
    return true;
}

bool test_multi_event_limit()
{
    cl::layout_result_t result = compact_column();
    auto& card = result.cards[0];
    card.type = cl::Card_type::MULTI_EVENT;
    for (int i = 0; i < 5; ++i) {
        card.event_ids.push_back("extra-" + std::to_string(i));
    }
    card.event_count = card.event_ids.size();

    const auto report = cl::Layout_validator(cl::Layout_config::make_default()).validate(result);
    TEST_ASSERT(report.has_multi_event_cards, "multi-event card seen");
    TEST_ASSERT(has_message(report.errors, "(multi-event) holds 6 events"), "more than five events");
    return true;
}

bool test_degradation_order()
{
    cl::layout_result_t result = compact_column();
    result.cards[0].type = cl::Card_type::TITLE_ONLY;

    const auto report = cl::Layout_validator(cl::Layout_config::make_default()).validate(result);
    TEST_ASSERT(!report.is_valid, "invalid");
    TEST_ASSERT(has_message(report.errors, "compact follows title-only"), "fidelity raised outward");
    return true;
}

bool test_uniform_mixing()
{
    cl::layout_result_t result = compact_column();
    result.cards[2].type = cl::Card_type::TITLE_ONLY;

    const cl::Layout_validator validator(cl::Layout_config::make_default());
    auto report = validator.validate(result);
    TEST_ASSERT(has_message(report.errors, "mixes compact and title-only"), "uniform column mixes types");
    TEST_ASSERT(!has_message(report.errors, "follows"), "order itself is fine");

    result.degradation_mode = cl::Degradation_mode::MIXED;
    report = validator.validate(result);
    TEST_ASSERT(!has_message(report.errors, "mixes"), "mixing allowed in mixed mode");
    TEST_ASSERT(has_message(report.errors, "footprint is 1"), "slots no longer match the type");
    return true;
}

bool test_slot_mismatch()
{
    cl::layout_result_t result = compact_column();
    result.grid = cl::release(result.grid, result.cards[1].id);

    const auto report = cl::Layout_validator(cl::Layout_config::make_default()).validate(result);
    TEST_ASSERT(!report.is_valid, "invalid");
    TEST_ASSERT(has_message(report.errors, "holds 0 slots, footprint is 2"), "released card reported");
    return true;
}

bool test_unslotted_is_a_warning()
{
    cl::layout_result_t result = compact_column();
    result.grid = cl::release(result.grid, result.cards[2].id);
    result.cards[2].slotted = false;

    const auto report = cl::Layout_validator(cl::Layout_config::make_default()).validate(result);
    TEST_ASSERT(report.is_valid, "still valid");
    TEST_ASSERT(has_message(report.warnings, "has no reserved slots"), "warning raised");
    return true;
}

bool test_card_outside_viewport()
{
    cl::layout_result_t result = compact_column();
    result.cards[0].position.x = -40.0;

    const auto report = cl::Layout_validator(cl::Layout_config::make_default()).validate(result);
    TEST_ASSERT(!report.is_valid, "outside the viewport is an error");
    TEST_ASSERT(report.errors.size() == 1, "one error");
    TEST_ASSERT(has_message(report.errors, "card " + result.cards[0].id + " extends outside the viewport"),
        "error text");
    TEST_ASSERT(report.warnings.empty(), "no warnings");
    return true;
}

bool test_card_in_header_zone()
{
    cl::layout_result_t result = compact_column();
    TEST_ASSERT(result.cards[2].top() >= 100.0, "engine keeps the header clear");

    result.cards[2].position.y = 60.0;
    const cl::Layout_validator validator(cl::Layout_config::make_default());
    auto report = validator.validate(result);
    TEST_ASSERT(!report.is_valid, "header intrusion is an error");
    TEST_ASSERT(has_message(report.errors, "enters the header safe zone"), "error text");

    // Touching the zone edge is fine.
    result.cards[2].position.y = 100.0;
    report = validator.validate(result);
    TEST_ASSERT(report.is_valid, "flush with the header");

    cl::Layout_config no_header = cl::Layout_config::make_default();
    no_header.header_safe_zone_px = 0.0;
    result.cards[2].position.y = 60.0;
    TEST_ASSERT(cl::Layout_validator(no_header).validate(result).is_valid, "zone size comes from the config");
    return true;
}

bool test_count_overlaps()
{
    std::vector<cl::positioned_card_t> cards = {
        rect("a", 0.0, 0.0, 100.0, 50.0),
        rect("b", 50.0, 25.0, 100.0, 50.0),    // overlaps a
        rect("c", 100.0, 0.0, 100.0, 30.0),    // shares an edge with a, overlaps b
        rect("d", 500.0, 500.0, 10.0, 10.0)
    };

    std::vector<std::string> descriptions;
    TEST_ASSERT(cl::Layout_validator::count_overlaps(cards, &descriptions) == 2, "two overlapping pairs");
    TEST_ASSERT(descriptions.size() == 2, "one description per pair");
    TEST_ASSERT(descriptions[0] == "cards a and b overlap", "description text");
    TEST_ASSERT(cl::Layout_validator::count_overlaps({}) == 0, "no cards");

    cl::layout_result_t result = compact_column();
    result.cards[1].position = result.cards[0].position;
    const auto report = cl::Layout_validator(cl::Layout_config::make_default()).validate(result);
    TEST_ASSERT(!report.is_valid && report.overlap_count == 1, "overlap makes the layout invalid");
    return true;
}

bool test_empty_layout()
{
    const cl::Layout_engine engine;
    const auto result = engine.layout({}, cl::Size2d(1200.0, 800.0));
    const auto report = engine.validate(result);
    TEST_ASSERT(report.is_valid, "empty layout is valid");
    TEST_ASSERT(report.card_count == 0, "no cards");
    return true;
}

} // namespace

int main()
{
    int passed = 0;
    int failed = 0;

    RUN_TEST(test_engine_layout_is_valid);
    RUN_TEST(test_missing_card_detected);
    RUN_TEST(test_duplicate_and_unknown_events);
    RUN_TEST(test_event_count_mismatch);
    RUN_TEST(test_multi_event_limit);
    RUN_TEST(test_degradation_order);
    RUN_TEST(test_uniform_mixing);
    RUN_TEST(test_slot_mismatch);
    RUN_TEST(test_unslotted_is_a_warning);
    RUN_TEST(test_card_outside_viewport);
    RUN_TEST(test_card_in_header_zone);
    RUN_TEST(test_count_overlaps);
    RUN_TEST(test_empty_layout);

    std::cout << "\nResults: " << passed << " passed, " << failed << " failed" << std::endl;
    return failed > 0 ? 1 : 0;
}
