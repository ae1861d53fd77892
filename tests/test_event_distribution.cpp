// cardline event distribution tests

#include <cardline/core/constants.h>
#include <cardline/core/event_distribution.h>
#include <cardline/core/layout_config.h>
#include <cardline/core/timeline_bounds.h>

#include <cmath>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace cl = cardline;
namespace k = cardline::constants;

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

constexpr int64_t k_day = k::k_ms_per_day;
constexpr int64_t k_base = 1704067200000;  // 2024-01-01

bool near(double a, double b, double eps = 1e-9)
{
    return std::abs(a - b) <= eps;
}

std::vector<cl::timed_event_t> events_at_days(const std::vector<int64_t>& days)
{
    std::vector<cl::timed_event_t> out;
    for (std::size_t i = 0; i < days.size(); ++i) {
        cl::timed_event_t e;
        e.id = "e" + std::to_string(i);
        e.timestamp_ms = k_base + days[i] * k_day;
        e.input_index = i;
        out.push_back(e);
    }
    return out;
}

// Window [start_day, end_day] mapped onto a 1200 px viewport (1088 px timeline).
cl::viewport_mapping_t mapping_for(int64_t start_day, int64_t end_day, double width = 1200.0)
{
    cl::timeline_bounds_t b;
    b.start_ms = k_base + start_day * k_day;
    b.end_ms = k_base + end_day * k_day;
    b.base_duration_ms = b.end_ms - b.start_ms;
    b.unzoomed_duration_ms = b.base_duration_ms;
    const cl::Timeline_bounds_calculator calc(cl::Layout_config::make_default());
    return calc.make_mapping(b, width);
}

bool test_positions_follow_time()
{
    const cl::Event_distribution_engine engine(cl::Layout_config::make_default());
    const auto mapping = mapping_for(0, 100);
    const auto out = engine.distribute(events_at_days({0, 50, 100}), mapping);

    TEST_ASSERT(out.size() == 3, "all events distributed");
    TEST_ASSERT(near(out[0].x, 56.0), "first at left edge");
    TEST_ASSERT(near(out[1].x, 600.0), "middle event at center");
    TEST_ASSERT(near(out[2].x, 1144.0), "last at right edge");
    return true;
}

bool test_sorted_and_stable()
{
    const cl::Event_distribution_engine engine(cl::Layout_config::make_default());
    const auto mapping = mapping_for(0, 100);
    const auto out = engine.distribute(events_at_days({30, 10, 30, 20}), mapping);

    TEST_ASSERT(out[0].id == "e1", "earliest first");
    TEST_ASSERT(out[1].id == "e3", "second");
    TEST_ASSERT(out[2].id == "e0", "equal timestamps keep input order");
    TEST_ASSERT(out[3].id == "e2", "equal timestamps keep input order");
    TEST_ASSERT(out[2].input_index == 0, "input index carried");
    return true;
}

bool test_out_of_window_events_are_pinned()
{
    const cl::Event_distribution_engine engine(cl::Layout_config::make_default());
    const auto mapping = mapping_for(10, 20);
    const auto out = engine.distribute(events_at_days({0, 30}), mapping);

    TEST_ASSERT(near(out[0].x, mapping.left_edge()), "before window pinned to left edge");
    TEST_ASSERT(near(out[1].x, mapping.right_edge()), "after window pinned to right edge");
    return true;
}

bool test_density_window_is_inclusive()
{
    const cl::Event_distribution_engine engine(cl::Layout_config::make_default());
    const auto mapping = mapping_for(-30, 80);
    const auto out = engine.distribute(events_at_days({0, 10, 25, 40}), mapping);

    // +-15 days around each event
    TEST_ASSERT(near(out[0].density, 2.0 / 30.0), "day 0 sees days 0 and 10");
    TEST_ASSERT(near(out[1].density, 3.0 / 30.0), "day 10 sees days 0, 10 and 25");
    TEST_ASSERT(near(out[2].density, 3.0 / 30.0), "day 25 sees days 10, 25 and 40");
    TEST_ASSERT(near(out[3].density, 2.0 / 30.0), "day 40 sees days 25 and 40");
    return true;
}

bool test_spacing_pass()
{
    const cl::Event_distribution_engine engine(cl::Layout_config::make_default());
    const auto mapping = mapping_for(0, 100);

    std::vector<int64_t> days(12, 50);
    const auto out = engine.distribute(events_at_days(days), mapping);

    TEST_ASSERT(engine.needs_spacing(12, mapping), "12 events need spacing");
    for (std::size_t i = 1; i < out.size(); ++i) {
        TEST_ASSERT(near(out[i].x - out[i - 1].x, 8.0), "minimum pitch between neighbors");
    }
    TEST_ASSERT(near(out[0].x, 600.0), "first event keeps its position");
    return true;
}

bool test_spacing_capped_at_right_edge()
{
    const cl::Event_distribution_engine engine(cl::Layout_config::make_default());
    const auto mapping = mapping_for(0, 100);

    std::vector<int64_t> days(10, 100);
    const auto out = engine.distribute(events_at_days(days), mapping);
    for (const auto& e : out) {
        TEST_ASSERT(e.x <= mapping.right_edge() + 1e-9, "never pushed past the right edge");
    }
    return true;
}

bool test_no_spacing_for_small_sets()
{
    const cl::Event_distribution_engine engine(cl::Layout_config::make_default());
    const auto mapping = mapping_for(0, 100);

    TEST_ASSERT(!engine.needs_spacing(1, mapping), "single event");
    TEST_ASSERT(!engine.needs_spacing(2, mapping), "two events");
    TEST_ASSERT(!engine.needs_spacing(4, mapping), "four events fit one column");

    const auto out = engine.distribute(events_at_days({50, 50}), mapping);
    TEST_ASSERT(near(out[0].x, out[1].x), "two simultaneous events keep the same x");
    return true;
}

bool test_space_allocation()
{
    const cl::Event_distribution_engine engine(cl::Layout_config::make_default());
    const auto mapping = mapping_for(0, 100);

    const auto a = engine.space_allocation(25, mapping);
    TEST_ASSERT(a.recommended_column_count == 3, "870 px fit three 220 px columns");
    TEST_ASSERT(a.column_width_px == 200.0, "base column width");
    TEST_ASSERT(a.spacing_px == 20.0, "base gap");

    const auto one = engine.space_allocation(3, mapping);
    TEST_ASSERT(one.recommended_column_count == 1, "three events need one column");

    const auto none = engine.space_allocation(25, mapping_for(0, 100, 100.0));
    TEST_ASSERT(none.recommended_column_count == 0, "no room for columns");
    TEST_ASSERT(none.column_width_px == 200.0, "width falls back to base");
    return true;
}

bool test_density_levels()
{
    const cl::Event_distribution_engine engine(cl::Layout_config::make_default());
    const auto bounds = mapping_for(0, 10).bounds;

    TEST_ASSERT(engine.analyze_density(30, bounds).level == cl::Density_level::HIGH, "3 per day");
    TEST_ASSERT(engine.analyze_density(10, bounds).level == cl::Density_level::MEDIUM, "1 per day");
    TEST_ASSERT(engine.analyze_density(2, bounds).level == cl::Density_level::LOW, "0.2 per day");
    TEST_ASSERT(near(engine.analyze_density(30, bounds).events_per_day, 3.0), "events per day");

    cl::timeline_bounds_t empty;
    TEST_ASSERT(engine.analyze_density(5, empty).events_per_day == 0.0, "zero duration");
    return true;
}

bool test_metrics()
{
    const cl::Event_distribution_engine engine(cl::Layout_config::make_default());
    const auto mapping = mapping_for(0, 100);
    const auto out = engine.distribute(events_at_days({0, 50, 100}), mapping);
    const auto m = engine.calculate_metrics(out, mapping);

    TEST_ASSERT(m.total_events == 3, "total");
    TEST_ASSERT(near(m.horizontal_utilization, 100.0), "spans the whole timeline");
    TEST_ASSERT(!m.spacing_applied, "no spacing for three events");
    TEST_ASSERT(near(m.min_density, 1.0 / 30.0), "min density");
    TEST_ASSERT(m.max_density >= m.average_density, "max >= average");

    const auto empty = engine.calculate_metrics({}, mapping);
    TEST_ASSERT(empty.total_events == 0, "empty metrics");
    return true;
}

bool test_empty_input()
{
    const cl::Event_distribution_engine engine(cl::Layout_config::make_default());
    TEST_ASSERT(engine.distribute({}, mapping_for(0, 10)).empty(), "nothing in, nothing out");
    return true;
}

} // namespace

int main()
{
    int passed = 0;
    int failed = 0;

    RUN_TEST(test_positions_follow_time);
    RUN_TEST(test_sorted_and_stable);
    RUN_TEST(test_out_of_window_events_are_pinned);
    RUN_TEST(test_density_window_is_inclusive);
    RUN_TEST(test_spacing_pass);
    RUN_TEST(test_spacing_capped_at_right_edge);
    RUN_TEST(test_no_spacing_for_small_sets);
    RUN_TEST(test_space_allocation);
    RUN_TEST(test_density_levels);
    RUN_TEST(test_metrics);
    RUN_TEST(test_empty_input);

    std::cout << "\nResults: " << passed << " passed, " << failed << " failed" << std::endl;
    return failed > 0 ? 1 : 0;
}
