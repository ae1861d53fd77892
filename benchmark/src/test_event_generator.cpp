// cardline Benchmark - Event Generator Tests

#include "event_generator.h"

#include <cardline/core/algo.h>

#include <iostream>
#include <set>
#include <vector>

using namespace cardline::benchmark;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " at line " << __LINE__ << std::endl; \
            return false; \
        } \
    } while(0)

#define RUN_TEST(test_fn) \
    do { \
        std::cout << "Running " << #test_fn << "... "; \
        if (test_fn()) { \
            std::cout << "PASS" << std::endl; \
            ++passed; \
        } else { \
            std::cout << "FAIL" << std::endl; \
            ++failed; \
        } \
    } while(0)

// Test: Default configuration
bool test_default_config() {
    Event_generator::Config config;
    Event_generator gen(config);

    TEST_ASSERT(gen.current_ms() == config.start_ms, "should start at start_ms");
    TEST_ASSERT(gen.generated() == 0, "nothing generated yet");

    return true;
}

// Test: Generated events are well formed and parse back
bool test_events_parse() {
    Event_generator::Config config;
    config.seed = 42;
    config.time_of_day_probability = 0.5;
    Event_generator gen(config);

    const auto events = gen.generate(200);
    TEST_ASSERT(events.size() == 200, "should generate 200 events");

    std::set<std::string> ids;
    int with_time = 0;
    for (const auto& e : events) {
        TEST_ASSERT(!e.id.empty(), "id should not be empty");
        TEST_ASSERT(!e.title.empty(), "title should not be empty");
        TEST_ASSERT(ids.insert(e.id).second, "ids should be unique");
        TEST_ASSERT(cardline::parse_date_ms(e.date).has_value(), "date should parse: " << e.date);
        TEST_ASSERT(cardline::event_timestamp_ms(e).has_value(), "event should have a timestamp");
        if (e.time) {
            ++with_time;
            TEST_ASSERT(e.time->size() == 5, "time should be HH:MM");
        }
    }
    TEST_ASSERT(with_time > 0, "some events should carry a time of day");
    TEST_ASSERT(with_time < 200, "some events should be date-only");

    return true;
}

// Test: Dates never go backwards
bool test_chronological() {
    Event_generator::Config config;
    config.seed = 7;
    Event_generator gen(config);

    const auto events = gen.generate(500);
    int64_t prev = 0;
    for (const auto& e : events) {
        const auto day = cardline::parse_date_ms(e.date);
        TEST_ASSERT(day.has_value(), "date should parse");
        TEST_ASSERT(*day >= prev, "dates should be non-decreasing");
        prev = *day;
    }

    return true;
}

// Test: Same seed produces same timeline
bool test_reproducibility() {
    Event_generator::Config config;
    config.seed = 12345;

    Event_generator a(config);
    Event_generator b(config);
    const auto ea = a.generate(100);
    const auto eb = b.generate(100);

    for (std::size_t i = 0; i < ea.size(); ++i) {
        TEST_ASSERT(ea[i].id == eb[i].id, "ids should match");
        TEST_ASSERT(ea[i].date == eb[i].date, "dates should match");
        TEST_ASSERT(ea[i].time == eb[i].time, "times should match");
    }

    return true;
}

// Test: Reset replays the same sequence
bool test_reset() {
    Event_generator::Config config;
    config.seed = 3;
    Event_generator gen(config);

    const auto first = gen.generate(50);
    gen.reset();
    TEST_ASSERT(gen.generated() == 0, "counter should reset");
    TEST_ASSERT(gen.current_ms() == config.start_ms, "time should reset");

    const auto second = gen.generate(50);
    for (std::size_t i = 0; i < first.size(); ++i) {
        TEST_ASSERT(first[i].date == second[i].date, "dates should replay after reset");
    }

    return true;
}

// Test: Bursts pack more events into the same span
bool test_bursts_compress() {
    Event_generator::Config calm;
    calm.seed = 11;
    calm.burst_probability = 0.0;

    Event_generator::Config bursty = calm;
    bursty.burst_probability = 1.0;

    Event_generator gen_calm(calm);
    Event_generator gen_bursty(bursty);
    gen_calm.generate(300);
    gen_bursty.generate(300);

    TEST_ASSERT(gen_bursty.current_ms() - bursty.start_ms < gen_calm.current_ms() - calm.start_ms,
        "bursty timeline should span less time");

    return true;
}

int main() {
    std::cout << "Event Generator Test Suite\n";
    std::cout << "==========================\n\n";

    int passed = 0;
    int failed = 0;

    RUN_TEST(test_default_config);
    RUN_TEST(test_events_parse);
    RUN_TEST(test_chronological);
    RUN_TEST(test_reproducibility);
    RUN_TEST(test_reset);
    RUN_TEST(test_bursts_compress);

    std::cout << "\n==========================\n";
    std::cout << "Results: " << passed << " passed, " << failed << " failed\n";

    return failed > 0 ? 1 : 0;
}
