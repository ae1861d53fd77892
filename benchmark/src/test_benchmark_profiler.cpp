// cardline Benchmark - Profiler Tests

#include "benchmark_profiler.h"
#include "event_generator.h"

#include <cardline/cardline.h>

#include <iostream>
#include <memory>
#include <string>

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

// Test: Repeated scopes with the same name aggregate into one node
bool test_scope_aggregation() {
    Benchmark_profiler profiler;

    for (int i = 0; i < 4; ++i) {
        profiler.begin_scope("cardline.layout");
        profiler.end_scope();
    }

    TEST_ASSERT(profiler.root().children.size() == 1, "should have one child");
    const auto& scope = *profiler.root().children.at("cardline.layout");
    TEST_ASSERT(scope.call_count == 4, "call_count should be 4");
    TEST_ASSERT(scope.min_ms <= scope.max_ms, "min should be <= max");
    TEST_ASSERT(scope.total_ms >= 0.0, "total should be non-negative");

    return true;
}

// Test: Unbalanced end_scope is ignored
bool test_unbalanced_end() {
    Benchmark_profiler profiler;
    profiler.end_scope();

    profiler.begin_scope("outer");
    profiler.end_scope();
    profiler.end_scope();

    TEST_ASSERT(profiler.root().children.size() == 1, "only outer should exist");
    TEST_ASSERT(profiler.root().children.at("outer")->call_count == 1, "outer called once");
    return true;
}

// Test: Engine stages appear nested under the layout scope
bool test_engine_scopes() {
    auto profiler = std::make_shared<Benchmark_profiler>();

    cardline::Layout_config config = cardline::Layout_config::make_default();
    config.profiler = profiler;
    const cardline::Layout_engine engine(config);

    Event_generator::Config gen_config;
    gen_config.seed = 99;
    Event_generator gen(gen_config);
    const auto events = gen.generate(60);

    engine.layout(events, {1200.0, 800.0});
    engine.layout(events, {1200.0, 800.0});

    const auto& root = profiler->root();
    TEST_ASSERT(root.children.count("cardline.layout") == 1, "layout scope should exist");

    const auto& layout = *root.children.at("cardline.layout");
    TEST_ASSERT(layout.call_count == 2, "layout should run twice");
    for (const char* stage : {"cardline.layout.accept", "cardline.layout.bounds",
                              "cardline.layout.distribution", "cardline.layout.clustering",
                              "cardline.layout.assembly"}) {
        TEST_ASSERT(layout.children.count(stage) == 1, std::string("missing stage ") + stage);
        TEST_ASSERT(layout.children.at(stage)->call_count == 2, std::string("stage count ") + stage);
    }

    const auto& assembly = *layout.children.at("cardline.layout.assembly");
    TEST_ASSERT(assembly.children.count("cardline.layout.assembly.degradation") == 1,
        "degradation should nest under assembly");
    TEST_ASSERT(assembly.children.count("cardline.layout.assembly.promotion") == 1,
        "promotion should nest under assembly");

    return true;
}

// Test: Report lists metadata and short scope names
bool test_report_content() {
    Benchmark_profiler profiler;
    profiler.begin_scope("cardline.layout");
    profiler.begin_scope("cardline.layout.bounds");
    profiler.end_scope();
    profiler.end_scope();

    Report_metadata meta;
    meta.event_count = 42;
    meta.passes = 3;
    meta.seed = 7;
    meta.viewport_width = 1200.0;
    meta.viewport_height = 800.0;
    meta.mode = "mixed";
    meta.positioner = "single";

    const std::string report = profiler.generate_report(meta);
    TEST_ASSERT(report.find("cardline profiling report") != std::string::npos, "missing title");
    TEST_ASSERT(report.find("events: 42") != std::string::npos, "missing event count");
    TEST_ASSERT(report.find("mode: mixed") != std::string::npos, "missing mode");
    TEST_ASSERT(report.find("positioner: single") != std::string::npos, "missing positioner");
    TEST_ASSERT(report.find("viewport: 1200x800") != std::string::npos, "missing viewport");
    TEST_ASSERT(report.find("`- layout") != std::string::npos, "missing root scope row");
    TEST_ASSERT(report.find("   `- bounds") != std::string::npos, "missing nested row");
    TEST_ASSERT(report.find("cardline.layout.bounds") == std::string::npos, "rows should use short names");

    return true;
}

// Test: Reset clears the tree
bool test_reset() {
    Benchmark_profiler profiler;
    profiler.begin_scope("a");
    profiler.begin_scope("b");
    profiler.end_scope();
    profiler.end_scope();

    profiler.reset();
    TEST_ASSERT(profiler.root().children.empty(), "children should be cleared");
    TEST_ASSERT(profiler.root().call_count == 0, "root count should be 0");

    profiler.begin_scope("c");
    profiler.end_scope();
    TEST_ASSERT(profiler.root().children.count("c") == 1, "profiler usable after reset");

    return true;
}

int main() {
    std::cout << "Benchmark Profiler Test Suite\n";
    std::cout << "=============================\n\n";

    int passed = 0;
    int failed = 0;

    RUN_TEST(test_scope_aggregation);
    RUN_TEST(test_unbalanced_end);
    RUN_TEST(test_engine_scopes);
    RUN_TEST(test_report_content);
    RUN_TEST(test_reset);

    std::cout << "\n=============================\n";
    std::cout << "Results: " << passed << " passed, " << failed << " failed\n";

    return failed > 0 ? 1 : 0;
}
