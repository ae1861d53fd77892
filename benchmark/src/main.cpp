// cardline Layout Benchmark
// Runs repeated layout passes over synthetic timelines and prints a
// hierarchical timing report.
//
// Usage:
//   ./cardline_benchmark [options]

#include <cardline/cardline.h>

#include "benchmark_profiler.h"
#include "event_generator.h"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr int k_exit_success = 0;
constexpr int k_exit_invalid_args = 1;
constexpr int k_exit_invalid_layout = 2;

constexpr double k_default_width = 1200.0;
constexpr double k_default_height = 800.0;

struct Benchmark_config {
    std::size_t event_count = 500;
    std::size_t passes = 50;
    uint64_t seed = 0;  // 0 = time-based
    double width = k_default_width;
    double height = k_default_height;
    double zoom = 1.0;
    cardline::Degradation_mode mode = cardline::Degradation_mode::UNIFORM;
    cardline::Positioner_kind positioner = cardline::Positioner_kind::DUAL_COLUMN;
    bool quiet = false;
};

const char* mode_name(cardline::Degradation_mode mode)
{
    return mode == cardline::Degradation_mode::MIXED ? "mixed" : "uniform";
}

const char* positioner_name(cardline::Positioner_kind kind)
{
    return kind == cardline::Positioner_kind::SINGLE_COLUMN ? "single" : "dual";
}

void print_version()
{
    std::cout << "cardline_benchmark version " << cardline::k_version_string << "\n";
}

void print_usage(const char* program_name)
{
    std::cout << "Usage: " << program_name << " [options]\n"
              << "\n"
              << "Layout benchmark for cardline.\n"
              << "Generates bursty synthetic timelines and measures layout throughput.\n"
              << "\n"
              << "Options:\n"
              << "  --events <count>        Events per timeline (default: 500, min: 1)\n"
              << "  --passes <count>        Layout passes to run (default: 50, min: 1)\n"
              << "  --seed <number>         RNG seed for reproducibility (default: time-based)\n"
              << "  --width <pixels>        Viewport width (default: 1200)\n"
              << "  --height <pixels>       Viewport height (default: 800)\n"
              << "  --zoom <factor>         Zoom level (default: 1.0)\n"
              << "  --mode <mode>           uniform|mixed (default: uniform)\n"
              << "  --positioner <kind>     single|dual (default: dual)\n"
              << "  --quiet                 Print only the summary line\n"
              << "  --version               Show version information\n"
              << "  --help                  Show this help message\n"
              << "\n"
              << "Examples:\n"
              << "  " << program_name << " --events 2000 --passes 20\n"
              << "  " << program_name << " --seed 12345 --mode mixed --positioner single\n";
}

struct Parse_result {
    Benchmark_config config;
    bool success = true;
    std::string error_message;
};

Parse_result parse_args(int argc, char* argv[])
{
    Parse_result result;
    auto& config = result.config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        try {
            if (arg == "--events" && i + 1 < argc) {
                config.event_count = std::stoull(argv[++i]);
            }
            else if (arg == "--passes" && i + 1 < argc) {
                config.passes = std::stoull(argv[++i]);
            }
            else if (arg == "--seed" && i + 1 < argc) {
                config.seed = std::stoull(argv[++i]);
            }
            else if (arg == "--width" && i + 1 < argc) {
                config.width = std::stod(argv[++i]);
            }
            else if (arg == "--height" && i + 1 < argc) {
                config.height = std::stod(argv[++i]);
            }
            else if (arg == "--zoom" && i + 1 < argc) {
                config.zoom = std::stod(argv[++i]);
            }
            else if (arg == "--mode" && i + 1 < argc) {
                std::string mode = argv[++i];
                if (mode == "uniform") {
                    config.mode = cardline::Degradation_mode::UNIFORM;
                }
                else if (mode == "mixed") {
                    config.mode = cardline::Degradation_mode::MIXED;
                }
                else {
                    result.success = false;
                    result.error_message = "Invalid mode '" + mode + "'. Use 'uniform' or 'mixed'.";
                    return result;
                }
            }
            else if (arg == "--positioner" && i + 1 < argc) {
                std::string kind = argv[++i];
                if (kind == "single") {
                    config.positioner = cardline::Positioner_kind::SINGLE_COLUMN;
                }
                else if (kind == "dual") {
                    config.positioner = cardline::Positioner_kind::DUAL_COLUMN;
                }
                else {
                    result.success = false;
                    result.error_message = "Invalid positioner '" + kind + "'. Use 'single' or 'dual'.";
                    return result;
                }
            }
            else if (arg == "--quiet") {
                config.quiet = true;
            }
            else if (arg == "--help" || arg == "-h" || arg == "--version" || arg == "-v") {
                // Handled separately in main
            }
            else if (arg.rfind("--", 0) == 0) {
                result.success = false;
                result.error_message = "Unknown option: " + arg;
                return result;
            }
        }
        catch (const std::invalid_argument&) {
            result.success = false;
            result.error_message = "Invalid value for " + arg + ": not a valid number";
            return result;
        }
        catch (const std::out_of_range&) {
            result.success = false;
            result.error_message = "Value out of range for " + arg;
            return result;
        }
    }

    if (config.seed == 0) {
        config.seed = static_cast<uint64_t>(
            std::chrono::steady_clock::now().time_since_epoch().count());
    }

    return result;
}

std::string validate_config(const Benchmark_config& config)
{
    if (config.event_count < 1 || config.event_count > 1000000) {
        return "Event count must be between 1 and 1000000";
    }
    if (config.passes < 1 || config.passes > 100000) {
        return "Passes must be between 1 and 100000";
    }
    if (config.width < 100.0 || config.width > 8192.0) {
        return "Width must be between 100 and 8192";
    }
    if (config.height < 100.0 || config.height > 8192.0) {
        return "Height must be between 100 and 8192";
    }
    if (!(config.zoom > 0.0) || config.zoom > 1000.0) {
        return "Zoom must be greater than 0 and at most 1000";
    }
    return "";
}

void print_config_summary(const Benchmark_config& config, std::ostream& os)
{
    os << "Configuration:\n"
       << "  Events:       " << config.event_count << "\n"
       << "  Passes:       " << config.passes << "\n"
       << "  Seed:         " << config.seed << "\n"
       << "  Viewport:     " << config.width << "x" << config.height << "\n"
       << "  Zoom:         " << config.zoom << "\n"
       << "  Mode:         " << mode_name(config.mode) << "\n"
       << "  Positioner:   " << positioner_name(config.positioner) << "\n";
}

void print_layout_summary(
    const cardline::layout_result_t& result,
    const cardline::validation_report_t& report,
    std::ostream& os)
{
    const auto& deg = result.metrics.degradation;
    os << "Last layout:\n"
       << "  Accepted:     " << result.accepted_event_count << " events\n"
       << "  Clusters:     " << result.clusters.size() << "\n"
       << "  Columns:      " << result.metrics.dispatch.column_count << "\n"
       << "  Cards:        " << result.cards.size() << "\n"
       << "  Utilization:  " << result.utilization.percentage << "%\n"
       << "  Degradation:  level " << deg.degradation_level << "\n";
    for (std::size_t i = 0; i < cardline::k_card_type_count; ++i) {
        os << "    " << cardline::to_string(static_cast<cardline::Card_type>(i))
           << ": " << deg.cards_by_type[i] << " cards\n";
    }
    os << "  Valid:        " << (report.is_valid ? "yes" : "no") << "\n";
    for (const auto& e : report.errors) {
        os << "    error: " << e << "\n";
    }
    for (const auto& w : report.warnings) {
        os << "    warning: " << w << "\n";
    }
}

}  // namespace

int main(int argc, char* argv[])
{
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return k_exit_success;
        }
        if (arg == "--version" || arg == "-v") {
            print_version();
            return k_exit_success;
        }
    }

    auto parse_result = parse_args(argc, argv);
    if (!parse_result.success) {
        std::cerr << "Error: " << parse_result.error_message << "\n";
        std::cerr << "Use --help for usage information.\n";
        return k_exit_invalid_args;
    }

    auto& config = parse_result.config;

    std::string validation_error = validate_config(config);
    if (!validation_error.empty()) {
        std::cerr << "Error: " << validation_error << "\n";
        return k_exit_invalid_args;
    }

    if (!config.quiet) {
        std::cout << "cardline Layout Benchmark v" << cardline::k_version_string << "\n"
                  << std::string(40, '=') << "\n\n";
        print_config_summary(config, std::cout);
        std::cout << "\n";
    }

    cardline::benchmark::Event_generator::Config gen_config;
    gen_config.seed = config.seed;
    cardline::benchmark::Event_generator generator(gen_config);
    const std::vector<cardline::event_t> events = generator.generate(config.event_count);

    auto profiler = std::make_shared<cardline::benchmark::Benchmark_profiler>();

    cardline::Layout_config layout_config = cardline::Layout_config::make_for_viewport(config.width, config.height);
    layout_config.profiler = profiler;
    layout_config.log_error = [](const std::string& msg) { std::cerr << msg << "\n"; };

    const cardline::Layout_engine engine(layout_config, config.mode, config.positioner);
    const cardline::Size2d viewport(config.width, config.height);

    cardline::benchmark::Report_metadata meta;
    meta.event_count = config.event_count;
    meta.passes = config.passes;
    meta.seed = config.seed;
    meta.viewport_width = config.width;
    meta.viewport_height = config.height;
    meta.zoom = config.zoom;
    meta.mode = mode_name(config.mode);
    meta.positioner = positioner_name(config.positioner);
    meta.started_at = std::chrono::system_clock::now();

    const auto start = std::chrono::steady_clock::now();
    cardline::layout_result_t last;
    for (std::size_t pass = 0; pass < config.passes; ++pass) {
        last = engine.layout(events, viewport, config.zoom);
    }
    const double elapsed_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();

    const cardline::validation_report_t report = engine.validate(last);

    if (!config.quiet) {
        print_layout_summary(last, report, std::cout);
        std::cout << "\n" << profiler->generate_report(meta);
    }
    std::cout << "Completed " << config.passes << " passes in " << elapsed_ms << " ms ("
              << elapsed_ms / static_cast<double>(config.passes) << " ms/pass)\n";

    return report.is_valid ? k_exit_success : k_exit_invalid_layout;
}
