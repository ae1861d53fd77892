// cardline Benchmark - Event Generator
// Generates synthetic timelines with bursts of closely spaced events

#ifndef CARDLINE_BENCHMARK_EVENT_GENERATOR_H
#define CARDLINE_BENCHMARK_EVENT_GENERATOR_H

#include <cardline/core/algo.h>
#include <cardline/core/constants.h>
#include <cardline/core/types.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <random>
#include <string>
#include <vector>

namespace cardline::benchmark {

/// Generates events by a random walk over time.
///
/// Gaps between events are exponentially distributed. With probability
/// `burst_probability` a burst starts, during which gaps shrink by
/// `burst_compression`, producing the dense stretches that force
/// degradation.
class Event_generator {
public:
    struct Config {
        int64_t start_ms = 1577836800000;       ///< 2020-01-01
        double mean_gap_days = 3.0;             ///< Mean gap outside bursts
        double burst_probability = 0.05;        ///< Chance to start a burst per event
        std::size_t burst_length = 20;          ///< Events per burst
        double burst_compression = 50.0;        ///< Gap divisor inside a burst
        double time_of_day_probability = 0.3;   ///< Chance an event carries "HH:MM"
        uint64_t seed = 12345;                  ///< RNG seed for reproducibility
    };

    explicit Event_generator(const Config& config)
        : config_(config)
        , rng_(config.seed)
        , current_ms_(config.start_ms)
    {
    }

    /// Generate the next event.
    event_t next_event() {
        double gap_days = exponential_(rng_) * config_.mean_gap_days;
        if (burst_remaining_ > 0) {
            --burst_remaining_;
            gap_days /= std::max(1.0, config_.burst_compression);
        }
        else if (uniform_(rng_) < config_.burst_probability) {
            burst_remaining_ = config_.burst_length;
        }

        current_ms_ += static_cast<int64_t>(gap_days * static_cast<double>(constants::k_ms_per_day));

        event_t e;
        e.id = "evt-" + std::to_string(generated_);
        e.date = format_date(current_ms_);
        e.title = "Event " + std::to_string(generated_);
        if (uniform_(rng_) < config_.time_of_day_probability) {
            const int64_t minutes = (current_ms_ % constants::k_ms_per_day) / constants::k_ms_per_minute;
            char buf[8];
            std::snprintf(buf, sizeof(buf), "%02d:%02d",
                static_cast<int>(minutes / 60), static_cast<int>(minutes % 60));
            e.time = std::string(buf);
        }
        ++generated_;
        return e;
    }

    /// Generate `count` events in chronological order.
    std::vector<event_t> generate(std::size_t count) {
        std::vector<event_t> out;
        out.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            out.push_back(next_event());
        }
        return out;
    }

    /// Reset the generator to initial state.
    void reset() {
        rng_.seed(config_.seed);
        uniform_.reset();
        exponential_.reset();
        current_ms_ = config_.start_ms;
        burst_remaining_ = 0;
        generated_ = 0;
    }

    int64_t current_ms() const { return current_ms_; }
    std::size_t generated() const { return generated_; }
    const Config& config() const { return config_; }

private:
    Config config_;
    std::mt19937_64 rng_;
    std::uniform_real_distribution<double> uniform_{0.0, 1.0};
    std::exponential_distribution<double> exponential_{1.0};
    int64_t current_ms_;
    std::size_t burst_remaining_ = 0;
    std::size_t generated_ = 0;
};

}  // namespace cardline::benchmark

#endif  // CARDLINE_BENCHMARK_EVENT_GENERATOR_H
