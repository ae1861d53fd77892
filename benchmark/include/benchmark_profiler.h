// cardline Benchmark - Profiler
// Hierarchical scope timing with a plain-text tree report

#ifndef CARDLINE_BENCHMARK_PROFILER_H
#define CARDLINE_BENCHMARK_PROFILER_H

#include <cardline/core/layout_config.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <limits>
#include <map>
#include <memory>
#include <sstream>
#include <stack>
#include <string>

namespace cardline::benchmark {

/// Run description printed at the top of a report
struct Report_metadata {
    std::string session = "layout_benchmark";
    std::size_t event_count = 0;
    std::size_t passes = 0;
    uint64_t seed = 0;
    double viewport_width = 0.0;
    double viewport_height = 0.0;
    double zoom = 1.0;
    std::string mode;
    std::string positioner;
    std::chrono::system_clock::time_point started_at;
};

/// Profiler that aggregates nested scopes by name.
/// Implements cardline::Profiler so engine stages show up in the tree.
class Benchmark_profiler : public cardline::Profiler {
public:
    struct Scope_stats {
        std::string name;
        uint64_t call_count = 0;
        double total_ms = 0.0;
        double min_ms = std::numeric_limits<double>::max();
        double max_ms = 0.0;
        std::map<std::string, std::unique_ptr<Scope_stats>> children;
        Scope_stats* parent = nullptr;
    };

    Benchmark_profiler()
    {
        m_root.name = "[root]";
        m_current = &m_root;
    }

    ~Benchmark_profiler() override = default;

    /// Begin a named scope. Nested calls create child scopes.
    void begin_scope(const char* name) override
    {
        m_start_times.push(std::chrono::steady_clock::now());

        auto& children = m_current->children;
        auto it = children.find(name);
        if (it == children.end()) {
            auto child = std::make_unique<Scope_stats>();
            child->name = name;
            child->parent = m_current;
            it = children.emplace(name, std::move(child)).first;
        }
        m_current = it->second.get();
    }

    /// End the current scope and record timing.
    void end_scope() override
    {
        if (m_start_times.empty()) {
            return;
        }

        const auto end_time = std::chrono::steady_clock::now();
        const auto start_time = m_start_times.top();
        m_start_times.pop();

        const double elapsed_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();

        m_current->call_count++;
        m_current->total_ms += elapsed_ms;
        m_current->min_ms = std::min(m_current->min_ms, elapsed_ms);
        m_current->max_ms = std::max(m_current->max_ms, elapsed_ms);

        if (m_current->parent) {
            m_current = m_current->parent;
        }
    }

    std::string generate_report(const Report_metadata& meta) const
    {
        std::ostringstream oss;

        oss << "cardline profiling report\n";
        oss << "Session: " << meta.session << "\n";
        oss << "Started at (UTC): " << format_utc_time(meta.started_at) << "\n";
        oss << "\n";

        oss << "Metadata:\n";
        oss << "  - events: " << meta.event_count << "\n";
        oss << "  - mode: " << meta.mode << "\n";
        oss << "  - passes: " << meta.passes << "\n";
        oss << "  - positioner: " << meta.positioner << "\n";
        oss << "  - seed: " << meta.seed << "\n";
        oss << "  - viewport: " << meta.viewport_width << "x" << meta.viewport_height << "\n";
        oss << "  - zoom: " << meta.zoom << "\n";
        oss << "\n";

        // Column widths: Section=40, Calls=6, Total=10, Avg=10, Min=8, Max=8, Percent=8
        oss << std::left << std::setw(40) << "Section" << " "
            << std::right << std::setw(6) << "Calls" << " "
            << std::setw(10) << "Total ms" << " "
            << std::setw(10) << "Average ms" << " "
            << std::setw(8) << "Min ms" << " "
            << std::setw(8) << "Max ms" << " "
            << std::setw(8) << "Percent" << "\n";
        oss << std::string(96, '-') << "\n";

        double total_root_ms = 0.0;
        for (const auto& [name, child] : m_root.children) {
            total_root_ms += child->total_ms;
        }

        for (auto it = m_root.children.begin(); it != m_root.children.end(); ++it) {
            const bool is_last = std::next(it) == m_root.children.end();
            write_scope_tree(oss, *it->second, "", is_last, total_root_ms);
        }

        oss << "\n";
        return oss.str();
    }

    /// Reset profiler for next run
    void reset()
    {
        m_root.children.clear();
        m_root.call_count = 0;
        m_root.total_ms = 0.0;
        m_root.min_ms = std::numeric_limits<double>::max();
        m_root.max_ms = 0.0;
        m_current = &m_root;
        while (!m_start_times.empty()) {
            m_start_times.pop();
        }
    }

    const Scope_stats& root() const { return m_root; }

private:
    Scope_stats m_root;
    Scope_stats* m_current = nullptr;
    std::stack<std::chrono::steady_clock::time_point> m_start_times;

    static std::string format_utc_time(std::chrono::system_clock::time_point tp)
    {
        auto time_t_val = std::chrono::system_clock::to_time_t(tp);
        std::tm tm_val{};
#ifdef _WIN32
        gmtime_s(&tm_val, &time_t_val);
#else
        gmtime_r(&time_t_val, &tm_val);
#endif
        std::ostringstream oss;
        oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%SZ");
        return oss.str();
    }

    // "cardline.layout.bounds" -> "bounds"
    static std::string short_name(const std::string& full_name)
    {
        auto pos = full_name.rfind('.');
        if (pos != std::string::npos && pos + 1 < full_name.length()) {
            return full_name.substr(pos + 1);
        }
        return full_name;
    }

    void write_scope_tree(
        std::ostream& os,
        const Scope_stats& scope,
        const std::string& prefix,
        bool is_last,
        double total_ms) const
    {
        const std::string glyph = is_last ? "`- " : "|- ";
        std::string section = prefix + glyph + short_name(scope.name);
        if (section.size() > 40) {
            section = section.substr(0, 37) + "...";
        }

        const double avg_ms = scope.call_count > 0 ? scope.total_ms / static_cast<double>(scope.call_count) : 0.0;
        const double percent = total_ms > 0 ? (scope.total_ms / total_ms) * 100.0 : 0.0;

        os << std::left << std::setw(40) << section << " "
           << std::right << std::setw(6) << scope.call_count << " "
           << std::fixed << std::setprecision(3)
           << std::setw(10) << scope.total_ms << " "
           << std::setw(10) << avg_ms << " "
           << std::setw(8) << scope.min_ms << " "
           << std::setw(8) << scope.max_ms << " "
           << std::setw(7) << percent << "%\n";

        const std::string child_prefix = prefix + (is_last ? "   " : "|  ");
        for (auto it = scope.children.begin(); it != scope.children.end(); ++it) {
            const bool child_is_last = std::next(it) == scope.children.end();
            write_scope_tree(os, *it->second, child_prefix, child_is_last, total_ms);
        }
    }
};

}  // namespace cardline::benchmark

#endif  // CARDLINE_BENCHMARK_PROFILER_H
