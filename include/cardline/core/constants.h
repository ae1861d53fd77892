#pragma once

// Cardline - Core Constants
// Time units and default layout metrics used by the core library.

#include <cstdint>

namespace cardline::constants {

// Time units (milliseconds)
constexpr int64_t k_ms_per_second = 1000;
constexpr int64_t k_ms_per_minute = 60 * k_ms_per_second;
constexpr int64_t k_ms_per_hour   = 60 * k_ms_per_minute;
constexpr int64_t k_ms_per_day    = 24 * k_ms_per_hour;
constexpr int64_t k_ms_per_year   = 365 * k_ms_per_day;

// Bounds
constexpr int64_t k_min_padding_ms       = 7 * k_ms_per_day;
constexpr int64_t k_max_padding_ms       = k_ms_per_year;
constexpr double  k_padding_ratio        = 0.1;
constexpr int64_t k_min_duration_ms      = k_ms_per_day;
constexpr int64_t k_default_window_ms    = k_ms_per_year;
constexpr double  k_timeline_margin_px   = 56.0;

// Column width heuristics
constexpr double  k_base_column_width_px = 200.0;
constexpr double  k_min_column_width_px  = 150.0;
constexpr double  k_max_column_width_px  = 300.0;
constexpr double  k_base_column_gap_px   = 20.0;
constexpr double  k_high_density_per_px  = 0.1;
constexpr double  k_low_density_per_px   = 0.05;
constexpr double  k_utilization_target   = 0.8;
constexpr int     k_events_per_column    = 8;

// Distribution
constexpr double  k_density_window_days  = 30.0;
constexpr double  k_min_event_pitch_px   = 8.0;
constexpr double  k_high_events_per_day  = 2.0;
constexpr double  k_low_events_per_day   = 0.5;

// Clustering
constexpr double  k_cluster_threshold_px = 120.0;

// Vertical layout
constexpr double  k_header_safe_zone_px  = 100.0;
constexpr double  k_above_axis_margin_px = 48.0;
constexpr double  k_below_axis_margin_px = 55.0;
constexpr double  k_card_gap_px          = 12.0;

// Capacity
constexpr int     k_cells_per_side       = 8;
constexpr int     k_min_cells_per_side   = 4;
constexpr int     k_max_cells_per_side   = 8;
constexpr int     k_max_events_per_multi = 5;

// Promotion
constexpr double  k_promotion_low_water  = 0.40;
constexpr double  k_promotion_budget     = 0.5;

// Precision
constexpr double  k_eps = 1e-9;

} // namespace cardline::constants
