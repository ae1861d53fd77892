#pragma once
// Cardline - Main Header
// A deterministic layout engine for timeline cards.
//
// This library provides:
// - Time window and time <-> pixel mapping (Timeline_bounds_calculator)
// - Event placement and density analysis (Event_distribution_engine)
// - Proximity clustering with centroid anchors (Event_clustering)
// - Slot capacity bookkeeping (Slot_grid)
// - Card type degradation and promotion (Degradation_engine)
// - Column strategies and assembly (Positioner, Degradation_coordinator)
// - Structured layout diagnostics (Layout_validator)
//
// Usage:
//   cardline::Layout_engine engine(cardline::Layout_config::make_default());
//   auto result = engine.layout(events, {1200.0, 800.0}, 1.0);
//   auto report = engine.validate(result);
//
// The engine emits geometry and metadata only; drawing is up to the host.
#include <cardline/core/types.h>
#include <cardline/core/constants.h>
#include <cardline/core/layout_config.h>
#include <cardline/core/algo.h>
#include <cardline/core/timeline_bounds.h>
#include <cardline/core/event_distribution.h>
#include <cardline/core/event_clustering.h>
#include <cardline/core/slot_grid.h>
#include <cardline/core/degradation_engine.h>
#include <cardline/core/positioner.h>
#include <cardline/core/degradation_coordinator.h>
#include <cardline/core/layout_result.h>
#include <cardline/core/layout_validator.h>
#include <cardline/core/layout_engine.h>

namespace cardline {

// Library version
constexpr int k_version_major = 0;
constexpr int k_version_minor = 1;
constexpr int k_version_patch = 0;

constexpr const char* k_version_string = "0.1.0";

} // namespace cardline
