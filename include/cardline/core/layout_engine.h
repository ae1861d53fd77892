#pragma once
// Cardline - Layout Engine
// Runs the whole pipeline for one viewport: bounds, distribution,
// clustering, slot capacity, degradation and assembly.
// Each call is a full recomputation; nothing is kept between calls.

#include "degradation_coordinator.h"
#include "event_clustering.h"
#include "event_distribution.h"
#include "layout_config.h"
#include "layout_result.h"
#include "layout_validator.h"
#include "positioner.h"
#include "timeline_bounds.h"
#include "types.h"

#include <memory>
#include <string>
#include <vector>

namespace cardline {

class Layout_engine
{
public:
    explicit Layout_engine(
        Layout_config config = Layout_config::make_default(),
        Degradation_mode mode = Degradation_mode::UNIFORM,
        Positioner_kind positioner = Positioner_kind::DUAL_COLUMN);

    Layout_engine(
        Layout_config config,
        Degradation_mode mode,
        std::shared_ptr<const Positioner> positioner);

    // Events with an unparseable date or a repeated id are skipped and
    // listed in layout_result_t::skipped_event_ids.
    layout_result_t layout(
        const std::vector<event_t>& events,
        const Size2d& viewport,
        double zoom = 1.0) const;

    validation_report_t validate(const layout_result_t& result) const;

    [[nodiscard]] const Layout_config& config() const noexcept { return m_config; }
    [[nodiscard]] Degradation_mode degradation_mode() const noexcept { return m_mode; }
    [[nodiscard]] Positioner_kind positioner_kind() const noexcept { return m_positioner->kind(); }

private:
    std::vector<timed_event_t> accept_events(
        const std::vector<event_t>& events,
        std::vector<std::string>& skipped) const;

    dispatch_metrics_t dispatch_metrics(const layout_result_t& result) const;

    Layout_config                     m_config;
    Degradation_mode                  m_mode;
    std::shared_ptr<const Positioner> m_positioner;
    Timeline_bounds_calculator        m_bounds;
    Event_distribution_engine         m_distribution;
    Event_clustering                  m_clustering;
    Degradation_coordinator           m_coordinator;
    Layout_validator                  m_validator;
};

} // namespace cardline
