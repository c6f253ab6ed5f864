#include "engine_options.hpp"

#include <stdexcept>

#include "config/config.pb.h"

namespace goalgraph::config {

EngineOptions ResolveEngineOptions(const goalgraph::runtime::config::RuntimeConfig& config) {
  EngineOptions options;

  const auto& roadmap = config.roadmap();
  if (roadmap.step_hard_limit() > 0) {
    options.step_hard_limit = roadmap.step_hard_limit();
  }
  if (roadmap.step_soft_warning() > 0) {
    options.step_soft_warning = roadmap.step_soft_warning();
  }
  if (roadmap.default_step_days() > 0) {
    options.default_step_days = roadmap.default_step_days();
  }
  if (options.step_soft_warning > options.step_hard_limit) {
    throw std::runtime_error("Invalid configuration: roadmap.step_soft_warning exceeds roadmap.step_hard_limit");
  }

  const auto& lifecycle = config.lifecycle();
  if (!lifecycle.default_lock_rationale().empty()) {
    options.default_lock_rationale = lifecycle.default_lock_rationale();
  }
  if (!lifecycle.calendar_notes_signature().empty()) {
    options.calendar_notes_signature = lifecycle.calendar_notes_signature();
  }

  const auto& timeline = config.timeline();
  if (timeline.default_span_days() > 0) {
    options.default_span_days = timeline.default_span_days();
  }
  if (timeline.planned_phase_days() > 0) {
    options.planned_phase_days = timeline.planned_phase_days();
  }

  return options;
}

} // namespace goalgraph::config
