#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/collaborators/calendar_service.hpp"
#include "internal/collaborators/reasoning_service.hpp"
#include "internal/config/engine_options.hpp"
#include "internal/core/graph_guard.hpp"

namespace goalgraph::roadmap {

struct StepSeed {
  std::string        title;
  std::string        body;
  std::optional<int> days_from_now;
  bool               is_final_step = false;
};

enum class AdvanceOutcome : std::uint8_t {
  kAdvanced         = 0, // current step completed, next step is current
  kGoalCompleted    = 1, // final step completed, goal moved to completed
  kDuplicateSkipped = 2, // current step completed, proposed step dropped
};

struct StepAdvanceResult {
  AdvanceOutcome               outcome = AdvanceOutcome::kAdvanced;
  model::GoalId                completed_step;
  std::optional<model::GoalId> new_step;
  double                       progress = 0.0;
  std::optional<std::string>   warning;
  std::optional<std::string>   duplicate_title;
};

/*
  Linear roadmap driver.

  Advancing promotes the next pending step when one exists. Otherwise it runs
  in three phases: validate under the read lock, ask the reasoning service for
  the next step with no lock held, then re-validate and apply under the write
  lock. A failed or stale call leaves the roadmap as it was.
*/
class StepEngine {
 public:
  StepEngine(core::GraphGuard& guard, collaborators::ReasoningService& reasoning, collaborators::CalendarService& calendar,
             config::EngineOptions options);

  // First seed becomes current, the rest pending. Only the last seed may be final.
  std::vector<model::GoalId> BeginRoadmap(const model::GoalId& goal_id, const std::vector<StepSeed>& seeds);

  StepAdvanceResult CompleteCurrentStep(const model::GoalId& goal_id);

  // Promotes the first pending (else unknown) step when no step is current and
  // demotes surplus current steps. Returns the current step afterwards.
  std::optional<model::GoalId> RecoverRoadmap(const model::GoalId& goal_id);

 private:
  // Set once the roadmap reaches the soft step count.
  std::optional<std::string> SoftLimitWarning(const graph::GoalGraph& graph, const model::GoalId& goal_id) const;

  core::GraphGuard&                guard_;
  collaborators::ReasoningService& reasoning_;
  collaborators::CalendarService&  calendar_;
  config::EngineOptions            options_;
};

// Trimmed, case-folded form used for duplicate detection.
std::string NormalizeStepTitle(const std::string& title);

} // namespace goalgraph::roadmap
