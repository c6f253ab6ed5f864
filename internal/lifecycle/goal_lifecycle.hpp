#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/collaborators/calendar_service.hpp"
#include "internal/collaborators/reasoning_service.hpp"
#include "internal/config/engine_options.hpp"
#include "internal/core/graph_guard.hpp"

namespace goalgraph::lifecycle {

// Absent fields are left unchanged; empty title and category are ignored.
struct GoalUpdate {
  std::optional<std::string>     title;
  std::optional<std::string>     body;
  std::optional<std::string>     category;
  std::optional<model::Priority> priority;
};

/*
  Lifecycle state machine over a guarded goal graph.

  Operations that consult a collaborator read what they need under the shared
  lock, call out with no lock held, then re-validate and apply under the
  exclusive lock. Structural rejections (locked, missing, invalid transition)
  happen before anything is written.
*/
class GoalLifecycle {
 public:
  GoalLifecycle(core::GraphGuard& guard, collaborators::ReasoningService& reasoning, collaborators::CalendarService& calendar,
                config::EngineOptions options);

  // No-op returning the existing snapshot when already locked. A reasoning
  // failure falls back to the default rationale.
  model::GoalSnapshot Lock(const model::GoalId& id);

  // Returns false if the goal was not locked.
  bool Unlock(const model::GoalId& id, const std::string& reason);

  void Regenerate(const model::GoalId& id);

  collaborators::ActivationPlan GenerateActivationPlan(const model::GoalId& id);
  void                          ConfirmActivation(const model::GoalId& id, const collaborators::ActivationPlan& plan);
  void                          Activate(const model::GoalId& id);

  // Never blocked by the lock. Proposed calendar links are cancelled.
  void Deactivate(const model::GoalId& id, model::ActivationState to, const std::string& rationale);

  void Complete(const model::GoalId& id);

  // Removes the goal, its subtree and roadmap; cancels their calendar events.
  std::vector<model::GoalId> Delete(const model::GoalId& id);

  void UpdateGoal(const model::GoalId& id, const GoalUpdate& update);
  void SetProgress(const model::GoalId& id, double value);

 private:
  std::string ComposeNotes(const collaborators::ProposedSession& session, const std::string& goal_title) const;

  core::GraphGuard&                guard_;
  collaborators::ReasoningService& reasoning_;
  collaborators::CalendarService&  calendar_;
  config::EngineOptions            options_;
};

} // namespace goalgraph::lifecycle
