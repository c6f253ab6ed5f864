#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/collaborators/calendar_service.hpp"
#include "internal/model/goal.hpp"

namespace goalgraph::lifecycle {

/*
  In-lock building blocks shared by the lifecycle and roadmap engines. They
  only touch the goal they are given; calendar side effects are returned to
  the caller to run after the lock is released.
*/

// Captures the snapshot and appends "Locked". Returns false if already locked.
bool ApplyLock(model::Goal& goal, std::string rationale, model::TimePoint now);

// Moves the goal to `to` and marks every proposed event link cancelled.
// Returns the external ids of the links it cancelled.
std::vector<std::string> ApplyStateChange(model::Goal& goal, model::ActivationState to, std::string summary,
                                          std::optional<std::string> rationale, model::TimePoint now);

// Cancels each event, logging failures. Never throws for collaborator errors.
void CancelEventsBestEffort(collaborators::CalendarService& calendar, const model::GoalId& goal_id, const std::vector<std::string>& event_ids);

} // namespace goalgraph::lifecycle
