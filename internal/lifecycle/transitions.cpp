#include "transitions.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace goalgraph::lifecycle {

using model::ActivationState;

bool ApplyLock(model::Goal& goal, std::string rationale, model::TimePoint now) {
  if (goal.is_locked) {
    return false;
  }
  goal.locked_snapshot = model::CaptureSnapshot(goal, rationale, now);
  goal.is_locked       = true;
  model::AppendRevision(goal, "Locked", std::move(rationale), now);
  return true;
}

std::vector<std::string> ApplyStateChange(model::Goal& goal, ActivationState to, std::string summary, std::optional<std::string> rationale,
                                          model::TimePoint now) {
  if (!model::CanTransition(goal.state, to)) {
    throw util::InvalidState("invalid transition " + std::string(model::ToString(goal.state)) + " -> " + std::string(model::ToString(to)) +
                             " for goal " + goal.id);
  }

  std::vector<std::string> cancelled;
  for (auto& link : goal.scheduled_events) {
    if (link.status == model::EventLinkStatus::kProposed) {
      link.status = model::EventLinkStatus::kCancelled;
      cancelled.push_back(link.event_id);
    }
  }

  goal.state = to;
  switch (to) {
    case ActivationState::kActive:
      goal.activated_at = now;
      break;
    case ActivationState::kCompleted:
      goal.completed_at = now;
      break;
    case ActivationState::kDraft:
    case ActivationState::kArchived:
      break;
  }
  model::AppendRevision(goal, std::move(summary), std::move(rationale), now);
  return cancelled;
}

void CancelEventsBestEffort(collaborators::CalendarService& calendar, const model::GoalId& goal_id, const std::vector<std::string>& event_ids) {
  for (const auto& event_id : event_ids) {
    try {
      calendar.CancelEvent(event_id);
    } catch (const std::exception& ex) {
      GOALGRAPH_LOG_WARN("Calendar cancellation failed",
                         {observability::StringField("goal_id", goal_id), observability::StringField("event_id", event_id),
                          observability::StringField("error", ex.what())});
    }
  }
}

} // namespace goalgraph::lifecycle
