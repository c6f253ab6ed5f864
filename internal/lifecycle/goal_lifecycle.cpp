#include "goal_lifecycle.hpp"

#include "internal/collaborators/context_builder.hpp"
#include "internal/collaborators/external_call.hpp"
#include "internal/lifecycle/transitions.hpp"
#include "internal/observability/logging.hpp"
#include "internal/progress/progress_aggregator.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace goalgraph::lifecycle {

namespace {

using model::ActivationState;
using model::Goal;
using model::GoalId;

void RequireUnlocked(const Goal& goal) {
  if (goal.is_locked) {
    throw util::LockedError("goal is locked: " + goal.id);
  }
}

void RequireActivatable(const Goal& goal) {
  RequireUnlocked(goal);
  if (goal.state != ActivationState::kDraft) {
    throw util::InvalidState("only draft goals can be activated: " + goal.id + " is " + std::string(model::ToString(goal.state)));
  }
}

std::string TransitionSummary(ActivationState to) {
  switch (to) {
    case ActivationState::kDraft:
      return "Deactivated";
    case ActivationState::kActive:
      return "Activated";
    case ActivationState::kCompleted:
      return "Completed";
    case ActivationState::kArchived:
      return "Archived";
  }
  return "State changed";
}

std::vector<Goal> AllGoals(const graph::GoalGraph& graph) {
  std::vector<Goal> goals;
  for (const auto& top : graph.TopLevelGoals()) {
    for (const auto& id : graph.Descendants(top, true)) {
      goals.push_back(graph.Get(id));
    }
  }
  return goals;
}

} // namespace

GoalLifecycle::GoalLifecycle(core::GraphGuard& guard, collaborators::ReasoningService& reasoning, collaborators::CalendarService& calendar,
                             config::EngineOptions options)
    : guard_(guard), reasoning_(reasoning), calendar_(calendar), options_(std::move(options)) {
}

// ------------------------------------------------------------
// Lock overlay
// ------------------------------------------------------------

model::GoalSnapshot GoalLifecycle::Lock(const GoalId& id) {
  struct Prepared {
    std::optional<model::GoalSnapshot> existing;
    Goal                               goal;
    collaborators::GoalContext         context;
  };

  auto prepared = guard_.Read([&](const graph::GoalGraph& graph) {
    const auto& goal = graph.Get(id);
    Prepared    out;
    if (goal.is_locked) {
      out.existing = goal.locked_snapshot.value_or(model::CaptureSnapshot(goal, options_.default_lock_rationale, goal.updated_at));
      return out;
    }
    if (!model::HasContent(goal)) {
      throw util::InvalidState("goal has no content to snapshot: " + id);
    }
    out.goal    = goal;
    out.context = collaborators::BuildContext(graph, id);
    return out;
  });
  if (prepared.existing) {
    return *prepared.existing;
  }

  std::string rationale;
  try {
    rationale = collaborators::CallExternal("summarize_for_lock", [&] { return reasoning_.SummarizeForLock(prepared.goal, prepared.context); });
  } catch (const util::ExternalServiceFailure&) {
    GOALGRAPH_LOG_INFO("Lock rationale fallback", {observability::StringField("goal_id", id)});
  }
  if (rationale.empty()) {
    rationale = options_.default_lock_rationale;
  }

  return guard_.Write([&](graph::GoalGraph& graph) {
    const auto& current = graph.Get(id);
    if (current.is_locked) {
      return current.locked_snapshot.value_or(model::CaptureSnapshot(current, rationale, current.updated_at));
    }
    if (!model::HasContent(current)) {
      throw util::InvalidState("goal has no content to snapshot: " + id);
    }
    auto& goal = graph.Mutable(id);
    ApplyLock(goal, rationale, util::Now());
    return *goal.locked_snapshot;
  });
}

bool GoalLifecycle::Unlock(const GoalId& id, const std::string& reason) {
  return guard_.Write([&](graph::GoalGraph& graph) {
    if (!graph.Get(id).is_locked) {
      return false;
    }
    auto& goal     = graph.Mutable(id);
    goal.is_locked = false;
    goal.locked_snapshot.reset();
    if (reason.empty()) {
      model::AppendRevision(goal, "Unlocked", std::nullopt, util::Now());
    } else {
      model::AppendRevision(goal, "Unlocked: " + reason, reason, util::Now());
    }
    return true;
  });
}

// ------------------------------------------------------------
// Regeneration
// ------------------------------------------------------------

void GoalLifecycle::Regenerate(const GoalId& id) {
  const auto prepared = guard_.Read([&](const graph::GoalGraph& graph) {
    const auto& current = graph.Get(id);
    RequireUnlocked(current);
    return std::make_pair(current, collaborators::BuildContext(graph, id));
  });

  const auto response =
      collaborators::CallExternal("request_regeneration", [&] { return reasoning_.RequestRegeneration(prepared.first, prepared.second); });
  Goal proposed;
  proposed.title = response.title;
  proposed.body  = response.body;
  if (!model::HasContent(proposed)) {
    throw util::ExternalServiceFailure("request_regeneration: empty response", /*recoverable=*/true);
  }

  guard_.Write([&](graph::GoalGraph& graph) {
    RequireUnlocked(graph.Get(id));

    auto&      target = graph.Mutable(id);
    const auto now    = util::Now();
    auto       before = model::CaptureSnapshot(target, "", now);

    target.title = response.title;
    target.body  = response.body;
    if (response.category && !response.category->empty()) {
      target.category = *response.category;
    }
    if (response.priority) {
      target.priority = *response.priority;
    }
    model::AppendRevision(target, "Regenerated", "Refreshed framing", now, std::move(before), model::CaptureSnapshot(target, "", now));
  });
}

// ------------------------------------------------------------
// Activation
// ------------------------------------------------------------

collaborators::ActivationPlan GoalLifecycle::GenerateActivationPlan(const GoalId& id) {
  const auto prepared = guard_.Read([&](const graph::GoalGraph& graph) {
    const auto& current = graph.Get(id);
    RequireActivatable(current);
    return std::make_pair(current, AllGoals(graph));
  });

  auto plan = collaborators::CallExternal("request_activation_plan",
                                          [&] { return reasoning_.RequestActivationPlan(prepared.first, prepared.second); });
  if (plan.sessions.empty()) {
    throw util::ExternalServiceFailure("request_activation_plan: no sessions proposed for " + id, /*recoverable=*/true);
  }
  return plan;
}

std::string GoalLifecycle::ComposeNotes(const collaborators::ProposedSession& session, const std::string& goal_title) const {
  if (session.notes && !session.notes->empty()) {
    return *session.notes + "\n\n" + options_.calendar_notes_signature;
  }
  return options_.calendar_notes_signature + " \xE2\x80\x94 " + goal_title;
}

void GoalLifecycle::ConfirmActivation(const GoalId& id, const collaborators::ActivationPlan& plan) {
  if (plan.sessions.empty()) {
    throw util::InvalidArgument("activation plan has no sessions: " + id);
  }

  const auto title = guard_.Read([&](const graph::GoalGraph& graph) {
    const auto& goal = graph.Get(id);
    RequireActivatable(goal);
    return goal.title;
  });

  std::vector<model::ScheduledEventLink> links;
  std::optional<std::string>             failure;
  for (const auto& session : plan.sessions) {
    try {
      auto event_id = collaborators::CallExternal(
          "create_event", [&] { return calendar_.CreateEvent(session.title, session.start, session.duration, ComposeNotes(session, title)); });
      links.push_back(model::ScheduledEventLink{std::move(event_id), session.start, session.start + session.duration,
                                                model::EventLinkStatus::kProposed});
    } catch (const util::ExternalServiceFailure& ex) {
      if (links.empty()) {
        throw;
      }
      failure = ex.what();
      break;
    }
  }

  std::vector<std::string> created;
  for (const auto& link : links) {
    created.push_back(link.event_id);
  }

  std::vector<std::string> stale;
  try {
    stale = guard_.Write([&](graph::GoalGraph& graph) {
      RequireActivatable(graph.Get(id));
      auto& goal = graph.Mutable(id);

      if (failure) {
        // Keep what the calendar created; the goal stays draft.
        goal.scheduled_events.insert(goal.scheduled_events.end(), links.begin(), links.end());
        goal.updated_at = util::Now();
        return std::vector<std::string>{};
      }

      auto cancelled = ApplyStateChange(goal, ActivationState::kActive, "Activated",
                                        "Scheduled " + std::to_string(links.size()) + " focus sessions", util::Now());
      for (auto& link : links) {
        link.status = model::EventLinkStatus::kConfirmed;
        goal.scheduled_events.push_back(link);
      }
      return cancelled;
    });
  } catch (const std::exception&) {
    // The goal changed underneath us; nothing references the new events.
    CancelEventsBestEffort(calendar_, id, created);
    throw;
  }

  CancelEventsBestEffort(calendar_, id, stale);

  if (failure) {
    GOALGRAPH_LOG_ERROR("Partial activation", {observability::StringField("goal_id", id),
                                               observability::IntField("created", static_cast<std::int64_t>(created.size())),
                                               observability::IntField("planned", static_cast<std::int64_t>(plan.sessions.size())),
                                               observability::StringField("error", *failure)});
    throw util::PartialActivationFailure("activation of " + id + " created " + std::to_string(created.size()) + " of " +
                                             std::to_string(plan.sessions.size()) + " events: " + *failure,
                                         std::move(created));
  }

  GOALGRAPH_LOG_INFO("Goal activated", {observability::StringField("goal_id", id), observability::IntField("events", static_cast<std::int64_t>(created.size()))});
}

void GoalLifecycle::Activate(const GoalId& id) {
  ConfirmActivation(id, GenerateActivationPlan(id));
}

// ------------------------------------------------------------
// Terminal and reversible transitions
// ------------------------------------------------------------

void GoalLifecycle::Deactivate(const GoalId& id, ActivationState to, const std::string& rationale) {
  if (to == ActivationState::kActive) {
    throw util::InvalidState("use activation to move a goal to active: " + id);
  }

  const auto cancelled = guard_.Write([&](graph::GoalGraph& graph) {
    auto&      goal = graph.Mutable(id);
    const auto now  = util::Now();
    auto       out  = ApplyStateChange(goal, to, TransitionSummary(to), rationale.empty() ? std::nullopt : std::optional<std::string>(rationale), now);
    if (to == ActivationState::kCompleted && !goal.is_locked) {
      goal.progress = 1.0;
    }
    return out;
  });

  CancelEventsBestEffort(calendar_, id, cancelled);
}

void GoalLifecycle::Complete(const GoalId& id) {
  const auto cancelled = guard_.Write([&](graph::GoalGraph& graph) {
    RequireUnlocked(graph.Get(id));
    auto& goal = graph.Mutable(id);
    auto  out  = ApplyStateChange(goal, ActivationState::kCompleted, "Completed", "Goal marked as completed", util::Now());
    goal.progress = 1.0;
    return out;
  });

  CancelEventsBestEffort(calendar_, id, cancelled);
}

std::vector<GoalId> GoalLifecycle::Delete(const GoalId& id) {
  std::vector<std::string> events;
  auto removed = guard_.Write([&](graph::GoalGraph& graph) {
    if (!graph.Contains(id)) {
      return std::vector<GoalId>{};
    }

    const auto collect = [&](const Goal& goal) {
      for (const auto& link : goal.scheduled_events) {
        if (link.status != model::EventLinkStatus::kCancelled) {
          events.push_back(link.event_id);
        }
      }
    };
    for (const auto& descendant : graph.Descendants(id, true)) {
      collect(graph.Get(descendant));
      for (const auto& step : graph.Steps(descendant)) {
        collect(graph.Get(step));
      }
    }
    return graph.Delete(id);
  });

  CancelEventsBestEffort(calendar_, id, events);
  if (!removed.empty()) {
    GOALGRAPH_LOG_INFO("Goal deleted", {observability::StringField("goal_id", id), observability::IntField("removed", static_cast<std::int64_t>(removed.size()))});
  }
  return removed;
}

// ------------------------------------------------------------
// Manual edits
// ------------------------------------------------------------

void GoalLifecycle::UpdateGoal(const GoalId& id, const GoalUpdate& update) {
  guard_.Write([&](graph::GoalGraph& graph) {
    const auto& current = graph.Get(id);
    if (current.is_locked && (update.title || update.body)) {
      throw util::LockedError("goal is locked: " + id);
    }

    auto& goal = graph.Mutable(id);
    if (update.title && !update.title->empty()) {
      goal.title = *update.title;
    }
    if (update.body) {
      goal.body = *update.body;
    }
    if (update.category && !update.category->empty()) {
      goal.category = *update.category;
    }
    if (update.priority) {
      goal.priority = *update.priority;
    }
    model::AppendRevision(goal, "Goal updated", "Manual edit", util::Now());
  });
}

void GoalLifecycle::SetProgress(const GoalId& id, double value) {
  guard_.Write([&](graph::GoalGraph& graph) {
    const auto& current = graph.Get(id);
    RequireUnlocked(current);
    if (graph.HasChildren(id) || !current.sequential_steps.empty()) {
      throw util::InvalidState("progress of " + id + " is derived from its subgoals or steps");
    }

    auto& goal      = graph.Mutable(id);
    goal.progress   = progress::Clamp(value);
    goal.updated_at = util::Now();
  });
}

} // namespace goalgraph::lifecycle
