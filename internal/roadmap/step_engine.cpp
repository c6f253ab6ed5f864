#include "step_engine.hpp"

#include <algorithm>
#include <cctype>
#include <set>

#include "internal/collaborators/context_builder.hpp"
#include "internal/collaborators/external_call.hpp"
#include "internal/lifecycle/transitions.hpp"
#include "internal/observability/logging.hpp"
#include "internal/progress/progress_aggregator.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace goalgraph::roadmap {

namespace {

using model::Goal;
using model::GoalId;
using model::StepStatus;

constexpr const char* kStepCompletedRationale = "Step completed";
constexpr const char* kRoadmapCompleteRationale = "All sequential steps completed";

const Goal& RoadmapGoal(const graph::GoalGraph& graph, const GoalId& goal_id) {
  const auto& goal = graph.Get(goal_id);
  if (!goal.has_sequential_steps || goal.sequential_steps.empty()) {
    throw util::InvalidState("goal has no roadmap: " + goal_id);
  }
  return goal;
}

std::optional<GoalId> CurrentStep(const graph::GoalGraph& graph, const Goal& goal) {
  for (const auto& step_id : goal.sequential_steps) {
    if (graph.Get(step_id).step_status == StepStatus::kCurrent) {
      return step_id;
    }
  }
  return std::nullopt;
}

std::optional<GoalId> NextPendingStep(const graph::GoalGraph& graph, const Goal& goal) {
  for (const auto& step_id : goal.sequential_steps) {
    if (graph.Get(step_id).step_status == StepStatus::kPending) {
      return step_id;
    }
  }
  return std::nullopt;
}

void CompleteStep(Goal& step, model::TimePoint now) {
  step.progress     = 1.0;
  step.step_status  = StepStatus::kCompleted;
  step.completed_at = now;
  lifecycle::ApplyLock(step, kStepCompletedRationale, now);
}

// Writes the ratio into the stored progress unless the owner is locked.
double SyncProgress(graph::GoalGraph& graph, const GoalId& goal_id) {
  const double ratio = progress::Progress(graph, goal_id);
  if (!graph.Get(goal_id).is_locked) {
    graph.Mutable(goal_id).progress = ratio;
  }
  return ratio;
}

Goal MakeStep(std::string title, std::string body, model::TimePoint now, std::int64_t days) {
  Goal step;
  step.id          = util::GenerateId();
  step.created_at  = now;
  step.updated_at  = now;
  step.title       = std::move(title);
  step.body        = std::move(body);
  step.is_atomic   = true;
  step.target_date = util::AddDays(now, days);
  return step;
}

} // namespace

std::string NormalizeStepTitle(const std::string& title) {
  const auto first = std::find_if_not(title.begin(), title.end(), [](unsigned char c) { return std::isspace(c); });
  const auto last  = std::find_if_not(title.rbegin(), title.rend(), [](unsigned char c) { return std::isspace(c); }).base();
  std::string normalized;
  if (first < last) {
    normalized.assign(first, last);
  }
  std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return normalized;
}

StepEngine::StepEngine(core::GraphGuard& guard, collaborators::ReasoningService& reasoning, collaborators::CalendarService& calendar,
                       config::EngineOptions options)
    : guard_(guard), reasoning_(reasoning), calendar_(calendar), options_(std::move(options)) {
}

std::vector<GoalId> StepEngine::BeginRoadmap(const GoalId& goal_id, const std::vector<StepSeed>& seeds) {
  if (seeds.empty()) {
    throw util::InvalidArgument("roadmap needs at least one step: " + goal_id);
  }
  if (seeds.size() > options_.step_hard_limit) {
    throw util::StepLimitExceeded("roadmap exceeds " + std::to_string(options_.step_hard_limit) + " steps: " + goal_id, options_.step_hard_limit);
  }

  std::set<std::string> titles;
  for (std::size_t i = 0; i < seeds.size(); ++i) {
    const auto& seed = seeds[i];
    if (seed.is_final_step && i + 1 != seeds.size()) {
      throw util::InvalidArgument("only the last roadmap step can be final: " + seed.title);
    }
    const auto normalized = NormalizeStepTitle(seed.title);
    if (normalized.empty()) {
      throw util::InvalidArgument("roadmap step title must not be empty");
    }
    if (!titles.insert(normalized).second) {
      throw util::DuplicateStepTitle("duplicate roadmap step: " + seed.title, seed.title);
    }
  }

  return guard_.Write([&](graph::GoalGraph& graph) {
    const auto& goal = graph.Get(goal_id);
    if (goal.is_locked) {
      throw util::LockedError("goal is locked: " + goal_id);
    }
    if (goal.has_sequential_steps || !goal.sequential_steps.empty()) {
      throw util::InvalidState("goal already has a roadmap: " + goal_id);
    }
    if (graph.HasChildren(goal_id)) {
      throw util::InvalidState("goal with subgoals cannot start a roadmap: " + goal_id);
    }

    const auto          now = util::Now();
    std::vector<GoalId> created;
    for (const auto& seed : seeds) {
      auto step          = MakeStep(seed.title, seed.body, now, seed.days_from_now.value_or(static_cast<int>(options_.default_step_days)));
      step.step_status   = created.empty() ? StepStatus::kCurrent : StepStatus::kPending;
      step.is_final_step = seed.is_final_step;
      created.push_back(graph.AppendStep(goal_id, std::move(step)).id);
    }

    auto& owner = graph.Mutable(goal_id);
    model::AppendRevision(owner, "Roadmap started", std::to_string(created.size()) + " steps", now);
    SyncProgress(graph, goal_id);
    return created;
  });
}

StepAdvanceResult StepEngine::CompleteCurrentStep(const GoalId& goal_id) {
  struct Prepared {
    GoalId                          current;
    bool                            final_step = false;
    std::optional<GoalId>           pending;
    Goal                            goal;
    Goal                            step;
    collaborators::GoalContext      context;
  };

  auto prepared = guard_.Read([&](const graph::GoalGraph& graph) {
    const auto& goal    = RoadmapGoal(graph, goal_id);
    const auto  current = CurrentStep(graph, goal);
    if (!current) {
      throw util::InvalidState("roadmap has no current step: " + goal_id);
    }

    Prepared out;
    out.current    = *current;
    out.final_step = graph.Get(*current).is_final_step;
    if (!out.final_step) {
      out.pending = NextPendingStep(graph, goal);
    }
    if (!out.final_step && !out.pending) {
      if (goal.sequential_steps.size() >= options_.step_hard_limit) {
        throw util::StepLimitExceeded("roadmap reached " + std::to_string(options_.step_hard_limit) + " steps; complete or split the goal: " + goal_id,
                                      options_.step_hard_limit);
      }
      out.goal    = goal;
      out.step    = graph.Get(*current);
      out.context = collaborators::BuildContext(graph, goal_id);
    }
    return out;
  });

  std::optional<collaborators::NextStepProposal> proposal;
  if (!prepared.final_step && !prepared.pending) {
    proposal = collaborators::CallExternal("request_next_step",
                                           [&] { return reasoning_.RequestNextStep(prepared.goal, prepared.step, prepared.context); });
  }

  std::vector<std::string> to_cancel;
  auto result = guard_.Write([&](graph::GoalGraph& graph) {
    const auto& goal    = RoadmapGoal(graph, goal_id);
    const auto  current = CurrentStep(graph, goal);
    if (!current || *current != prepared.current) {
      throw util::InvalidState("roadmap changed while the next step was requested: " + goal_id);
    }

    const auto        now = util::Now();
    StepAdvanceResult out;
    out.completed_step = *current;

    if (prepared.final_step) {
      if (!model::CanTransition(goal.state, model::ActivationState::kCompleted)) {
        throw util::InvalidState("goal cannot be completed from " + std::string(model::ToString(goal.state)) + ": " + goal_id);
      }
      CompleteStep(graph.Mutable(*current), now);
      auto& owner = graph.Mutable(goal_id);
      if (!owner.is_locked) {
        owner.progress = 1.0;
      }
      to_cancel   = lifecycle::ApplyStateChange(owner, model::ActivationState::kCompleted, "Completed", kRoadmapCompleteRationale, now);
      out.outcome  = AdvanceOutcome::kGoalCompleted;
      out.progress = 1.0;
      return out;
    }

    if (prepared.pending) {
      if (graph.Get(*prepared.pending).step_status != StepStatus::kPending) {
        throw util::InvalidState("roadmap changed while the step was completed: " + goal_id);
      }
      CompleteStep(graph.Mutable(*current), now);
      graph.Mutable(*prepared.pending).step_status = StepStatus::kCurrent;
      out.outcome  = AdvanceOutcome::kAdvanced;
      out.new_step = *prepared.pending;
      out.progress = SyncProgress(graph, goal_id);
      out.warning  = SoftLimitWarning(graph, goal_id);
      return out;
    }

    if (goal.sequential_steps.size() >= options_.step_hard_limit) {
      throw util::StepLimitExceeded("roadmap reached " + std::to_string(options_.step_hard_limit) + " steps: " + goal_id, options_.step_hard_limit);
    }

    const auto candidate = NormalizeStepTitle(proposal->title);
    const bool duplicate = candidate.empty() || std::any_of(goal.sequential_steps.begin(), goal.sequential_steps.end(), [&](const GoalId& id) {
                             return NormalizeStepTitle(graph.Get(id).title) == candidate;
                           });

    CompleteStep(graph.Mutable(*current), now);

    if (duplicate) {
      GOALGRAPH_LOG_WARN("Skipped duplicate roadmap step",
                         {observability::StringField("goal_id", goal_id), observability::StringField("title", proposal->title)});
      out.outcome         = AdvanceOutcome::kDuplicateSkipped;
      out.duplicate_title = proposal->title;
      out.progress        = SyncProgress(graph, goal_id);
      return out;
    }

    const auto days = proposal->days_from_now.value_or(static_cast<int>(options_.default_step_days));
    auto       step = MakeStep(proposal->title, proposal->ai_suggestion.value_or(proposal->outcome), now, days);
    step.step_status   = StepStatus::kCurrent;
    step.is_final_step = proposal->is_goal_complete;
    out.new_step       = graph.AppendStep(goal_id, std::move(step)).id;

    if (!proposal->tree_sections.empty()) {
      graph.Mutable(goal_id).tree_sections = proposal->tree_sections;
    }

    out.outcome  = AdvanceOutcome::kAdvanced;
    out.progress = SyncProgress(graph, goal_id);
    out.warning  = SoftLimitWarning(graph, goal_id);
    return out;
  });

  GOALGRAPH_LOG_DEBUG("Roadmap step completed", {observability::StringField("goal_id", goal_id),
                                                 observability::IntField("outcome", static_cast<std::int64_t>(result.outcome)),
                                                 observability::DoubleField("progress", result.progress)});
  lifecycle::CancelEventsBestEffort(calendar_, goal_id, to_cancel);
  return result;
}

std::optional<std::string> StepEngine::SoftLimitWarning(const graph::GoalGraph& graph, const GoalId& goal_id) const {
  const auto count = graph.Get(goal_id).sequential_steps.size();
  if (count < options_.step_soft_warning) {
    return std::nullopt;
  }
  GOALGRAPH_LOG_WARN("Roadmap approaching step limit", {observability::StringField("goal_id", goal_id),
                                                        observability::IntField("steps", static_cast<std::int64_t>(count)),
                                                        observability::IntField("limit", static_cast<std::int64_t>(options_.step_hard_limit))});
  return "Roadmap has " + std::to_string(count) + " steps; consider splitting the goal";
}

std::optional<GoalId> StepEngine::RecoverRoadmap(const GoalId& goal_id) {
  return guard_.Write([&](graph::GoalGraph& graph) -> std::optional<GoalId> {
    const auto steps = RoadmapGoal(graph, goal_id).sequential_steps;

    std::optional<GoalId> current;
    for (const auto& id : steps) {
      if (graph.Get(id).step_status != StepStatus::kCurrent) continue;
      if (!current) {
        current = id;
      } else {
        graph.Mutable(id).step_status = StepStatus::kPending;
        GOALGRAPH_LOG_WARN("Demoted surplus current step", {observability::StringField("goal_id", goal_id), observability::StringField("step_id", id)});
      }
    }
    if (current) {
      return current;
    }

    for (const auto status : {StepStatus::kPending, StepStatus::kUnknown}) {
      for (const auto& id : steps) {
        if (graph.Get(id).step_status == status) {
          graph.Mutable(id).step_status = StepStatus::kCurrent;
          GOALGRAPH_LOG_INFO("Recovered roadmap step", {observability::StringField("goal_id", goal_id), observability::StringField("step_id", id)});
          return id;
        }
      }
    }
    return std::nullopt;
  });
}

} // namespace goalgraph::roadmap
