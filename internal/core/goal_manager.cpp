#include "goal_manager.hpp"

#include <stdexcept>

#include "internal/collaborators/context_builder.hpp"
#include "internal/collaborators/external_call.hpp"
#include "internal/db/codec/goal_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/progress/progress_aggregator.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace goalgraph::core {

namespace {

using model::Goal;
using model::GoalId;

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Conflict:
      throw util::InvalidState(message);
    default:
      throw std::runtime_error(message);
  }
}

// Rows that were never saved are fine to miss when deleting.
void ThrowIfDbErrorExceptMissing(const db::Result& result, const std::string& context) {
  if (result.code == db::ErrorCode::NotFound) {
    return;
  }
  ThrowIfDbError(result, context);
}

std::vector<Goal> Resolve(const graph::GoalGraph& graph, const std::vector<GoalId>& ids) {
  std::vector<Goal> goals;
  goals.reserve(ids.size());
  for (const auto& id : ids) {
    goals.push_back(graph.Get(id));
  }
  return goals;
}

bool IsBlank(const std::string& text) {
  return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

GoalManager::GoalManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<collaborators::ReasoningService> reasoning,
                         std::shared_ptr<collaborators::CalendarService> calendar, config::EngineOptions options)
    : repository_(std::move(repository)),
      reasoning_(std::move(reasoning)),
      calendar_(std::move(calendar)),
      options_(std::move(options)),
      lifecycle_(guard_, *reasoning_, *calendar_, options_),
      steps_(guard_, *reasoning_, *calendar_, options_) {
}

timeline::TimelineOptions GoalManager::TimelineOptions() const {
  timeline::TimelineOptions out;
  out.default_span_days  = options_.default_span_days;
  out.planned_phase_days = options_.planned_phase_days;
  return out;
}

// ------------------------------------------------------------
// Queries
// ------------------------------------------------------------

std::vector<Goal> GoalManager::TopLevelGoals() const {
  return guard_.Read([](const graph::GoalGraph& graph) { return Resolve(graph, graph.TopLevelGoals()); });
}

Goal GoalManager::Get(const GoalId& id) const {
  return guard_.Read([&](const graph::GoalGraph& graph) { return graph.Get(id); });
}

std::vector<Goal> GoalManager::Children(const GoalId& id) const {
  return guard_.Read([&](const graph::GoalGraph& graph) {
    graph.Get(id);
    return Resolve(graph, graph.Children(id));
  });
}

std::vector<Goal> GoalManager::Descendants(const GoalId& id, bool include_self) const {
  return guard_.Read([&](const graph::GoalGraph& graph) {
    graph.Get(id);
    return Resolve(graph, graph.Descendants(id, include_self));
  });
}

std::vector<Goal> GoalManager::Leaves(const GoalId& id) const {
  return guard_.Read([&](const graph::GoalGraph& graph) {
    graph.Get(id);
    return Resolve(graph, graph.Leaves(id));
  });
}

std::vector<Goal> GoalManager::Steps(const GoalId& id) const {
  return guard_.Read([&](const graph::GoalGraph& graph) {
    graph.Get(id);
    return Resolve(graph, graph.Steps(id));
  });
}

double GoalManager::Progress(const GoalId& id) const {
  return guard_.Read([&](const graph::GoalGraph& graph) { return progress::Progress(graph, id); });
}

std::vector<model::RevisionRecord> GoalManager::RevisionHistory(const GoalId& id) const {
  return guard_.Read([&](const graph::GoalGraph& graph) { return graph.Get(id).revisions; });
}

std::vector<model::DependencyEdge> GoalManager::IncomingDependencies(const GoalId& id) const {
  return guard_.Read([&](const graph::GoalGraph& graph) {
    graph.Get(id);
    return graph.IncomingDependencies(id);
  });
}

std::vector<model::DependencyEdge> GoalManager::OutgoingDependencies(const GoalId& id) const {
  return guard_.Read([&](const graph::GoalGraph& graph) {
    graph.Get(id);
    return graph.OutgoingDependencies(id);
  });
}

std::vector<timeline::TimelineEntry> GoalManager::TimelineEntries(const GoalId& id, const timeline::Horizon& horizon) const {
  const auto goal = Get(id);
  return timeline::BuildEntries(goal, horizon, util::Now(), TimelineOptions());
}

bool GoalManager::IsInHorizon(const GoalId& id, const timeline::Horizon& horizon) const {
  const auto goal = Get(id);
  return timeline::IsInHorizon(goal, horizon, util::Now(), TimelineOptions());
}

// ------------------------------------------------------------
// Structure
// ------------------------------------------------------------

Goal GoalManager::CreateGoal(const NewGoal& draft, const std::optional<GoalId>& parent) {
  if (IsBlank(draft.title)) {
    throw util::InvalidArgument("goal title must not be empty");
  }

  return guard_.Write([&](graph::GoalGraph& graph) {
    const auto now = util::Now();

    Goal goal;
    goal.id          = util::GenerateId();
    goal.created_at  = now;
    goal.updated_at  = now;
    goal.title       = draft.title;
    goal.body        = draft.body;
    goal.priority    = draft.priority;
    goal.kind        = draft.kind;
    goal.target_date = draft.target_date;
    goal.glyph       = draft.glyph;
    if (!draft.category.empty()) {
      goal.category = draft.category;
    } else if (parent) {
      goal.category = graph.Get(*parent).category;
    }
    return graph.Insert(std::move(goal), parent);
  });
}

model::DependencyEdge GoalManager::AddDependency(const GoalId& prerequisite, const GoalId& dependent, model::DependencyKind kind,
                                                 std::optional<std::string> note) {
  return guard_.Write([&](graph::GoalGraph& graph) {
    return graph.AddDependency(prerequisite, dependent, kind, std::move(note), util::Now());
  });
}

bool GoalManager::RemoveDependency(const GoalId& prerequisite, const GoalId& dependent) {
  return guard_.Write([&](graph::GoalGraph& graph) { return graph.RemoveDependency(prerequisite, dependent); });
}

void GoalManager::Reparent(const GoalId& id, const std::optional<GoalId>& new_parent) {
  guard_.Write([&](graph::GoalGraph& graph) { graph.Reparent(id, new_parent); });
}

std::vector<GoalId> GoalManager::Delete(const GoalId& id) {
  return lifecycle_.Delete(id);
}

void GoalManager::UpdateGoal(const GoalId& id, const lifecycle::GoalUpdate& update) {
  lifecycle_.UpdateGoal(id, update);
}

void GoalManager::SetProgress(const GoalId& id, double value) {
  lifecycle_.SetProgress(id, value);
}

// ------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------

model::GoalSnapshot GoalManager::Lock(const GoalId& id) {
  return lifecycle_.Lock(id);
}

bool GoalManager::Unlock(const GoalId& id, const std::string& reason) {
  return lifecycle_.Unlock(id, reason);
}

void GoalManager::Regenerate(const GoalId& id) {
  lifecycle_.Regenerate(id);
}

collaborators::ActivationPlan GoalManager::GenerateActivationPlan(const GoalId& id) {
  return lifecycle_.GenerateActivationPlan(id);
}

void GoalManager::ConfirmActivation(const GoalId& id, const collaborators::ActivationPlan& plan) {
  lifecycle_.ConfirmActivation(id, plan);
}

void GoalManager::Activate(const GoalId& id) {
  lifecycle_.Activate(id);
}

void GoalManager::Deactivate(const GoalId& id, model::ActivationState to, const std::string& rationale) {
  lifecycle_.Deactivate(id, to, rationale);
}

void GoalManager::Complete(const GoalId& id) {
  lifecycle_.Complete(id);
}

// ------------------------------------------------------------
// Breakdown and roadmap
// ------------------------------------------------------------

namespace {

void RequireBreakdownTarget(const graph::GoalGraph& graph, const GoalId& id) {
  const auto& goal = graph.Get(id);
  if (goal.is_locked) {
    throw util::LockedError("goal is locked: " + id);
  }
  if (goal.has_been_broken_down) {
    throw util::InvalidState("goal was already broken down: " + id);
  }
  if (graph.HasChildren(id)) {
    throw util::InvalidState("goal already has subgoals: " + id);
  }
  if (goal.has_sequential_steps) {
    throw util::InvalidState("goal follows a roadmap: " + id);
  }
}

} // namespace

breakdown::BreakdownResult GoalManager::BreakDown(const GoalId& id) {
  const auto prepared = guard_.Read([&](const graph::GoalGraph& graph) {
    RequireBreakdownTarget(graph, id);
    return std::make_pair(graph.Get(id), collaborators::BuildContext(graph, id));
  });

  const auto tree = collaborators::CallExternal("request_breakdown", [&] { return reasoning_->RequestBreakdown(prepared.first, prepared.second); });
  return ApplyBreakdown(id, tree);
}

breakdown::BreakdownResult GoalManager::ApplyBreakdown(const GoalId& id, const collaborators::DecompositionTree& tree) {
  breakdown::Validate(tree);
  return guard_.Write([&](graph::GoalGraph& graph) {
    RequireBreakdownTarget(graph, id);
    return breakdown::Apply(graph, id, tree, util::Now());
  });
}

std::vector<GoalId> GoalManager::BeginRoadmap(const GoalId& id, const std::vector<roadmap::StepSeed>& seeds) {
  return steps_.BeginRoadmap(id, seeds);
}

roadmap::StepAdvanceResult GoalManager::CompleteCurrentStep(const GoalId& id) {
  return steps_.CompleteCurrentStep(id);
}

std::optional<GoalId> GoalManager::RecoverRoadmap(const GoalId& id) {
  return steps_.RecoverRoadmap(id);
}

// ------------------------------------------------------------
// Timeline enrichment
// ------------------------------------------------------------

void GoalManager::AttachProjection(const GoalId& id, model::Projection projection) {
  if (projection.id.empty()) {
    projection.id = util::GenerateId();
  }
  if (projection.end < projection.start) {
    throw util::InvalidArgument("projection ends before it starts: " + projection.id);
  }
  guard_.Write([&](graph::GoalGraph& graph) {
    auto& goal = graph.Mutable(id);
    goal.projections.push_back(std::move(projection));
    goal.updated_at = util::Now();
  });
}

void GoalManager::AttachPhase(const GoalId& id, model::Phase phase) {
  if (phase.id.empty()) {
    phase.id = util::GenerateId();
  }
  guard_.Write([&](graph::GoalGraph& graph) {
    auto& goal = graph.Mutable(id);
    goal.phases.push_back(std::move(phase));
    goal.updated_at = util::Now();
  });
}

void GoalManager::SetTargetMetric(const GoalId& id, std::optional<model::TargetMetric> metric) {
  guard_.Write([&](graph::GoalGraph& graph) {
    auto& goal         = graph.Mutable(id);
    goal.target_metric = std::move(metric);
    goal.updated_at    = util::Now();
  });
}

void GoalManager::SetGlyph(const GoalId& id, std::optional<std::string> glyph) {
  guard_.Write([&](graph::GoalGraph& graph) {
    auto& goal      = graph.Mutable(id);
    goal.glyph      = std::move(glyph);
    goal.updated_at = util::Now();
  });
}

// ------------------------------------------------------------
// Persistence
// ------------------------------------------------------------

graph::LoadReport GoalManager::Hydrate() {
  std::vector<Goal>                  goals;
  std::vector<model::DependencyEdge> edges;
  {
    auto tx = repository_->Begin();
    for (const auto& record : repository_->ListGoals(*tx)) {
      goals.push_back(db::codec::DecodeGoal(record));
    }
    for (const auto& record : repository_->ListDependencies(*tx)) {
      edges.push_back(db::codec::DecodeDependency(record));
    }
    tx->Commit();
  }

  auto report = guard_.Write([&](graph::GoalGraph& graph) { return graph.Load(std::move(goals), edges); });

  for (const auto& id : report.detached) {
    GOALGRAPH_LOG_WARN("Detached goal with dangling or cyclic parent", {observability::StringField("goal_id", id)});
  }
  for (const auto& edge : report.dropped_edges) {
    GOALGRAPH_LOG_WARN("Dropped invalid stored dependency",
                       {observability::StringField("prerequisite", edge.prerequisite), observability::StringField("dependent", edge.dependent)});
  }
  GOALGRAPH_LOG_INFO("Goal graph hydrated", {observability::IntField("goals", static_cast<std::int64_t>(report.goals)),
                                             observability::IntField("edges", static_cast<std::int64_t>(report.edges))});
  return report;
}

SaveSummary GoalManager::Save() {
  // Exclusive for the whole save so the change set and the rows agree.
  return guard_.Write([&](graph::GoalGraph& graph) {
    const auto  changes = graph.PendingChanges();
    SaveSummary summary;
    if (changes.empty()) {
      return summary;
    }

    auto tx = repository_->Begin();
    for (const auto& [prerequisite, dependent] : changes.removed_edges) {
      ThrowIfDbErrorExceptMissing(repository_->DeleteDependency(*tx, prerequisite, dependent), "delete dependency");
    }
    for (const auto& id : changes.deleted) {
      ThrowIfDbErrorExceptMissing(repository_->DeleteGoal(*tx, id), "delete goal");
    }
    for (const auto& id : changes.upserted) {
      const auto* goal = graph.Find(id);
      if (goal == nullptr) continue;
      ThrowIfDbError(repository_->UpsertGoal(*tx, db::codec::EncodeGoal(*goal)), "save goal");
      ++summary.upserted;
    }
    for (const auto& edge : changes.added_edges) {
      ThrowIfDbError(repository_->InsertDependency(*tx, db::codec::EncodeDependency(edge)), "save dependency");
    }
    tx->Commit();
    graph.ClearChanges();

    summary.deleted       = changes.deleted.size();
    summary.added_edges   = changes.added_edges.size();
    summary.removed_edges = changes.removed_edges.size();
    GOALGRAPH_LOG_INFO("Goal graph saved", {observability::IntField("upserted", static_cast<std::int64_t>(summary.upserted)),
                                            observability::IntField("deleted", static_cast<std::int64_t>(summary.deleted)),
                                            observability::IntField("added_edges", static_cast<std::int64_t>(summary.added_edges)),
                                            observability::IntField("removed_edges", static_cast<std::int64_t>(summary.removed_edges))});
    return summary;
  });
}

} // namespace goalgraph::core
