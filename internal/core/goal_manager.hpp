#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/breakdown/breakdown_materializer.hpp"
#include "internal/collaborators/calendar_service.hpp"
#include "internal/collaborators/reasoning_service.hpp"
#include "internal/config/engine_options.hpp"
#include "internal/core/graph_guard.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/lifecycle/goal_lifecycle.hpp"
#include "internal/roadmap/step_engine.hpp"
#include "internal/timeline/timeline_projector.hpp"

namespace goalgraph::core {

struct NewGoal {
  std::string                     title;
  std::string                     body;
  std::string                     category; // empty inherits from the parent, else "General"
  model::Priority                 priority = model::Priority::kNext;
  model::GoalKind                 kind     = model::GoalKind::kCampaign;
  std::optional<model::TimePoint> target_date;
  std::optional<std::string>      glyph;
};

struct SaveSummary {
  std::size_t upserted      = 0;
  std::size_t deleted       = 0;
  std::size_t added_edges   = 0;
  std::size_t removed_edges = 0;
};

/*
  Presentation boundary over one goal graph.

  Queries return copies taken under the shared lock so callers never hold
  references into the graph. Mutations either complete or throw one of the
  util:: error types with the graph unchanged.
*/
class GoalManager {
 public:
  GoalManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<collaborators::ReasoningService> reasoning,
              std::shared_ptr<collaborators::CalendarService> calendar, config::EngineOptions options = {});

  // ---------------------------------------------------------------------
  // Queries
  // ---------------------------------------------------------------------

  std::vector<model::Goal>           TopLevelGoals() const;
  model::Goal                        Get(const model::GoalId& id) const;
  std::vector<model::Goal>           Children(const model::GoalId& id) const;
  std::vector<model::Goal>           Descendants(const model::GoalId& id, bool include_self = false) const;
  std::vector<model::Goal>           Leaves(const model::GoalId& id) const;
  std::vector<model::Goal>           Steps(const model::GoalId& id) const;
  double                             Progress(const model::GoalId& id) const;
  std::vector<model::RevisionRecord> RevisionHistory(const model::GoalId& id) const;
  std::vector<model::DependencyEdge> IncomingDependencies(const model::GoalId& id) const;
  std::vector<model::DependencyEdge> OutgoingDependencies(const model::GoalId& id) const;

  std::vector<timeline::TimelineEntry> TimelineEntries(const model::GoalId& id, const timeline::Horizon& horizon) const;
  bool                                 IsInHorizon(const model::GoalId& id, const timeline::Horizon& horizon) const;

  // ---------------------------------------------------------------------
  // Structure
  // ---------------------------------------------------------------------

  model::Goal                CreateGoal(const NewGoal& draft, const std::optional<model::GoalId>& parent = std::nullopt);
  model::DependencyEdge      AddDependency(const model::GoalId& prerequisite, const model::GoalId& dependent,
                                           model::DependencyKind kind = model::DependencyKind::kFinishToStart,
                                           std::optional<std::string> note = std::nullopt);
  bool                       RemoveDependency(const model::GoalId& prerequisite, const model::GoalId& dependent);
  void                       Reparent(const model::GoalId& id, const std::optional<model::GoalId>& new_parent);
  std::vector<model::GoalId> Delete(const model::GoalId& id);

  void UpdateGoal(const model::GoalId& id, const lifecycle::GoalUpdate& update);
  void SetProgress(const model::GoalId& id, double value);

  // ---------------------------------------------------------------------
  // Lifecycle
  // ---------------------------------------------------------------------

  model::GoalSnapshot           Lock(const model::GoalId& id);
  bool                          Unlock(const model::GoalId& id, const std::string& reason);
  void                          Regenerate(const model::GoalId& id);
  collaborators::ActivationPlan GenerateActivationPlan(const model::GoalId& id);
  void                          ConfirmActivation(const model::GoalId& id, const collaborators::ActivationPlan& plan);
  void                          Activate(const model::GoalId& id);
  void                          Deactivate(const model::GoalId& id, model::ActivationState to, const std::string& rationale);
  void                          Complete(const model::GoalId& id);

  // ---------------------------------------------------------------------
  // Breakdown and roadmap
  // ---------------------------------------------------------------------

  // Requests a decomposition and materialises it.
  breakdown::BreakdownResult BreakDown(const model::GoalId& id);
  breakdown::BreakdownResult ApplyBreakdown(const model::GoalId& id, const collaborators::DecompositionTree& tree);

  std::vector<model::GoalId>   BeginRoadmap(const model::GoalId& id, const std::vector<roadmap::StepSeed>& seeds);
  roadmap::StepAdvanceResult   CompleteCurrentStep(const model::GoalId& id);
  std::optional<model::GoalId> RecoverRoadmap(const model::GoalId& id);

  // ---------------------------------------------------------------------
  // Timeline enrichment
  // ---------------------------------------------------------------------

  void AttachProjection(const model::GoalId& id, model::Projection projection);
  void AttachPhase(const model::GoalId& id, model::Phase phase);
  void SetTargetMetric(const model::GoalId& id, std::optional<model::TargetMetric> metric);
  void SetGlyph(const model::GoalId& id, std::optional<std::string> glyph);

  // ---------------------------------------------------------------------
  // Persistence
  // ---------------------------------------------------------------------

  // Replaces the in-memory graph with the repository contents.
  graph::LoadReport Hydrate();

  // Writes every mutation since the last Hydrate/Save in one transaction.
  SaveSummary Save();

 private:
  timeline::TimelineOptions TimelineOptions() const;

  std::shared_ptr<db::Repository>                  repository_;
  std::shared_ptr<collaborators::ReasoningService> reasoning_;
  std::shared_ptr<collaborators::CalendarService>  calendar_;
  config::EngineOptions                            options_;

  GraphGuard               guard_;
  lifecycle::GoalLifecycle lifecycle_;
  roadmap::StepEngine      steps_;
};

} // namespace goalgraph::core
