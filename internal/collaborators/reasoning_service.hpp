#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/goal.hpp"

namespace goalgraph::collaborators {

/*
  Read-only summary handed to the reasoning service with every request.
*/
struct GoalContext {
  std::string              goal_title;
  std::string              category;
  double                   progress = 0.0;
  std::vector<std::string> subgoal_titles;
  std::vector<std::string> completed_step_titles;
  std::vector<std::string> active_goal_titles;
};

struct DecompositionNode {
  std::string                    external_id;
  std::string                    title;
  std::string                    description;
  std::optional<double>          estimated_hours;
  std::vector<std::string>       dependencies; // external ids of prerequisites
  std::optional<std::string>     difficulty;
  std::vector<DecompositionNode> children;
  bool                           is_atomic = false;
  std::optional<model::Priority> priority;
};

struct DecompositionTree {
  std::vector<DecompositionNode> roots;
  std::vector<std::string>       recommended_order; // external ids of roots
  double                         total_estimated_hours = 0.0;
};

struct Regeneration {
  std::string                    title;
  std::string                    body;
  std::optional<std::string>     category;
  std::optional<model::Priority> priority;
};

struct ProposedSession {
  std::string               title;
  model::TimePoint          start{};
  std::chrono::seconds      duration{0};
  std::optional<std::string> notes;
};

struct ActivationPlan {
  std::vector<ProposedSession> sessions;
  std::vector<std::string>     tips;
};

struct NextStepProposal {
  std::string                       title;
  std::string                       outcome;
  std::optional<std::string>        ai_suggestion;
  std::optional<int>                days_from_now;
  bool                              is_goal_complete = false;
  std::optional<double>             confidence;
  std::vector<model::TreeSection>   tree_sections;
};

/*
  Reasoning collaborator boundary.

  Every call is a request/response that may fail, time out or be cancelled;
  implementations report that by throwing. Retries are the implementation's
  concern.
*/
class ReasoningService {
 public:
  virtual ~ReasoningService() = default;

  virtual DecompositionTree RequestBreakdown(const model::Goal& goal, const GoalContext& context) = 0;

  virtual Regeneration RequestRegeneration(const model::Goal& goal, const GoalContext& context) = 0;

  virtual ActivationPlan RequestActivationPlan(const model::Goal& goal, const std::vector<model::Goal>& all_goals) = 0;

  virtual NextStepProposal RequestNextStep(const model::Goal& goal, const model::Goal& completed_step, const GoalContext& context) = 0;

  // Short rationale captured into the lock snapshot.
  virtual std::string SummarizeForLock(const model::Goal& goal, const GoalContext& context) = 0;
};

} // namespace goalgraph::collaborators
