#include "context_builder.hpp"

#include "internal/progress/progress_aggregator.hpp"

namespace goalgraph::collaborators {

GoalContext BuildContext(const graph::GoalGraph& graph, const model::GoalId& id) {
  const auto& goal = graph.Get(id);

  GoalContext context;
  context.goal_title = goal.title;
  context.category   = goal.category;
  context.progress   = progress::Progress(graph, id);

  for (const auto& child : graph.Children(id)) {
    context.subgoal_titles.push_back(graph.Get(child).title);
  }
  for (const auto& step_id : goal.sequential_steps) {
    const auto& step = graph.Get(step_id);
    if (step.step_status == model::StepStatus::kCompleted) {
      context.completed_step_titles.push_back(step.title);
    }
  }
  for (const auto& top : graph.TopLevelGoals()) {
    const auto& other = graph.Get(top);
    if (other.id != id && other.state == model::ActivationState::kActive) {
      context.active_goal_titles.push_back(other.title);
    }
  }
  return context;
}

} // namespace goalgraph::collaborators
