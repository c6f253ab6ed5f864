#include "progress_aggregator.hpp"

#include <algorithm>
#include <cmath>

namespace goalgraph::progress {

namespace {

bool UsesSteps(const model::Goal& goal) {
  return goal.has_sequential_steps && !goal.sequential_steps.empty();
}

double StepRatio(const graph::GoalGraph& graph, const model::GoalId& id) {
  const auto counts = CountSteps(graph, id);
  if (counts.total == 0) {
    return Clamp(graph.Get(id).progress);
  }
  return static_cast<double>(counts.completed) / static_cast<double>(counts.total);
}

double LeafValue(const graph::GoalGraph& graph, const model::GoalId& id) {
  const auto& leaf = graph.Get(id);
  return UsesSteps(leaf) ? StepRatio(graph, id) : Clamp(leaf.progress);
}

} // namespace

double Clamp(double progress) {
  if (std::isnan(progress)) {
    return 0.0;
  }
  return std::clamp(progress, 0.0, 1.0);
}

StepCounts CountSteps(const graph::GoalGraph& graph, const model::GoalId& id) {
  StepCounts counts;
  for (const auto& step_id : graph.Get(id).sequential_steps) {
    const auto* step = graph.Find(step_id);
    if (!step) {
      continue;
    }
    ++counts.total;
    if (step->step_status == model::StepStatus::kCompleted) {
      ++counts.completed;
    }
  }
  return counts;
}

double Progress(const graph::GoalGraph& graph, const model::GoalId& id) {
  const auto& goal = graph.Get(id);
  if (UsesSteps(goal)) {
    return StepRatio(graph, id);
  }
  if (!graph.HasChildren(id)) {
    return Clamp(goal.progress);
  }

  const auto leaves = graph.Leaves(id);
  if (leaves.empty()) {
    return Clamp(goal.progress);
  }

  double sum = 0.0;
  for (const auto& leaf : leaves) {
    sum += LeafValue(graph, leaf);
  }
  return sum / static_cast<double>(leaves.size());
}

} // namespace goalgraph::progress
