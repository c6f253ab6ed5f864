#pragma once

#include <cstddef>

#include "internal/graph/goal_graph.hpp"

namespace goalgraph::progress {

/*
  Effective completion in [0,1], computed from current graph state on every call:

    roadmap goal with steps -> completed steps / total steps
    goal with subgoals      -> mean over every leaf descendant (depth-independent)
    otherwise               -> stored scalar
*/
double Progress(const graph::GoalGraph& graph, const model::GoalId& id);

struct StepCounts {
  std::size_t completed = 0;
  std::size_t total     = 0;
};

StepCounts CountSteps(const graph::GoalGraph& graph, const model::GoalId& id);

double Clamp(double progress);

} // namespace goalgraph::progress
