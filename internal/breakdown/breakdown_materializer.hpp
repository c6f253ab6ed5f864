#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/collaborators/reasoning_service.hpp"
#include "internal/graph/goal_graph.hpp"

namespace goalgraph::breakdown {

struct BreakdownResult {
  std::vector<model::GoalId>           created_goals; // pre-order
  std::size_t                          atomic_task_count = 0;
  std::size_t                          dependency_count  = 0;
  std::map<std::string, model::GoalId> assigned_identifiers;
};

/*
  Throws util::InvalidBreakdown for duplicate external ids, dependencies on ids
  absent from the tree, or untitled nodes. Never touches a graph.
*/
void Validate(const collaborators::DecompositionTree& tree);

/*
  Materialises a decomposition tree under `target` in two phases: every node is
  created first, declared dependencies are resolved afterwards. Edges that
  would break the DAG are dropped and logged.

  Callers reject targets that are locked, already broken down or already have
  subgoals; this builder does not re-check. Run it under the graph write lock.
*/
BreakdownResult Apply(graph::GoalGraph& graph, const model::GoalId& target, const collaborators::DecompositionTree& tree,
                      model::TimePoint now);

// "Launch Plan!" -> "launch-plan"
std::string Slugify(const std::string& raw);

model::Priority PriorityForDifficulty(const std::optional<std::string>& difficulty);

} // namespace goalgraph::breakdown
