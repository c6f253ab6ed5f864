#pragma once

#include "internal/collaborators/reasoning_service.hpp"
#include "internal/graph/goal_graph.hpp"

namespace goalgraph::collaborators {

GoalContext BuildContext(const graph::GoalGraph& graph, const model::GoalId& id);

} // namespace goalgraph::collaborators
