#pragma once

#include "internal/db/model/dependency_record.hpp"
#include "internal/db/model/goal_record.hpp"
#include "internal/model/goal.hpp"

namespace goalgraph::db::codec {

/*
  Goal <-> row translation. Goals travel as goalgraph.store.v1.GoalDocument
  serialised to JSON; malformed rows raise std::runtime_error.
*/

model::GoalRecord       EncodeGoal(const goalgraph::model::Goal& goal);
goalgraph::model::Goal  DecodeGoal(const model::GoalRecord& record);

model::DependencyRecord          EncodeDependency(const goalgraph::model::DependencyEdge& edge);
goalgraph::model::DependencyEdge DecodeDependency(const model::DependencyRecord& record);

} // namespace goalgraph::db::codec
