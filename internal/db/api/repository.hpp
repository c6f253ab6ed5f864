#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/dependency_record.hpp"
#include "internal/db/model/goal_record.hpp"

namespace goalgraph::db {

/*
  Repository abstraction.

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Deleting a goal row removes every dependency row that references it

  The in-memory goal graph is authoritative while the process runs; the
  repository is what it is hydrated from and saved to.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Goals
  // ---------------------------------------------------------------------

  virtual Result UpsertGoal(Transaction&, const model::GoalRecord&) = 0;

  virtual std::optional<model::GoalRecord> GetGoal(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::GoalRecord> ListGoals(Transaction&) = 0;

  virtual Result DeleteGoal(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Dependency edges
  // ---------------------------------------------------------------------

  virtual Result InsertDependency(Transaction&, const model::DependencyRecord&) = 0;

  virtual Result DeleteDependency(Transaction&, const std::string& prerequisite_id, const std::string& dependent_id) = 0;

  virtual std::vector<model::DependencyRecord> ListDependencies(Transaction&) = 0;
};

} // namespace goalgraph::db
