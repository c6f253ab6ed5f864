#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace goalgraph::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result                           UpsertGoal(Transaction&, const model::GoalRecord&) override;
  std::optional<model::GoalRecord> GetGoal(Transaction&, const std::string& id) override;
  std::vector<model::GoalRecord>   ListGoals(Transaction&) override;
  Result                           DeleteGoal(Transaction&, const std::string& id) override;

  Result InsertDependency(Transaction&, const model::DependencyRecord&) override;
  Result DeleteDependency(Transaction&, const std::string& prerequisite_id, const std::string& dependent_id) override;
  std::vector<model::DependencyRecord> ListDependencies(Transaction&) override;

  // Creates tables and indexes if missing.
  static void BootstrapSchema(SqliteDB& db);

 private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace goalgraph::db::sqlite
