#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>

#include "internal/db/api/repository.hpp"

namespace goalgraph::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                           UpsertGoal(Transaction&, const model::GoalRecord&) override;
  std::optional<model::GoalRecord> GetGoal(Transaction&, const std::string& id) override;
  std::vector<model::GoalRecord>   ListGoals(Transaction&) override;
  Result                           DeleteGoal(Transaction&, const std::string& id) override;

  Result InsertDependency(Transaction&, const model::DependencyRecord&) override;
  Result DeleteDependency(Transaction&, const std::string& prerequisite_id, const std::string& dependent_id) override;
  std::vector<model::DependencyRecord> ListDependencies(Transaction&) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, model::GoalRecord>                                  goals;
    std::map<std::pair<std::string, std::string>, model::DependencyRecord> dependencies;
  };

  std::mutex    mutex_;
  State         committed_;
  std::uint64_t committed_version_ = 0;
};

} // namespace goalgraph::db::memory
