#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace goalgraph::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Goals
// ------------------------------------------------------------------

Result MemoryRepository::UpsertGoal(Transaction& t, const model::GoalRecord& r) {
  if (r.id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "goal id must not be empty");
  TX(t).Mutable().goals[r.id] = r;
  return Result::Ok();
}

std::optional<model::GoalRecord> MemoryRepository::GetGoal(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  const auto  it = s.goals.find(id);
  if (it == s.goals.end()) return std::nullopt;
  return it->second;
}

std::vector<model::GoalRecord> MemoryRepository::ListGoals(Transaction& t) {
  const auto&                    s = TX(t).View();
  std::vector<model::GoalRecord> records;
  records.reserve(s.goals.size());
  for (const auto& [_, record] : s.goals) {
    records.push_back(record);
  }
  return records;
}

Result MemoryRepository::DeleteGoal(Transaction& t, const std::string& id) {
  auto& s = TX(t).Mutable();
  if (s.goals.erase(id) == 0) return Result::Err(ErrorCode::NotFound, "goal not found: " + id);

  for (auto it = s.dependencies.begin(); it != s.dependencies.end();) {
    if (it->first.first == id || it->first.second == id) {
      it = s.dependencies.erase(it);
    } else {
      ++it;
    }
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Dependencies
// ------------------------------------------------------------------

Result MemoryRepository::InsertDependency(Transaction& t, const model::DependencyRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.goals.contains(r.prerequisite_id) || !s.goals.contains(r.dependent_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "dependency references unknown goal");
  }
  const auto [_, inserted] = s.dependencies.try_emplace({r.prerequisite_id, r.dependent_id}, r);
  if (!inserted) return Result::Err(ErrorCode::AlreadyExists);
  return Result::Ok();
}

Result MemoryRepository::DeleteDependency(Transaction& t, const std::string& prerequisite_id, const std::string& dependent_id) {
  auto& s = TX(t).Mutable();
  if (s.dependencies.erase({prerequisite_id, dependent_id}) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

std::vector<model::DependencyRecord> MemoryRepository::ListDependencies(Transaction& t) {
  std::vector<model::DependencyRecord> out;
  for (const auto& [_, record] : TX(t).View().dependencies) {
    out.push_back(record);
  }
  return out;
}

} // namespace goalgraph::db::memory
