#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "fakes/fake_collaborators.hpp"
#include "internal/core/goal_manager.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"

namespace {

using goalgraph::db::ErrorCode;
using goalgraph::db::Repository;
using goalgraph::db::memory::MemoryRepository;
using goalgraph::db::model::DependencyRecord;
using goalgraph::db::model::GoalRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

GoalRecord Row(const std::string& id, const std::string& parent = {}) {
  GoalRecord record;
  record.id            = id;
  record.parent_id     = parent;
  record.document      = R"({"id":")" + id + R"(","title":"Row )" + id + R"("})";
  record.updated_at_ms = NowMs();
  return record;
}

DependencyRecord Edge(const std::string& prerequisite, const std::string& dependent) {
  DependencyRecord record;
  record.prerequisite_id = prerequisite;
  record.dependent_id    = dependent;
  record.created_at_ms   = NowMs();
  return record;
}

bool HasEdge(Repository& repo, goalgraph::db::Transaction& tx, const std::string& prerequisite, const std::string& dependent) {
  for (const auto& edge : repo.ListDependencies(tx)) {
    if (edge.prerequisite_id == prerequisite && edge.dependent_id == dependent) return true;
  }
  return false;
}

void VerifyGoalUpsertGetListDelete(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();

  const auto b = prefix + "-b";
  const auto a = prefix + "-a";
  assert(repo.UpsertGoal(*tx, Row(b)));
  assert(repo.UpsertGoal(*tx, Row(a, b)));

  auto read = repo.GetGoal(*tx, a);
  assert(read.has_value());
  assert(read->parent_id == b);

  auto updated       = Row(a);
  updated.sort_index = 4;
  updated.owner_id   = b;
  assert(repo.UpsertGoal(*tx, updated));
  read = repo.GetGoal(*tx, a);
  assert(read->parent_id.empty());
  assert(read->owner_id == b);
  assert(read->sort_index == 4);

  // Rows come back ordered by id.
  std::vector<std::string> ids;
  for (const auto& record : repo.ListGoals(*tx)) {
    if (record.id.rfind(prefix, 0) == 0) ids.push_back(record.id);
  }
  assert((ids == std::vector<std::string>{a, b}));

  assert(repo.DeleteGoal(*tx, a));
  assert(!repo.GetGoal(*tx, a).has_value());
  assert(repo.DeleteGoal(*tx, a).code == ErrorCode::NotFound);

  tx->Commit();
}

void VerifyDependencyConstraints(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();

  const auto a = prefix + "-a";
  const auto b = prefix + "-b";
  assert(repo.UpsertGoal(*tx, Row(a)));
  assert(repo.UpsertGoal(*tx, Row(b)));

  auto edge = Edge(a, b);
  edge.kind = 2;
  edge.note = "after the fitting";
  assert(repo.InsertDependency(*tx, edge));
  assert(repo.InsertDependency(*tx, Edge(a, b)).code == ErrorCode::AlreadyExists);
  assert(repo.InsertDependency(*tx, Edge(a, prefix + "-missing")).code == ErrorCode::ConstraintViolation);

  bool found = false;
  for (const auto& stored : repo.ListDependencies(*tx)) {
    if (stored.prerequisite_id == a && stored.dependent_id == b) {
      found = true;
      assert(stored.kind == 2);
      assert(stored.note == std::optional<std::string>("after the fitting"));
    }
  }
  assert(found);

  assert(repo.DeleteDependency(*tx, a, b));
  assert(repo.DeleteDependency(*tx, a, b).code == ErrorCode::NotFound);
  tx->Commit();
}

void VerifyDeleteCascadesEdges(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();

  const auto a = prefix + "-a";
  const auto b = prefix + "-b";
  const auto c = prefix + "-c";
  assert(repo.UpsertGoal(*tx, Row(a)));
  assert(repo.UpsertGoal(*tx, Row(b)));
  assert(repo.UpsertGoal(*tx, Row(c)));
  assert(repo.InsertDependency(*tx, Edge(a, b)));
  assert(repo.InsertDependency(*tx, Edge(b, c)));

  assert(repo.DeleteGoal(*tx, b));
  assert(!HasEdge(repo, *tx, a, b));
  assert(!HasEdge(repo, *tx, b, c));
  assert(repo.GetGoal(*tx, a).has_value());
  assert(repo.GetGoal(*tx, c).has_value());
  tx->Commit();
}

void VerifyRollbackDiscardsWrites(Repository& repo, const std::string& prefix) {
  const auto id = prefix + "-rolled-back";
  {
    auto tx = repo.Begin();
    assert(repo.UpsertGoal(*tx, Row(id)));
    tx->Rollback();
  }
  {
    // Destructor without Commit also rolls back.
    auto tx = repo.Begin();
    assert(repo.UpsertGoal(*tx, Row(id + "-dropped")));
  }

  auto tx = repo.Begin();
  assert(!repo.GetGoal(*tx, id).has_value());
  assert(!repo.GetGoal(*tx, id + "-dropped").has_value());
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  const auto parent = prefix + "-parent";
  const auto child  = prefix + "-child";

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->UpsertGoal(*tx, Row(parent)));
    assert(repo->UpsertGoal(*tx, Row(child, parent)));
    assert(repo->InsertDependency(*tx, Edge(parent, child)));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto stored = repo->GetGoal(*tx, child);
  assert(stored.has_value());
  assert(stored->parent_id == parent);
  assert(stored->document == Row(child, parent).document);
  assert(HasEdge(*repo, *tx, parent, child));
  tx->Commit();
}

// Save then hydrate into a second manager must reproduce the graph.
void VerifyManagerRoundTrip(std::shared_ptr<Repository> repo) {
  auto reasoning = std::make_shared<goalgraph::testing::FakeReasoningService>();
  auto calendar  = std::make_shared<goalgraph::testing::FakeCalendarService>();

  goalgraph::core::GoalManager writer(repo, reasoning, calendar);

  goalgraph::core::NewGoal draft;
  draft.title    = "Run a marathon";
  draft.category = "Health";
  const auto marathon = writer.CreateGoal(draft).id;

  draft.title = "Buy shoes";
  draft.category.clear();
  const auto shoes = writer.CreateGoal(draft, marathon).id;
  draft.title       = "Train";
  const auto train = writer.CreateGoal(draft, marathon).id;
  writer.AddDependency(shoes, train, goalgraph::model::DependencyKind::kFinishToStart, std::string("need shoes first"));

  draft.title          = "Learn Spanish";
  draft.category       = "Learning";
  const auto spanish  = writer.CreateGoal(draft).id;
  const auto step_ids = writer.BeginRoadmap(spanish, {goalgraph::roadmap::StepSeed{"Basics", "", std::nullopt, false},
                                                      goalgraph::roadmap::StepSeed{"Conversation", "", std::nullopt, true}});
  writer.CompleteCurrentStep(spanish);

  const auto saved = writer.Save();
  assert(saved.upserted == 6);
  assert(saved.added_edges == 1);
  assert(writer.Save().upserted == 0);

  goalgraph::core::GoalManager reader(repo, reasoning, calendar);
  const auto report = reader.Hydrate();
  assert(report.goals == 6);
  assert(report.edges == 1);
  assert(report.detached.empty());
  assert(report.dropped_edges.empty());

  const auto top = reader.TopLevelGoals();
  assert(top.size() == 2);
  assert(top[0].id == marathon);
  assert(top[1].id == spanish);

  const auto children = reader.Children(marathon);
  assert(children.size() == 2);
  assert(children[0].title == "Buy shoes");
  assert(children[1].title == "Train");
  assert(children[0].category == "Health");

  const auto incoming = reader.IncomingDependencies(train);
  assert(incoming.size() == 1);
  assert(incoming[0].prerequisite == shoes);
  assert(incoming[0].note == std::optional<std::string>("need shoes first"));

  const auto steps = reader.Steps(spanish);
  assert(steps.size() == 2);
  assert(steps[0].id == step_ids[0]);
  assert(steps[0].step_status == goalgraph::model::StepStatus::kCompleted);
  assert(steps[0].is_locked);
  assert(steps[1].step_status == goalgraph::model::StepStatus::kCurrent);
  assert(steps[1].is_final_step);
  assert(reader.Progress(spanish) == writer.Progress(spanish));
  assert(reader.Get(spanish).revisions.size() == writer.Get(spanish).revisions.size());

  const auto removed = reader.Delete(marathon);
  assert(removed.size() == 3);
  const auto second = reader.Save();
  assert(second.deleted == 3);

  goalgraph::core::GoalManager after(repo, reasoning, calendar);
  const auto final_report = after.Hydrate();
  assert(final_report.goals == 3);
  assert(final_report.edges == 0);
  assert(after.TopLevelGoals().size() == 1);
}

void RunBackendSuite(BackendFactory backend) {
  std::cout << "running backend: " << backend.name << "\n";

  // The round trip counts every row, so it runs on the empty store first.
  VerifyManagerRoundTrip(backend.make_repository());

  auto repo = backend.make_repository();
  VerifyGoalUpsertGetListDelete(*repo, backend.name + "-goals");
  VerifyDependencyConstraints(*repo, backend.name + "-deps");
  VerifyDeleteCascadesEdges(*repo, backend.name + "-cascade");
  VerifyRollbackDiscardsWrites(*repo, backend.name + "-rollback");
  repo.reset();

  VerifyRestartDurability(backend, backend.name + "-restart");
  backend.cleanup();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("goalgraph_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() -> std::shared_ptr<Repository> {
    auto db = std::make_shared<goalgraph::db::sqlite::SqliteDB>(db_path, /*wal_mode=*/false);
    goalgraph::db::sqlite::SqliteRepository::BootstrapSchema(*db);
    return std::make_shared<goalgraph::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() { std::filesystem::remove(db_path); },
  };
}

} // namespace

int main() {
  RunBackendSuite(MakeMemoryFactory());
  RunBackendSuite(MakeSqliteFactory());

  std::cout << "goalgraph_integration_repository_parity: pass\n";
  return 0;
}
