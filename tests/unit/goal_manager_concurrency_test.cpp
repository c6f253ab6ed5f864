#include <assert.h>

#include <atomic>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "fakes/fake_collaborators.hpp"
#include "internal/core/goal_manager.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using goalgraph::core::GoalManager;
using goalgraph::core::NewGoal;
using goalgraph::db::memory::MemoryRepository;
using goalgraph::testing::FakeCalendarService;
using goalgraph::testing::FakeReasoningService;
using goalgraph::testing::Proposal;

struct Fixture {
  std::shared_ptr<MemoryRepository>     repository = std::make_shared<MemoryRepository>();
  std::shared_ptr<FakeReasoningService> reasoning  = std::make_shared<FakeReasoningService>();
  std::shared_ptr<FakeCalendarService>  calendar   = std::make_shared<FakeCalendarService>();
  GoalManager                           manager{repository, reasoning, calendar};

  std::string Create(const std::string& title, const std::optional<std::string>& parent = std::nullopt) {
    NewGoal draft;
    draft.title = title;
    draft.body  = "About " + title;
    return manager.CreateGoal(draft, parent).id;
  }
};

void TestReadersProceedWhileReasoningCallIsInFlight() {
  Fixture f;
  const auto goal = f.Create("Learn Spanish");
  f.manager.BeginRoadmap(goal, {goalgraph::roadmap::StepSeed{"Basics", "", std::nullopt, false}});
  f.reasoning->next_steps.push_back(Proposal("Conversation"));

  std::atomic<bool> reader_finished{false};
  f.reasoning->before_reply = [&](const std::string&) {
    // A reader on another thread must get through while the call is pending.
    auto reader = std::async(std::launch::async, [&] {
      (void)f.manager.Progress(goal);
      (void)f.manager.TopLevelGoals();
      reader_finished = true;
    });
    const auto status = reader.wait_for(std::chrono::seconds(2));
    assert(status == std::future_status::ready);
  };

  const auto result = f.manager.CompleteCurrentStep(goal);
  assert(reader_finished);
  assert(result.outcome == goalgraph::roadmap::AdvanceOutcome::kAdvanced);
}

void TestDeleteDuringNextStepRequestIsNotApplied() {
  Fixture f;
  const auto goal = f.Create("Learn Spanish");
  f.manager.BeginRoadmap(goal, {goalgraph::roadmap::StepSeed{"Basics", "", std::nullopt, false}});
  f.reasoning->next_steps.push_back(Proposal("Conversation"));

  f.reasoning->before_reply = [&](const std::string&) { f.manager.Delete(goal); };

  bool not_found = false;
  try {
    f.manager.CompleteCurrentStep(goal);
  } catch (const goalgraph::util::NotFound&) {
    not_found = true;
  }
  assert(not_found);
  assert(f.manager.TopLevelGoals().empty());
}

void TestLockDuringRegenerationWins() {
  Fixture f;
  const auto goal = f.Create("Get fit");

  goalgraph::collaborators::Regeneration regen;
  regen.title = "Run a 10k";
  regen.body  = "Build up slowly";
  f.reasoning->regenerations.push_back(regen);
  f.reasoning->before_reply = [&](const std::string& kind) {
    if (kind == "regeneration") f.manager.Lock(goal);
  };

  bool locked = false;
  try {
    f.manager.Regenerate(goal);
  } catch (const goalgraph::util::LockedError&) {
    locked = true;
  }
  assert(locked);

  const auto current = f.manager.Get(goal);
  assert(current.title == "Get fit");
  assert(current.is_locked);
  assert(current.locked_snapshot->title == "Get fit");
}

void TestConfirmRejectedAfterConcurrentArchive() {
  Fixture f;
  const auto goal = f.Create("Learn piano");

  goalgraph::collaborators::ActivationPlan plan;
  plan.sessions.push_back(goalgraph::testing::Session("Scales", goalgraph::util::Now()));
  plan.sessions.push_back(goalgraph::testing::Session("Chords", goalgraph::util::Now()));
  f.reasoning->plans.push_back(plan);

  const auto generated = f.manager.GenerateActivationPlan(goal);
  // Another caller archives the goal before the plan is confirmed.
  f.manager.Deactivate(goal, goalgraph::model::ActivationState::kArchived, "changed my mind");

  bool invalid = false;
  try {
    f.manager.ConfirmActivation(goal, generated);
  } catch (const goalgraph::util::InvalidState&) {
    invalid = true;
  }
  assert(invalid);
  assert(f.calendar->create_calls == 0);
  assert(f.manager.Get(goal).scheduled_events.empty());
}

void TestConcurrentWritersKeepGraphConsistent() {
  Fixture f;
  const auto root = f.Create("Company offsite");

  constexpr int kThreads   = 8;
  constexpr int kPerThread = 25;

  std::vector<std::thread> writers;
  for (int t = 0; t < kThreads; ++t) {
    writers.emplace_back([&, t] {
      std::string previous;
      for (int i = 0; i < kPerThread; ++i) {
        const auto id = f.Create("Task " + std::to_string(t) + "-" + std::to_string(i), root);
        if (!previous.empty()) {
          f.manager.AddDependency(previous, id);
        }
        previous = id;
        (void)f.manager.Progress(root);
      }
    });
  }
  for (auto& writer : writers) writer.join();

  assert(f.manager.Children(root).size() == static_cast<std::size_t>(kThreads * kPerThread));
  assert(f.manager.Leaves(root).size() == static_cast<std::size_t>(kThreads * kPerThread));

  const auto summary = f.manager.Save();
  assert(summary.upserted == static_cast<std::size_t>(kThreads * kPerThread + 1));
  assert(summary.added_edges == static_cast<std::size_t>(kThreads * (kPerThread - 1)));
}

} // namespace

int main() {
  TestReadersProceedWhileReasoningCallIsInFlight();
  TestDeleteDuringNextStepRequestIsNotApplied();
  TestLockDuringRegenerationWins();
  TestConfirmRejectedAfterConcurrentArchive();
  TestConcurrentWritersKeepGraphConsistent();

  std::cout << "goalgraph_unit_goal_manager_concurrency: pass\n";
  return 0;
}
