#include "internal/graph/goal_graph.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using goalgraph::graph::GoalGraph;
using goalgraph::model::DependencyKind;
using goalgraph::model::Goal;

Goal MakeGoal(const std::string& id, const std::string& title = "") {
  Goal goal;
  goal.id    = id;
  goal.title = title.empty() ? id : title;
  return goal;
}

template <typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const std::exception&) {
    return true;
  }
  return false;
}

void TestChildrenKeepInsertionOrder() {
  GoalGraph graph;
  graph.Insert(MakeGoal("root"));
  graph.Insert(MakeGoal("a"), std::string("root"));
  graph.Insert(MakeGoal("b"), std::string("root"));
  graph.Insert(MakeGoal("c"), std::string("root"));

  const auto children = graph.Children("root");
  assert((children == std::vector<std::string>{"a", "b", "c"}));
  assert(graph.Get("b").parent_id == std::optional<std::string>("root"));
  assert(graph.TopLevelGoals() == std::vector<std::string>{"root"});
}

void TestInsertAtOrdersBySortIndex() {
  GoalGraph graph;
  graph.Insert(MakeGoal("root"));
  graph.InsertAt(MakeGoal("late"), "root", 2);
  graph.InsertAt(MakeGoal("early"), "root", 0);
  graph.InsertAt(MakeGoal("middle"), "root", 1);

  assert((graph.Children("root") == std::vector<std::string>{"early", "middle", "late"}));
}

void TestInsertRejectsMissingParentAndDuplicates() {
  GoalGraph graph;
  graph.Insert(MakeGoal("root"));

  bool not_found = false;
  try {
    graph.Insert(MakeGoal("orphan"), std::string("missing"));
  } catch (const goalgraph::util::NotFound&) {
    not_found = true;
  }
  assert(not_found);
  assert(!graph.Contains("orphan"));

  bool duplicate = false;
  try {
    graph.Insert(MakeGoal("root"));
  } catch (const goalgraph::util::AlreadyExists&) {
    duplicate = true;
  }
  assert(duplicate);
}

void TestReparentRejectsCycles() {
  GoalGraph graph;
  graph.Insert(MakeGoal("a"));
  graph.Insert(MakeGoal("b"), std::string("a"));
  graph.Insert(MakeGoal("c"), std::string("b"));

  bool cycle = false;
  try {
    graph.Reparent("a", std::string("c"));
  } catch (const goalgraph::util::CycleError&) {
    cycle = true;
  }
  assert(cycle);
  assert(!graph.Get("a").parent_id.has_value());

  graph.Reparent("c", std::nullopt);
  assert(graph.Children("b").empty());
  const auto top = graph.TopLevelGoals();
  assert(std::find(top.begin(), top.end(), "c") != top.end());
}

void TestDependencyRejectsSelfAndCycle() {
  GoalGraph graph;
  graph.Insert(MakeGoal("a"));
  graph.Insert(MakeGoal("b"));
  graph.Insert(MakeGoal("c"));

  bool self = false;
  try {
    graph.AddDependency("a", "a", DependencyKind::kFinishToStart);
  } catch (const goalgraph::util::SelfDependencyError&) {
    self = true;
  }
  assert(self);

  graph.AddDependency("a", "b", DependencyKind::kFinishToStart);
  graph.AddDependency("b", "c", DependencyKind::kStartToStart, std::string("kickoff"));

  bool cycle = false;
  try {
    graph.AddDependency("c", "a", DependencyKind::kFinishToFinish);
  } catch (const goalgraph::util::CycleError&) {
    cycle = true;
  }
  assert(cycle);
  assert(graph.DependencyCount() == 2);
  assert(graph.DependencyReaches("a", "c"));
  assert(!graph.DependencyReaches("c", "a"));

  const auto incoming = graph.IncomingDependencies("c");
  assert(incoming.size() == 1);
  assert(incoming[0].prerequisite == "b");
  assert(incoming[0].kind == DependencyKind::kStartToStart);
  assert(incoming[0].note == std::optional<std::string>("kickoff"));

  assert(Throws([&] { graph.AddDependency("a", "b", DependencyKind::kFinishToStart); }));
  assert(Throws([&] { graph.AddDependency("a", "missing", DependencyKind::kFinishToStart); }));
}

void TestDependencyAcrossHierarchyIsAllowed() {
  GoalGraph graph;
  graph.Insert(MakeGoal("parent"));
  graph.Insert(MakeGoal("child"), std::string("parent"));

  // Hierarchy and dependency tables are independent.
  graph.AddDependency("child", "parent", DependencyKind::kFinishToFinish);
  assert(graph.HasDependency("child", "parent"));
}

void TestDeleteRemovesSubtreeStepsAndEdges() {
  GoalGraph graph;
  graph.Insert(MakeGoal("root"));
  graph.Insert(MakeGoal("a"), std::string("root"));
  graph.Insert(MakeGoal("a1"), std::string("a"));
  graph.Insert(MakeGoal("other"));
  graph.AppendStep("a1", MakeGoal("step-1"));
  graph.AddDependency("a1", "other", DependencyKind::kFinishToStart);
  graph.AddDependency("other", "root", DependencyKind::kFinishToStart);
  graph.ClearChanges();

  const auto removed = graph.Delete("a");
  assert((removed == std::vector<std::string>{"a", "a1", "step-1"}));
  assert(!graph.Contains("a1"));
  assert(!graph.Contains("step-1"));
  assert(graph.Children("root").empty());
  assert(graph.DependencyCount() == 1);
  assert(graph.IncomingDependencies("other").empty());

  const auto changes = graph.PendingChanges();
  assert(changes.deleted.size() == 3);
  assert(changes.removed_edges.size() == 1);
  assert(changes.upserted.empty());

  assert(graph.Delete("a").empty());
}

void TestStepsCannotOwnSubgoals() {
  GoalGraph graph;
  graph.Insert(MakeGoal("owner"));
  const auto& step = graph.AppendStep("owner", MakeGoal("s1"));
  assert(step.step_of == std::optional<std::string>("owner"));
  assert(graph.Get("owner").has_sequential_steps);
  assert(!graph.HasChildren("owner"));

  bool rejected = false;
  try {
    graph.Insert(MakeGoal("under-step"), std::string("s1"));
  } catch (const goalgraph::util::InvalidState&) {
    rejected = true;
  }
  assert(rejected);
}

void TestLeavesAndDescendants() {
  GoalGraph graph;
  graph.Insert(MakeGoal("root"));
  graph.Insert(MakeGoal("a"), std::string("root"));
  graph.Insert(MakeGoal("b"), std::string("root"));
  graph.Insert(MakeGoal("a1"), std::string("a"));
  graph.Insert(MakeGoal("a2"), std::string("a"));

  assert((graph.Descendants("root", false) == std::vector<std::string>{"a", "a1", "a2", "b"}));
  assert((graph.Descendants("root", true).front() == "root"));
  assert((graph.Leaves("root") == std::vector<std::string>{"a1", "a2", "b"}));
  assert((graph.Leaves("b") == std::vector<std::string>{"b"}));
  assert(graph.Leaves("missing").empty());
}

void TestChangeTrackingCollapsesAddThenRemove() {
  GoalGraph graph;
  graph.Insert(MakeGoal("a"));
  graph.Insert(MakeGoal("b"));
  graph.ClearChanges();

  graph.AddDependency("a", "b", DependencyKind::kFinishToStart);
  graph.RemoveDependency("a", "b");
  auto changes = graph.PendingChanges();
  assert(changes.added_edges.empty());
  assert(changes.removed_edges.empty());

  graph.Mutable("a").title = "renamed";
  changes = graph.PendingChanges();
  assert(changes.upserted == std::vector<std::string>{"a"});
}

void TestLoadDetachesDanglingParentsAndDropsCyclicEdges() {
  std::vector<Goal> goals;
  goals.push_back(MakeGoal("a"));
  auto b      = MakeGoal("b");
  b.parent_id = "a";
  goals.push_back(b);
  auto orphan      = MakeGoal("orphan");
  orphan.parent_id = "gone";
  goals.push_back(orphan);
  auto loop_x      = MakeGoal("x");
  loop_x.parent_id = "y";
  auto loop_y      = MakeGoal("y");
  loop_y.parent_id = "x";
  goals.push_back(loop_x);
  goals.push_back(loop_y);

  std::vector<goalgraph::model::DependencyEdge> edges(3);
  edges[0].prerequisite = "a";
  edges[0].dependent    = "orphan";
  edges[1].prerequisite = "orphan";
  edges[1].dependent    = "a";
  edges[2].prerequisite = "a";
  edges[2].dependent    = "nowhere";

  GoalGraph  graph;
  const auto report = graph.Load(goals, edges);

  assert(report.goals == 5);
  assert(report.edges == 1);
  assert(report.dropped_edges.size() == 2);
  assert(std::find(report.detached.begin(), report.detached.end(), "orphan") != report.detached.end());
  assert(!graph.Get("orphan").parent_id.has_value());
  assert(graph.Children("a") == std::vector<std::string>{"b"});
  assert(graph.PendingChanges().empty());

  // x and y reference each other; at least one must have been cut loose.
  assert(!graph.Get("x").parent_id.has_value() || !graph.Get("y").parent_id.has_value());
}

} // namespace

int main() {
  TestChildrenKeepInsertionOrder();
  TestInsertAtOrdersBySortIndex();
  TestInsertRejectsMissingParentAndDuplicates();
  TestReparentRejectsCycles();
  TestDependencyRejectsSelfAndCycle();
  TestDependencyAcrossHierarchyIsAllowed();
  TestDeleteRemovesSubtreeStepsAndEdges();
  TestStepsCannotOwnSubgoals();
  TestLeavesAndDescendants();
  TestChangeTrackingCollapsesAddThenRemove();
  TestLoadDetachesDanglingParentsAndDropsCyclicEdges();

  std::cout << "goalgraph_unit_goal_graph: pass\n";
  return 0;
}
