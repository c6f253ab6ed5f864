#include "internal/breakdown/breakdown_materializer.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using goalgraph::collaborators::DecompositionNode;
using goalgraph::collaborators::DecompositionTree;
using goalgraph::graph::GoalGraph;
using goalgraph::model::Goal;
using goalgraph::model::Priority;

DecompositionNode Node(const std::string& external_id, const std::string& title) {
  DecompositionNode node;
  node.external_id = external_id;
  node.title       = title;
  return node;
}

GoalGraph GraphWithTarget() {
  GoalGraph graph;
  Goal      target;
  target.id       = "target";
  target.title    = "Launch the podcast";
  target.category = "Creative";
  target.kind     = goalgraph::model::GoalKind::kHybrid;
  graph.Insert(target);
  return graph;
}

bool RejectsBreakdown(const DecompositionTree& tree) {
  try {
    goalgraph::breakdown::Validate(tree);
  } catch (const goalgraph::util::InvalidBreakdown&) {
    return true;
  }
  return false;
}

void TestSlugify() {
  assert(goalgraph::breakdown::Slugify("Launch Plan!") == "launch-plan");
  assert(goalgraph::breakdown::Slugify("  Record   episode 1 ") == "record-episode-1");
  assert(goalgraph::breakdown::Slugify("???").empty());
}

void TestPriorityForDifficulty() {
  assert(goalgraph::breakdown::PriorityForDifficulty(std::string("Hard")) == Priority::kNow);
  assert(goalgraph::breakdown::PriorityForDifficulty(std::string("medium")) == Priority::kNext);
  assert(goalgraph::breakdown::PriorityForDifficulty(std::string("easy")) == Priority::kLater);
  assert(goalgraph::breakdown::PriorityForDifficulty(std::nullopt) == Priority::kLater);
}

void TestValidateRejectsDuplicatesUnknownReferencesAndUntitledNodes() {
  DecompositionTree duplicate;
  duplicate.roots = {Node("a", "First"), Node("a", "Second")};
  assert(RejectsBreakdown(duplicate));

  DecompositionTree unknown;
  unknown.roots = {Node("a", "First")};
  unknown.roots[0].dependencies = {"ghost"};
  assert(RejectsBreakdown(unknown));

  DecompositionTree untitled;
  untitled.roots = {Node("a", "  ")};
  assert(RejectsBreakdown(untitled));

  DecompositionTree nested_duplicate;
  nested_duplicate.roots = {Node("a", "First")};
  nested_duplicate.roots[0].children = {Node("a", "Child")};
  assert(RejectsBreakdown(nested_duplicate));
}

void TestApplyCreatesTreeAndInheritsFromTarget() {
  auto graph = GraphWithTarget();

  DecompositionTree tree;
  auto              gear = Node("gear", "Buy gear");
  gear.description       = "Microphone and interface";
  gear.estimated_hours   = 2.0;
  gear.difficulty        = "easy";

  auto record       = Node("record", "Record pilot");
  record.difficulty = "HARD";
  record.children   = {Node("", "Write outline"), Node("", "Book guest")};

  tree.roots = {gear, record};

  const auto result = goalgraph::breakdown::Apply(graph, "target", tree, goalgraph::util::Now());
  assert(result.created_goals.size() == 4);
  assert(result.atomic_task_count == 3);

  const auto children = graph.Children("target");
  assert(children.size() == 2);

  const auto& gear_goal = graph.Get(result.assigned_identifiers.at("gear"));
  assert(gear_goal.title == "Buy gear");
  assert(gear_goal.body == "Microphone and interface\n\nEstimate: 2.0h \xE2\x80\xA2 Difficulty: Easy");
  assert(gear_goal.category == "Creative");
  assert(gear_goal.kind == goalgraph::model::GoalKind::kHybrid);
  assert(gear_goal.priority == Priority::kLater);
  assert(gear_goal.is_atomic);

  const auto& record_goal = graph.Get(result.assigned_identifiers.at("record"));
  assert(record_goal.priority == Priority::kNow);
  assert(!record_goal.is_atomic);
  assert(record_goal.has_been_broken_down);
  assert(graph.Children(record_goal.id).size() == 2);
  assert(result.assigned_identifiers.count("write-outline") == 1);
  assert(result.assigned_identifiers.count("book-guest") == 1);

  const auto& target = graph.Get("target");
  assert(target.has_been_broken_down);
  assert(target.revisions.size() == 1);
  assert(target.revisions.back().summary == "Broken down");
}

void TestSlugCollisionsAreSuffixed() {
  auto graph = GraphWithTarget();

  DecompositionTree tree;
  tree.roots = {Node("", "Practice"), Node("", "Practice"), Node("", "Practice!")};

  const auto result = goalgraph::breakdown::Apply(graph, "target", tree, goalgraph::util::Now());
  assert(result.assigned_identifiers.count("practice") == 1);
  assert(result.assigned_identifiers.count("practice-2") == 1);
  assert(result.assigned_identifiers.count("practice-3") == 1);
}

void TestExplicitIdsWinOverEarlierSlugs() {
  auto graph = GraphWithTarget();

  auto nested = Node("", "Review");
  nested.children.push_back(Node("review", "Peer review"));

  DecompositionTree tree;
  tree.roots = {Node("", "Design"), Node("design", "Design spike"), nested};
  assert(!RejectsBreakdown(tree));

  const auto result = goalgraph::breakdown::Apply(graph, "target", tree, goalgraph::util::Now());
  assert(result.created_goals.size() == 4);
  assert(result.assigned_identifiers.count("design") == 1);
  assert(result.assigned_identifiers.count("design-2") == 1);
  assert(result.assigned_identifiers.count("review") == 1);
  assert(result.assigned_identifiers.count("review-2") == 1);
  assert(graph.Get(result.assigned_identifiers.at("design")).title == "Design spike");
  assert(graph.Get(result.assigned_identifiers.at("design-2")).title == "Design");
}

void TestRecommendedOrderDrivesRootPositions() {
  auto graph = GraphWithTarget();

  DecompositionTree tree;
  tree.roots             = {Node("a", "Alpha"), Node("b", "Beta"), Node("c", "Gamma")};
  tree.recommended_order = {"c", "a"};

  const auto result   = goalgraph::breakdown::Apply(graph, "target", tree, goalgraph::util::Now());
  const auto children = graph.Children("target");
  assert(children.size() == 3);
  assert(children[0] == result.assigned_identifiers.at("c"));
  assert(children[1] == result.assigned_identifiers.at("a"));
  assert(children[2] == result.assigned_identifiers.at("b"));
}

void TestDependenciesResolveAfterAllNodesExist() {
  auto graph = GraphWithTarget();

  DecompositionTree tree;
  auto              first = Node("first", "First");
  first.dependencies      = {"Second"}; // forward reference, matched by slug
  auto second             = Node("second", "Second");
  tree.roots              = {first, second};

  const auto result = goalgraph::breakdown::Apply(graph, "target", tree, goalgraph::util::Now());
  assert(result.dependency_count == 1);
  assert(graph.HasDependency(result.assigned_identifiers.at("second"), result.assigned_identifiers.at("first")));
}

void TestCyclicAndSelfDependenciesAreDropped() {
  auto graph = GraphWithTarget();

  DecompositionTree tree;
  auto              a = Node("a", "A");
  auto              b = Node("b", "B");
  a.dependencies      = {"b", "a"};
  b.dependencies      = {"a"};
  tree.roots          = {a, b};

  const auto result = goalgraph::breakdown::Apply(graph, "target", tree, goalgraph::util::Now());
  assert(result.created_goals.size() == 2);
  assert(result.dependency_count == 1);
  assert(graph.DependencyCount() == 1);
}

void TestInvalidTreeLeavesGraphUntouched() {
  auto graph = GraphWithTarget();

  DecompositionTree tree;
  tree.roots = {Node("a", "A"), Node("a", "Again")};

  bool rejected = false;
  try {
    goalgraph::breakdown::Apply(graph, "target", tree, goalgraph::util::Now());
  } catch (const goalgraph::util::InvalidBreakdown&) {
    rejected = true;
  }
  assert(rejected);
  assert(graph.Size() == 1);
  assert(!graph.Get("target").has_been_broken_down);
}

void TestStepsCannotBeBrokenDown() {
  auto graph = GraphWithTarget();
  Goal step;
  step.id    = "step";
  step.title = "Step";
  graph.AppendStep("target", step);

  DecompositionTree tree;
  tree.roots = {Node("a", "A")};

  bool rejected = false;
  try {
    goalgraph::breakdown::Apply(graph, "step", tree, goalgraph::util::Now());
  } catch (const goalgraph::util::InvalidState&) {
    rejected = true;
  }
  assert(rejected);
}

} // namespace

int main() {
  TestSlugify();
  TestPriorityForDifficulty();
  TestValidateRejectsDuplicatesUnknownReferencesAndUntitledNodes();
  TestApplyCreatesTreeAndInheritsFromTarget();
  TestSlugCollisionsAreSuffixed();
  TestExplicitIdsWinOverEarlierSlugs();
  TestRecommendedOrderDrivesRootPositions();
  TestDependenciesResolveAfterAllNodesExist();
  TestCyclicAndSelfDependenciesAreDropped();
  TestInvalidTreeLeavesGraphUntouched();
  TestStepsCannotBeBrokenDown();

  std::cout << "goalgraph_unit_breakdown_materializer: pass\n";
  return 0;
}
