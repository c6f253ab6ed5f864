#include "goal_graph.hpp"

#include <algorithm>
#include <unordered_set>

#include "internal/util/errors.hpp"

namespace goalgraph::graph {

using model::DependencyEdge;
using model::Goal;
using model::GoalId;

namespace {

const GoalId kRootKey{};

void EraseValue(std::vector<GoalId>& ids, const GoalId& value) {
  ids.erase(std::remove(ids.begin(), ids.end(), value), ids.end());
}

} // namespace

const GoalId& GoalGraph::ParentKey(const Goal& goal) {
  return goal.parent_id ? *goal.parent_id : kRootKey;
}

// ------------------------------------------------------------
// Insertion
// ------------------------------------------------------------

const Goal& GoalGraph::Insert(Goal goal, const std::optional<GoalId>& parent) {
  goal.sort_index = NextSortIndex(parent);
  return InsertUnchecked(std::move(goal), parent);
}

const Goal& GoalGraph::InsertAt(Goal goal, const GoalId& parent, std::int64_t sort_index) {
  goal.sort_index = sort_index;
  return InsertUnchecked(std::move(goal), parent);
}

const Goal& GoalGraph::InsertUnchecked(Goal goal, const std::optional<GoalId>& parent) {
  if (goal.id.empty()) {
    throw util::InvalidArgument("goal id must not be empty");
  }
  if (goals_.contains(goal.id)) {
    throw util::AlreadyExists("goal already exists: " + goal.id);
  }
  if (parent) {
    if (*parent == goal.id) {
      throw util::CycleError("goal cannot be its own parent: " + goal.id);
    }
    if (!goals_.contains(*parent)) {
      throw util::NotFound("parent goal not found: " + *parent);
    }
    if (goals_.at(*parent).step_of) {
      throw util::InvalidState("roadmap steps cannot own subgoals: " + *parent);
    }
  }

  goal.parent_id = parent;
  goal.step_of.reset();

  const auto id = goal.id;
  goals_.emplace(id, std::move(goal));
  Attach(id);
  deleted_.erase(id);
  MarkDirty(id);
  return goals_.at(id);
}

const Goal& GoalGraph::AppendStep(const GoalId& owner, Goal step) {
  if (step.id.empty()) {
    throw util::InvalidArgument("step id must not be empty");
  }
  if (goals_.contains(step.id)) {
    throw util::AlreadyExists("goal already exists: " + step.id);
  }
  auto owner_it = goals_.find(owner);
  if (owner_it == goals_.end()) {
    throw util::NotFound("roadmap goal not found: " + owner);
  }

  step.parent_id.reset();
  step.step_of    = owner;
  step.sort_index = static_cast<std::int64_t>(owner_it->second.sequential_steps.size());

  const auto id = step.id;
  goals_.emplace(id, std::move(step));
  owner_it->second.has_sequential_steps = true;
  owner_it->second.sequential_steps.push_back(id);
  deleted_.erase(id);
  MarkDirty(id);
  MarkDirty(owner);
  return goals_.at(id);
}

std::int64_t GoalGraph::NextSortIndex(const std::optional<GoalId>& parent) const {
  const auto it = children_.find(parent ? *parent : kRootKey);
  if (it == children_.end() || it->second.empty()) {
    return 0;
  }
  return goals_.at(it->second.back()).sort_index + 1;
}

// Keeps siblings ordered by sort index; equal indices keep insertion order.
void GoalGraph::Attach(const GoalId& id) {
  const auto& goal     = goals_.at(id);
  auto&       siblings = children_[ParentKey(goal)];
  const auto  position = std::upper_bound(siblings.begin(), siblings.end(), goal.sort_index,
                                          [this](std::int64_t index, const GoalId& other) { return index < goals_.at(other).sort_index; });
  siblings.insert(position, id);
}

void GoalGraph::Detach(const GoalId& id) {
  const auto& goal = goals_.at(id);
  if (goal.step_of) {
    auto owner = goals_.find(*goal.step_of);
    if (owner != goals_.end()) {
      EraseValue(owner->second.sequential_steps, id);
      MarkDirty(owner->first);
    }
    return;
  }

  auto it = children_.find(ParentKey(goal));
  if (it != children_.end()) {
    EraseValue(it->second, id);
  }
}

void GoalGraph::Reparent(const GoalId& id, const std::optional<GoalId>& new_parent) {
  auto& goal = Mutable(id);
  if (goal.step_of) {
    throw util::InvalidState("roadmap steps cannot be reparented: " + id);
  }
  if (new_parent) {
    if (!goals_.contains(*new_parent)) {
      throw util::NotFound("parent goal not found: " + *new_parent);
    }
    if (goals_.at(*new_parent).step_of) {
      throw util::InvalidState("roadmap steps cannot own subgoals: " + *new_parent);
    }
    const auto subtree = Descendants(id, /*include_self=*/true);
    if (std::find(subtree.begin(), subtree.end(), *new_parent) != subtree.end()) {
      throw util::CycleError("reparenting " + id + " under " + *new_parent + " would create a cycle");
    }
  }
  if (goal.parent_id == new_parent) {
    return;
  }

  Detach(id);
  goal.parent_id  = new_parent;
  goal.sort_index = NextSortIndex(new_parent);
  Attach(id);
}

// ------------------------------------------------------------
// Dependency edges
// ------------------------------------------------------------

const DependencyEdge& GoalGraph::AddDependency(const GoalId& prerequisite, const GoalId& dependent, model::DependencyKind kind,
                                               std::optional<std::string> note, model::TimePoint created_at) {
  if (prerequisite == dependent) {
    throw util::SelfDependencyError("goal cannot depend on itself: " + prerequisite);
  }
  if (!goals_.contains(prerequisite)) {
    throw util::NotFound("prerequisite goal not found: " + prerequisite);
  }
  if (!goals_.contains(dependent)) {
    throw util::NotFound("dependent goal not found: " + dependent);
  }

  EdgeKey key{prerequisite, dependent};
  if (edges_.contains(key)) {
    throw util::AlreadyExists("dependency already exists: " + prerequisite + " -> " + dependent);
  }
  if (DependencyReaches(dependent, prerequisite)) {
    throw util::CycleError("dependency " + prerequisite + " -> " + dependent + " would create a cycle");
  }

  DependencyEdge edge;
  edge.prerequisite = prerequisite;
  edge.dependent    = dependent;
  edge.kind         = kind;
  edge.note         = std::move(note);
  edge.created_at   = created_at;

  outgoing_[prerequisite].push_back(dependent);
  incoming_[dependent].push_back(prerequisite);
  added_edges_[key] = edge;
  return edges_.emplace(std::move(key), std::move(edge)).first->second;
}

bool GoalGraph::RemoveDependency(const GoalId& prerequisite, const GoalId& dependent) {
  EdgeKey key{prerequisite, dependent};
  if (!edges_.contains(key)) {
    return false;
  }
  RemoveEdge(key);
  return true;
}

bool GoalGraph::HasDependency(const GoalId& prerequisite, const GoalId& dependent) const {
  return edges_.contains(EdgeKey{prerequisite, dependent});
}

void GoalGraph::RemoveEdge(const EdgeKey& key) {
  edges_.erase(key);

  auto out = outgoing_.find(key.first);
  if (out != outgoing_.end()) {
    EraseValue(out->second, key.second);
    if (out->second.empty()) outgoing_.erase(out);
  }
  auto in = incoming_.find(key.second);
  if (in != incoming_.end()) {
    EraseValue(in->second, key.first);
    if (in->second.empty()) incoming_.erase(in);
  }

  if (added_edges_.erase(key) == 0) {
    removed_edges_.insert(key);
  }
}

bool GoalGraph::DependencyReaches(const GoalId& from, const GoalId& to) const {
  std::vector<GoalId>             stack{from};
  std::unordered_set<GoalId>      visited;

  while (!stack.empty()) {
    auto node = std::move(stack.back());
    stack.pop_back();

    if (node == to) {
      return true;
    }
    if (!visited.insert(node).second) {
      continue;
    }

    auto it = outgoing_.find(node);
    if (it == outgoing_.end()) {
      continue;
    }
    for (const auto& next : it->second) {
      if (!visited.contains(next)) {
        stack.push_back(next);
      }
    }
  }
  return false;
}

std::vector<DependencyEdge> GoalGraph::IncomingDependencies(const GoalId& id) const {
  std::vector<DependencyEdge> out;
  auto                        it = incoming_.find(id);
  if (it == incoming_.end()) return out;
  for (const auto& prerequisite : it->second) {
    out.push_back(edges_.at(EdgeKey{prerequisite, id}));
  }
  return out;
}

std::vector<DependencyEdge> GoalGraph::OutgoingDependencies(const GoalId& id) const {
  std::vector<DependencyEdge> out;
  auto                        it = outgoing_.find(id);
  if (it == outgoing_.end()) return out;
  for (const auto& dependent : it->second) {
    out.push_back(edges_.at(EdgeKey{id, dependent}));
  }
  return out;
}

std::size_t GoalGraph::DependencyCount() const {
  return edges_.size();
}

// ------------------------------------------------------------
// Deletion
// ------------------------------------------------------------

std::vector<GoalId> GoalGraph::CollectOwned(const GoalId& id) const {
  std::vector<GoalId>        order;
  std::vector<GoalId>        stack{id};
  std::unordered_set<GoalId> visited;

  while (!stack.empty()) {
    auto node = std::move(stack.back());
    stack.pop_back();
    if (!goals_.contains(node) || !visited.insert(node).second) {
      continue;
    }
    order.push_back(node);

    const auto& goal = goals_.at(node);
    for (auto it = goal.sequential_steps.rbegin(); it != goal.sequential_steps.rend(); ++it) {
      stack.push_back(*it);
    }
    auto children = children_.find(node);
    if (children != children_.end()) {
      for (auto it = children->second.rbegin(); it != children->second.rend(); ++it) {
        stack.push_back(*it);
      }
    }
  }
  return order;
}

std::vector<GoalId> GoalGraph::Delete(const GoalId& id) {
  if (!goals_.contains(id)) {
    return {};
  }

  const auto removed = CollectOwned(id);
  Detach(id);

  for (const auto& goal_id : removed) {
    std::vector<EdgeKey> touching;
    if (auto out = outgoing_.find(goal_id); out != outgoing_.end()) {
      for (const auto& dependent : out->second) touching.emplace_back(goal_id, dependent);
    }
    if (auto in = incoming_.find(goal_id); in != incoming_.end()) {
      for (const auto& prerequisite : in->second) touching.emplace_back(prerequisite, goal_id);
    }
    for (const auto& key : touching) {
      if (edges_.contains(key)) RemoveEdge(key);
    }
  }

  for (const auto& goal_id : removed) {
    children_.erase(goal_id);
    goals_.erase(goal_id);
    dirty_.erase(goal_id);
    deleted_.insert(goal_id);
  }
  return removed;
}

// ------------------------------------------------------------
// Lookup / traversal
// ------------------------------------------------------------

bool GoalGraph::Contains(const GoalId& id) const {
  return goals_.contains(id);
}

const Goal* GoalGraph::Find(const GoalId& id) const {
  auto it = goals_.find(id);
  return it == goals_.end() ? nullptr : &it->second;
}

const Goal& GoalGraph::Get(const GoalId& id) const {
  auto it = goals_.find(id);
  if (it == goals_.end()) {
    throw util::NotFound("goal not found: " + id);
  }
  return it->second;
}

Goal& GoalGraph::Mutable(const GoalId& id) {
  auto it = goals_.find(id);
  if (it == goals_.end()) {
    throw util::NotFound("goal not found: " + id);
  }
  MarkDirty(id);
  return it->second;
}

std::size_t GoalGraph::Size() const {
  return goals_.size();
}

std::vector<GoalId> GoalGraph::TopLevelGoals() const {
  auto it = children_.find(kRootKey);
  return it == children_.end() ? std::vector<GoalId>{} : it->second;
}

std::vector<GoalId> GoalGraph::Children(const GoalId& id) const {
  auto it = children_.find(id);
  return it == children_.end() ? std::vector<GoalId>{} : it->second;
}

bool GoalGraph::HasChildren(const GoalId& id) const {
  auto it = children_.find(id);
  return it != children_.end() && !it->second.empty();
}

std::vector<GoalId> GoalGraph::Steps(const GoalId& id) const {
  return Get(id).sequential_steps;
}

std::vector<GoalId> GoalGraph::Descendants(const GoalId& id, bool include_self) const {
  std::vector<GoalId> order;
  if (!goals_.contains(id)) {
    return order;
  }

  std::vector<GoalId>        stack{id};
  std::unordered_set<GoalId> visited;

  while (!stack.empty()) {
    auto node = std::move(stack.back());
    stack.pop_back();
    if (!visited.insert(node).second) {
      continue;
    }
    if (node != id || include_self) {
      order.push_back(node);
    }

    auto children = children_.find(node);
    if (children == children_.end()) {
      continue;
    }
    for (auto it = children->second.rbegin(); it != children->second.rend(); ++it) {
      if (!visited.contains(*it)) {
        stack.push_back(*it);
      }
    }
  }
  return order;
}

std::vector<GoalId> GoalGraph::Leaves(const GoalId& id) const {
  if (!goals_.contains(id)) {
    return {};
  }
  if (!HasChildren(id)) {
    return {id};
  }

  std::vector<GoalId> leaves;
  for (const auto& node : Descendants(id, /*include_self=*/false)) {
    if (!HasChildren(node)) {
      leaves.push_back(node);
    }
  }
  return leaves;
}

// ------------------------------------------------------------
// Persistence support
// ------------------------------------------------------------

LoadReport GoalGraph::Load(std::vector<Goal> goals, const std::vector<DependencyEdge>& edges) {
  goals_.clear();
  children_.clear();
  edges_.clear();
  outgoing_.clear();
  incoming_.clear();

  LoadReport report;
  for (auto& goal : goals) {
    auto id = goal.id;
    goals_.insert_or_assign(std::move(id), std::move(goal));
  }

  // Break dangling or cyclic parent references before building child lists.
  for (auto& [id, goal] : goals_) {
    if (goal.step_of) {
      if (!goals_.contains(*goal.step_of)) {
        goal.step_of.reset();
        report.detached.push_back(id);
      }
      continue;
    }
    if (!goal.parent_id) {
      continue;
    }

    std::unordered_set<GoalId> seen{id};
    auto                       cursor = goal.parent_id;
    bool                       valid  = true;
    while (cursor) {
      auto parent = goals_.find(*cursor);
      if (parent == goals_.end() || !seen.insert(*cursor).second) {
        valid = false;
        break;
      }
      cursor = parent->second.parent_id;
    }
    if (!valid) {
      goal.parent_id.reset();
      report.detached.push_back(id);
    }
  }

  std::vector<GoalId> ordered;
  ordered.reserve(goals_.size());
  for (const auto& [id, goal] : goals_) {
    if (!goal.step_of) ordered.push_back(id);
  }
  std::sort(ordered.begin(), ordered.end(), [this](const GoalId& a, const GoalId& b) {
    const auto& lhs = goals_.at(a);
    const auto& rhs = goals_.at(b);
    if (lhs.sort_index != rhs.sort_index) return lhs.sort_index < rhs.sort_index;
    if (lhs.created_at != rhs.created_at) return lhs.created_at < rhs.created_at;
    return a < b;
  });
  for (const auto& id : ordered) {
    children_[ParentKey(goals_.at(id))].push_back(id);
  }

  for (auto& [id, goal] : goals_) {
    auto& steps = goal.sequential_steps;
    steps.erase(std::remove_if(steps.begin(), steps.end(),
                               [this, &id](const GoalId& step) {
                                 auto it = goals_.find(step);
                                 return it == goals_.end() || it->second.step_of != id;
                               }),
                steps.end());
  }

  for (const auto& edge : edges) {
    try {
      AddDependency(edge.prerequisite, edge.dependent, edge.kind, edge.note, edge.created_at);
      ++report.edges;
    } catch (const std::runtime_error&) {
      report.dropped_edges.push_back(edge);
    }
  }

  report.goals = goals_.size();
  ClearChanges();
  return report;
}

ChangeSet GoalGraph::PendingChanges() const {
  ChangeSet changes;
  changes.upserted.assign(dirty_.begin(), dirty_.end());
  changes.deleted.assign(deleted_.begin(), deleted_.end());
  for (const auto& [key, edge] : added_edges_) {
    changes.added_edges.push_back(edge);
  }
  changes.removed_edges.assign(removed_edges_.begin(), removed_edges_.end());
  return changes;
}

void GoalGraph::ClearChanges() {
  dirty_.clear();
  deleted_.clear();
  added_edges_.clear();
  removed_edges_.clear();
}

void GoalGraph::MarkDirty(const GoalId& id) {
  dirty_.insert(id);
}

} // namespace goalgraph::graph
