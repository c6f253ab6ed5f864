#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/model/goal.hpp"

namespace goalgraph::graph {

/*
  Mutations since the last ClearChanges(). Consumed by the persistence layer
  for incremental saves.
*/
struct ChangeSet {
  std::vector<model::GoalId>                               upserted;
  std::vector<model::GoalId>                               deleted;
  std::vector<model::DependencyEdge>                       added_edges;
  std::vector<std::pair<model::GoalId, model::GoalId>>     removed_edges;

  bool empty() const {
    return upserted.empty() && deleted.empty() && added_edges.empty() && removed_edges.empty();
  }
};

struct LoadReport {
  std::size_t                        goals = 0;
  std::size_t                        edges = 0;
  std::vector<model::GoalId>         detached;      // parent missing or cyclic, loaded as top-level
  std::vector<model::DependencyEdge> dropped_edges; // would break the DAG or reference unknown goals
};

/*
  Arena of goals keyed by id with two independent edge tables:

    parent -> ordered children   (tree, acyclic)
    prerequisite -> dependent    (typed dependency edges, DAG)

  Every insertion checks for cycles before committing. Traversals carry a
  visited set so they terminate even on a corrupted graph.

  Not thread-safe; see core::GraphGuard.
*/
class GoalGraph {
 public:
  const model::Goal& Insert(model::Goal goal, const std::optional<model::GoalId>& parent = std::nullopt);
  const model::Goal& InsertAt(model::Goal goal, const model::GoalId& parent, std::int64_t sort_index);
  const model::Goal& AppendStep(const model::GoalId& owner, model::Goal step);

  void Reparent(const model::GoalId& id, const std::optional<model::GoalId>& new_parent);

  const model::DependencyEdge& AddDependency(const model::GoalId& prerequisite, const model::GoalId& dependent, model::DependencyKind kind,
                                             std::optional<std::string> note = std::nullopt,
                                             model::TimePoint           created_at = model::TimePoint{});
  bool                         RemoveDependency(const model::GoalId& prerequisite, const model::GoalId& dependent);
  bool                         HasDependency(const model::GoalId& prerequisite, const model::GoalId& dependent) const;

  // Removes the goal, its subtree and roadmap steps, and every edge touching them.
  // Returns the removed ids in pre-order; empty if the goal was already gone.
  std::vector<model::GoalId> Delete(const model::GoalId& id);

  bool               Contains(const model::GoalId& id) const;
  const model::Goal* Find(const model::GoalId& id) const;
  const model::Goal& Get(const model::GoalId& id) const;
  model::Goal&       Mutable(const model::GoalId& id);
  std::size_t        Size() const;

  std::vector<model::GoalId> TopLevelGoals() const;
  std::vector<model::GoalId> Children(const model::GoalId& id) const;
  std::vector<model::GoalId> Descendants(const model::GoalId& id, bool include_self) const;
  std::vector<model::GoalId> Leaves(const model::GoalId& id) const;
  std::vector<model::GoalId> Steps(const model::GoalId& id) const;
  bool                       HasChildren(const model::GoalId& id) const;

  std::vector<model::DependencyEdge> IncomingDependencies(const model::GoalId& id) const;
  std::vector<model::DependencyEdge> OutgoingDependencies(const model::GoalId& id) const;
  std::size_t                        DependencyCount() const;

  // True if `to` is reachable from `from` following prerequisite -> dependent edges.
  bool DependencyReaches(const model::GoalId& from, const model::GoalId& to) const;

  // Bulk rehydrate. Replaces the whole graph and clears pending changes.
  LoadReport Load(std::vector<model::Goal> goals, const std::vector<model::DependencyEdge>& edges);

  ChangeSet PendingChanges() const;
  void      ClearChanges();

 private:
  using EdgeKey = std::pair<model::GoalId, model::GoalId>;

  const model::Goal& InsertUnchecked(model::Goal goal, const std::optional<model::GoalId>& parent);
  std::int64_t       NextSortIndex(const std::optional<model::GoalId>& parent) const;
  void               Attach(const model::GoalId& id);
  void               Detach(const model::GoalId& id);
  void               RemoveEdge(const EdgeKey& key);
  void               MarkDirty(const model::GoalId& id);
  std::vector<model::GoalId> CollectOwned(const model::GoalId& id) const;

  static const model::GoalId& ParentKey(const model::Goal& goal);

  std::unordered_map<model::GoalId, model::Goal>                goals_;
  std::unordered_map<model::GoalId, std::vector<model::GoalId>> children_; // "" holds top-level goals

  std::map<EdgeKey, model::DependencyEdge>                      edges_;
  std::unordered_map<model::GoalId, std::vector<model::GoalId>> outgoing_;
  std::unordered_map<model::GoalId, std::vector<model::GoalId>> incoming_;

  std::set<model::GoalId>                  dirty_;
  std::set<model::GoalId>                  deleted_;
  std::map<EdgeKey, model::DependencyEdge> added_edges_;
  std::set<EdgeKey>                        removed_edges_;
};

} // namespace goalgraph::graph
