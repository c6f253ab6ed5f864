#pragma once

#include <mutex>
#include <shared_mutex>
#include <utility>

#include "internal/graph/goal_graph.hpp"

namespace goalgraph::core {

/*
  Single-writer / multi-reader access to one goal graph.

  Writers run the whole mutation (including two-phase builders) under the
  exclusive lock, so readers never observe a half-applied change. External
  calls must never run inside Read() or Write().
*/
class GraphGuard {
 public:
  template <typename Fn>
  decltype(auto) Read(Fn&& fn) const {
    std::shared_lock lock(mutex_);
    return std::forward<Fn>(fn)(static_cast<const graph::GoalGraph&>(graph_));
  }

  template <typename Fn>
  decltype(auto) Write(Fn&& fn) {
    std::unique_lock lock(mutex_);
    return std::forward<Fn>(fn)(graph_);
  }

 private:
  mutable std::shared_mutex mutex_;
  graph::GoalGraph          graph_;
};

} // namespace goalgraph::core
