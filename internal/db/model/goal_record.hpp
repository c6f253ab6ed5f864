#pragma once

#include <cstdint>
#include <string>

namespace goalgraph::db::model {

/*
  One persisted goal.

  `document` is the JSON form of goalgraph.store.v1.GoalDocument. The
  hierarchy columns repeat what the document holds so backends can index
  them; empty means none.
*/
struct GoalRecord {
  std::string id;
  std::string parent_id;
  std::string owner_id; // roadmap owner for steps
  std::int64_t sort_index = 0;

  std::string document;

  std::uint64_t updated_at_ms = 0;
};

} // namespace goalgraph::db::model
