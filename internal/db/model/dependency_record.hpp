#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace goalgraph::db::model {

// prerequisite ---> dependent
struct DependencyRecord {
  std::string prerequisite_id;
  std::string dependent_id;

  std::int32_t               kind = 0; // finish-to-start, start-to-start, finish-to-finish
  std::optional<std::string> note;

  std::uint64_t created_at_ms = 0;
};

} // namespace goalgraph::db::model
