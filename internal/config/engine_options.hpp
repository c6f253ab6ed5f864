#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace goalgraph::runtime::config {
class RuntimeConfig;
}

namespace goalgraph::config {

struct EngineOptions {
  std::size_t   step_hard_limit          = 15;
  std::size_t   step_soft_warning        = 12;
  std::int64_t  default_step_days        = 7;
  std::string   default_lock_rationale   = "locked by user";
  std::string   calendar_notes_signature = "Scheduled via goalgraph";
  std::int64_t  default_span_days        = 14;
  std::int64_t  planned_phase_days       = 3;
};

// Unset (zero / empty) config values keep the defaults above.
EngineOptions ResolveEngineOptions(const goalgraph::runtime::config::RuntimeConfig& config);

} // namespace goalgraph::config
