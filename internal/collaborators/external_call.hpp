#pragma once

#include <exception>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace goalgraph::collaborators {

/*
  Runs one collaborator call and normalises its failure into
  util::ExternalServiceFailure. The core surfaces exactly one terminal result
  per call; it never retries.
*/
template <typename Fn>
auto CallExternal(std::string_view operation, Fn&& fn) -> std::invoke_result_t<Fn> {
  try {
    return std::forward<Fn>(fn)();
  } catch (const util::ExternalServiceFailure& ex) {
    GOALGRAPH_LOG_WARN("External call failed", {observability::StringField("operation", operation), observability::StringField("error", ex.what()),
                                                observability::BoolField("recoverable", ex.recoverable())});
    throw;
  } catch (const std::exception& ex) {
    GOALGRAPH_LOG_WARN("External call failed", {observability::StringField("operation", operation), observability::StringField("error", ex.what())});
    throw util::ExternalServiceFailure(std::string(operation) + ": " + ex.what(), /*recoverable=*/true);
  }
}

} // namespace goalgraph::collaborators
