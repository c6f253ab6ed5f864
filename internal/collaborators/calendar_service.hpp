#pragma once

#include <chrono>
#include <string>

#include "internal/model/goal.hpp"

namespace goalgraph::collaborators {

/*
  Calendar collaborator boundary. Failures are reported by throwing.
*/
class CalendarService {
 public:
  virtual ~CalendarService() = default;

  // Returns the external event identifier.
  virtual std::string CreateEvent(const std::string& title, model::TimePoint start, std::chrono::seconds duration,
                                  const std::string& notes) = 0;

  virtual void CancelEvent(const std::string& event_id) = 0;
};

} // namespace goalgraph::collaborators
