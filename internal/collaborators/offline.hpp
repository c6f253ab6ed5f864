#pragma once

#include "internal/collaborators/calendar_service.hpp"
#include "internal/collaborators/reasoning_service.hpp"

namespace goalgraph::collaborators {

/*
  Stand-ins used when no reasoning or calendar backend is wired in. Every
  call fails with a non-recoverable ExternalServiceFailure, so operations that
  degrade gracefully (lock, deactivate, delete) still work.
*/

class OfflineReasoningService final : public ReasoningService {
 public:
  DecompositionTree RequestBreakdown(const model::Goal& goal, const GoalContext& context) override;
  Regeneration      RequestRegeneration(const model::Goal& goal, const GoalContext& context) override;
  ActivationPlan    RequestActivationPlan(const model::Goal& goal, const std::vector<model::Goal>& all_goals) override;
  NextStepProposal  RequestNextStep(const model::Goal& goal, const model::Goal& completed_step, const GoalContext& context) override;
  std::string       SummarizeForLock(const model::Goal& goal, const GoalContext& context) override;
};

class OfflineCalendarService final : public CalendarService {
 public:
  std::string CreateEvent(const std::string& title, model::TimePoint start, std::chrono::seconds duration, const std::string& notes) override;
  void        CancelEvent(const std::string& event_id) override;
};

} // namespace goalgraph::collaborators
