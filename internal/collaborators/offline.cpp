#include "offline.hpp"

#include "internal/util/errors.hpp"

namespace goalgraph::collaborators {

namespace {

[[noreturn]] void Unavailable(const std::string& what) {
  throw util::ExternalServiceFailure(what + " is not configured", /*recoverable=*/false);
}

} // namespace

DecompositionTree OfflineReasoningService::RequestBreakdown(const model::Goal&, const GoalContext&) {
  Unavailable("reasoning service");
}

Regeneration OfflineReasoningService::RequestRegeneration(const model::Goal&, const GoalContext&) {
  Unavailable("reasoning service");
}

ActivationPlan OfflineReasoningService::RequestActivationPlan(const model::Goal&, const std::vector<model::Goal>&) {
  Unavailable("reasoning service");
}

NextStepProposal OfflineReasoningService::RequestNextStep(const model::Goal&, const model::Goal&, const GoalContext&) {
  Unavailable("reasoning service");
}

std::string OfflineReasoningService::SummarizeForLock(const model::Goal&, const GoalContext&) {
  Unavailable("reasoning service");
}

std::string OfflineCalendarService::CreateEvent(const std::string&, model::TimePoint, std::chrono::seconds, const std::string&) {
  Unavailable("calendar service");
}

void OfflineCalendarService::CancelEvent(const std::string&) {
  Unavailable("calendar service");
}

} // namespace goalgraph::collaborators
