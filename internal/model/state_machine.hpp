#pragma once

#include <cstdint>
#include <string_view>

namespace goalgraph::model {

enum class ActivationState : std::uint8_t {
  kDraft     = 0,
  kActive    = 1,
  kCompleted = 2,
  kArchived  = 3,
};

enum class StepStatus : std::uint8_t {
  kPending   = 0,
  kCurrent   = 1,
  kCompleted = 2,
  kUnknown   = 3,
};

constexpr bool IsTerminal(ActivationState state) {
  return state == ActivationState::kCompleted || state == ActivationState::kArchived;
}

/*
  draft  -> active | completed | archived
  active -> draft  | completed | archived
  completed, archived: terminal
*/
constexpr bool CanTransition(ActivationState from, ActivationState to) {
  if (from == to) {
    return true;
  }
  if (IsTerminal(from)) {
    return false;
  }
  if (to == ActivationState::kActive) {
    return from == ActivationState::kDraft;
  }
  return true;
}

// Display order for roadmap steps: unknown is non-blocking and follows pending.
constexpr int SortRank(StepStatus status) {
  switch (status) {
    case StepStatus::kCompleted:
      return 0;
    case StepStatus::kCurrent:
      return 1;
    case StepStatus::kPending:
      return 2;
    case StepStatus::kUnknown:
      return 3;
  }
  return 3;
}

constexpr std::string_view ToString(ActivationState state) {
  switch (state) {
    case ActivationState::kDraft:
      return "draft";
    case ActivationState::kActive:
      return "active";
    case ActivationState::kCompleted:
      return "completed";
    case ActivationState::kArchived:
      return "archived";
  }
  return "draft";
}

constexpr std::string_view ToString(StepStatus status) {
  switch (status) {
    case StepStatus::kPending:
      return "pending";
    case StepStatus::kCurrent:
      return "current";
    case StepStatus::kCompleted:
      return "completed";
    case StepStatus::kUnknown:
      return "unknown";
  }
  return "unknown";
}

} // namespace goalgraph::model
