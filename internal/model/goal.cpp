#include "goal.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace goalgraph::model {

GoalSnapshot CaptureSnapshot(const Goal& goal, std::string rationale, TimePoint now) {
  GoalSnapshot snapshot;
  snapshot.title       = goal.title;
  snapshot.body        = goal.body;
  snapshot.progress    = goal.progress;
  snapshot.rationale   = std::move(rationale);
  snapshot.captured_at = now;
  return snapshot;
}

void AppendRevision(Goal& goal, std::string summary, std::optional<std::string> rationale, TimePoint now,
                    std::optional<GoalSnapshot> before, std::optional<GoalSnapshot> after) {
  // history stays monotonic even if the caller's clock steps backwards
  if (!goal.revisions.empty()) {
    now = std::max(now, goal.revisions.back().recorded_at);
  }

  RevisionRecord record;
  record.summary     = std::move(summary);
  record.rationale   = std::move(rationale);
  record.before      = std::move(before);
  record.after       = std::move(after);
  record.recorded_at = now;
  goal.revisions.push_back(std::move(record));
  goal.updated_at = now;
}

bool HasContent(const Goal& goal) {
  const auto blank = [](const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  };
  return !blank(goal.title) || !blank(goal.body);
}

std::string_view ToString(Priority priority) {
  switch (priority) {
    case Priority::kNow:
      return "now";
    case Priority::kNext:
      return "next";
    case Priority::kLater:
      return "later";
  }
  return "next";
}

std::string_view ToString(GoalKind kind) {
  switch (kind) {
    case GoalKind::kEvent:
      return "event";
    case GoalKind::kCampaign:
      return "campaign";
    case GoalKind::kHybrid:
      return "hybrid";
  }
  return "campaign";
}

std::string_view ToString(DependencyKind kind) {
  switch (kind) {
    case DependencyKind::kFinishToStart:
      return "finish-to-start";
    case DependencyKind::kStartToStart:
      return "start-to-start";
    case DependencyKind::kFinishToFinish:
      return "finish-to-finish";
  }
  return "finish-to-start";
}

std::string_view ToString(EventLinkStatus status) {
  switch (status) {
    case EventLinkStatus::kProposed:
      return "proposed";
    case EventLinkStatus::kConfirmed:
      return "confirmed";
    case EventLinkStatus::kCancelled:
      return "cancelled";
  }
  return "proposed";
}

} // namespace goalgraph::model
