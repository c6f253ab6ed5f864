#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/state_machine.hpp"

namespace goalgraph::model {

using GoalId    = std::string;
using TimePoint = std::chrono::system_clock::time_point;

enum class Priority : std::uint8_t {
  kNow   = 0,
  kNext  = 1,
  kLater = 2,
};

// event: time driven. campaign: metric driven. hybrid: both.
enum class GoalKind : std::uint8_t {
  kEvent    = 0,
  kCampaign = 1,
  kHybrid   = 2,
};

enum class DependencyKind : std::uint8_t {
  kFinishToStart  = 0,
  kStartToStart   = 1,
  kFinishToFinish = 2,
};

enum class EventLinkStatus : std::uint8_t {
  kProposed  = 0,
  kConfirmed = 1,
  kCancelled = 2,
};

enum class ProjectionStatus : std::uint8_t {
  kUpcoming   = 0,
  kInProgress = 1,
  kComplete   = 2,
  kSkipped    = 3,
};

enum class PhaseStatus : std::uint8_t {
  kPlanned    = 0,
  kInProgress = 1,
  kCompleted  = 2,
};

struct GoalSnapshot {
  std::string title;
  std::string body;
  double      progress = 0.0;
  std::string rationale;
  TimePoint   captured_at{};
};

/*
  Audit record. Appended only; never edited or reordered.
*/
struct RevisionRecord {
  std::string                 summary;
  std::optional<std::string>  rationale;
  std::optional<GoalSnapshot> before;
  std::optional<GoalSnapshot> after;
  TimePoint                   recorded_at{};
};

struct DependencyEdge {
  GoalId                     prerequisite;
  GoalId                     dependent;
  DependencyKind             kind = DependencyKind::kFinishToStart;
  std::optional<std::string> note;
  TimePoint                  created_at{};
};

struct TargetMetric {
  std::string                label;
  std::optional<double>      baseline_value;
  std::optional<double>      target_value;
  std::optional<std::string> unit;
  std::optional<int>         measurement_window_days;
  std::optional<std::string> notes;
};

struct Projection {
  std::string                id;
  std::string                title;
  std::optional<std::string> detail;
  TimePoint                  start{};
  TimePoint                  end{};
  std::optional<double>      expected_metric_delta;
  std::optional<std::string> metric_unit;
  std::optional<double>      confidence;
  ProjectionStatus           status = ProjectionStatus::kUpcoming;
};

struct Phase {
  std::string                id;
  std::string                title;
  std::optional<std::string> summary;
  std::optional<TimePoint>   started_at;
  std::optional<TimePoint>   completed_at;
  PhaseStatus                status = PhaseStatus::kPlanned;
};

struct ScheduledEventLink {
  std::string     event_id; // calendar collaborator identifier
  TimePoint       start{};
  TimePoint       end{};
  EventLinkStatus status = EventLinkStatus::kProposed;
};

struct TreeSection {
  std::string              title;
  std::vector<std::size_t> step_indices;
  bool                     is_complete = false;
};

/*
  Goal node.

  Hierarchy and dependency edges are owned by graph::GoalGraph; the node only
  carries its parent reference and sort index. Roadmap steps are goals too:
  their owner lists them in sequential_steps and they point back via step_of.
*/
struct Goal {
  GoalId    id;
  TimePoint created_at{};
  TimePoint updated_at{};

  std::string title;
  std::string body;
  std::string category = "General";
  Priority    priority = Priority::kNext;
  double      progress = 0.0;
  GoalKind    kind     = GoalKind::kCampaign;

  std::optional<GoalId> parent_id;
  std::int64_t          sort_index = 0;

  ActivationState             state     = ActivationState::kDraft;
  bool                        is_locked = false;
  std::optional<GoalSnapshot> locked_snapshot;
  std::optional<TimePoint>    activated_at;
  std::optional<TimePoint>    completed_at;

  bool has_been_broken_down = false;
  bool is_atomic            = false;

  std::vector<RevisionRecord> revisions;

  bool                     has_sequential_steps = false;
  std::vector<GoalId>      sequential_steps;
  std::vector<TreeSection> tree_sections;
  std::optional<GoalId>    step_of;
  StepStatus               step_status   = StepStatus::kPending;
  bool                     is_final_step = false;
  std::optional<TimePoint> target_date;

  std::optional<std::string>  glyph;
  std::optional<TargetMetric> target_metric;
  std::vector<Projection>     projections;
  std::vector<Phase>          phases;

  std::vector<ScheduledEventLink> scheduled_events;
};

GoalSnapshot CaptureSnapshot(const Goal& goal, std::string rationale, TimePoint now);

void AppendRevision(Goal& goal, std::string summary, std::optional<std::string> rationale, TimePoint now,
                    std::optional<GoalSnapshot> before = std::nullopt, std::optional<GoalSnapshot> after = std::nullopt);

bool HasContent(const Goal& goal);

std::string_view ToString(Priority priority);
std::string_view ToString(GoalKind kind);
std::string_view ToString(DependencyKind kind);
std::string_view ToString(EventLinkStatus status);

} // namespace goalgraph::model
