#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/goal.hpp"

namespace goalgraph::timeline {

// Ordinal doubles as the tie-break order for entries sharing a start date.
enum class EntryKind : std::uint8_t {
  kEvent            = 0,
  kProjection       = 1,
  kPhase            = 2,
  kMetricCheckpoint = 3,
};

struct Horizon {
  model::TimePoint start{};
  model::TimePoint end{};

  bool Intersects(model::TimePoint from, model::TimePoint to) const {
    return from <= end && to >= start;
  }

  bool Contains(model::TimePoint at) const {
    return at >= start && at <= end;
  }
};

// Filled by an external enrichment pass; never needed for correctness.
struct EntryIntelligence {
  std::string                outcome_summary;
  std::vector<std::string>   highlights;
  std::optional<std::string> recommended_action;
  std::optional<double>      completion_likelihood;
  bool                       ready_to_mark_complete = false;
};

struct TimelineEntry {
  std::string                      id;
  model::GoalId                    goal_id;
  std::string                      goal_title;
  EntryKind                        kind = EntryKind::kEvent;
  std::string                      title;
  std::optional<std::string>       detail;
  model::TimePoint                 start{};
  model::TimePoint                 end{};
  std::optional<std::string>       metric_summary;
  std::optional<double>            confidence;
  std::optional<EntryIntelligence> intelligence;

  TimelineEntry Enriched(EntryIntelligence annotation) const;
};

struct TimelineOptions {
  std::int64_t default_span_days  = 14;
  std::int64_t planned_phase_days = 3;
};

/*
  Entries for one goal clipped to the horizon, sorted by start date then kind.
  `reference` anchors the metric window of goals that were never activated.
*/
std::vector<TimelineEntry> BuildEntries(const model::Goal& goal, const Horizon& horizon, model::TimePoint reference,
                                        const TimelineOptions& options = {});

// True if the goal has entries in the horizon or its implied span overlaps it.
bool IsInHorizon(const model::Goal& goal, const Horizon& horizon, model::TimePoint reference, const TimelineOptions& options = {});

// "Δ2.5 kg body fat"; nullopt without a delta.
std::optional<std::string> FormatMetricDelta(std::optional<double> delta, const std::optional<std::string>& unit,
                                             const std::optional<std::string>& label);

} // namespace goalgraph::timeline
