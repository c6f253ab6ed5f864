#include "timeline_projector.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

#include "internal/util/time.hpp"

namespace goalgraph::timeline {

namespace {

using model::EventLinkStatus;
using model::Goal;
using model::TimePoint;

std::string Lowercase(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

std::string Trim(const std::string& text) {
  const auto first = text.find_first_not_of(" \t\n");
  if (first == std::string::npos) return {};
  const auto last = text.find_last_not_of(" \t\n");
  return text.substr(first, last - first + 1);
}

std::optional<double> DeltaValue(const std::optional<double>& target, const std::optional<double>& baseline) {
  if (!target) return std::nullopt;
  if (!baseline) return target;
  return std::abs(*target - *baseline);
}

void AppendEvents(const Goal& goal, const Horizon& horizon, std::vector<TimelineEntry>& out) {
  for (const auto& link : goal.scheduled_events) {
    const auto end = std::max(link.start, link.end);
    if (!horizon.Intersects(link.start, end)) continue;

    TimelineEntry entry;
    entry.id         = link.event_id;
    entry.goal_id    = goal.id;
    entry.goal_title = goal.title;
    entry.kind       = EntryKind::kEvent;
    entry.start      = link.start;
    entry.end        = end;
    switch (link.status) {
      case EventLinkStatus::kConfirmed:
        entry.title      = "Confirmed session";
        entry.detail     = "Confirmed focus block";
        entry.confidence = 0.95;
        break;
      case EventLinkStatus::kProposed:
        entry.title      = "Proposed slot";
        entry.detail     = "Awaiting confirmation";
        entry.confidence = 0.6;
        break;
      case EventLinkStatus::kCancelled:
        entry.title      = "Cancelled session";
        entry.detail     = "Session cancelled";
        entry.confidence = 0.2;
        break;
    }
    out.push_back(std::move(entry));
  }
}

void AppendProjections(const Goal& goal, const Horizon& horizon, std::vector<TimelineEntry>& out) {
  const std::optional<std::string> label = goal.target_metric ? std::optional<std::string>(goal.target_metric->label) : std::nullopt;

  for (const auto& projection : goal.projections) {
    if (projection.status == model::ProjectionStatus::kComplete || projection.status == model::ProjectionStatus::kSkipped) continue;
    if (!horizon.Intersects(projection.start, projection.end)) continue;

    TimelineEntry entry;
    entry.id             = projection.id;
    entry.goal_id        = goal.id;
    entry.goal_title     = goal.title;
    entry.kind           = EntryKind::kProjection;
    entry.title          = projection.title;
    entry.detail         = projection.detail;
    entry.start          = projection.start;
    entry.end            = projection.end;
    entry.metric_summary = FormatMetricDelta(projection.expected_metric_delta, projection.metric_unit, label);
    entry.confidence     = projection.confidence;
    out.push_back(std::move(entry));
  }
}

void AppendPhases(const Goal& goal, const Horizon& horizon, const TimelineOptions& options, std::vector<TimelineEntry>& out) {
  for (const auto& phase : goal.phases) {
    const TimePoint anchor = phase.started_at.value_or(goal.activated_at.value_or(goal.created_at));
    TimePoint       end    = anchor;
    if (phase.completed_at) {
      end = *phase.completed_at;
    } else if (phase.status == model::PhaseStatus::kPlanned) {
      end = util::AddDays(anchor, options.planned_phase_days);
    }
    end = std::max(anchor, end);
    if (!horizon.Intersects(anchor, end)) continue;

    TimelineEntry entry;
    entry.id         = phase.id;
    entry.goal_id    = goal.id;
    entry.goal_title = goal.title;
    entry.kind       = EntryKind::kPhase;
    entry.title      = phase.title;
    entry.detail     = phase.summary;
    entry.start      = anchor;
    entry.end        = end;
    out.push_back(std::move(entry));
  }
}

// Checkpoint at the end of the measurement window; projections supersede it.
void AppendMetricCheckpoint(const Goal& goal, const Horizon& horizon, TimePoint reference, std::vector<TimelineEntry>& out) {
  switch (goal.kind) {
    case model::GoalKind::kEvent:
      return;
    case model::GoalKind::kCampaign:
    case model::GoalKind::kHybrid:
      break;
  }
  if (!goal.target_metric || !goal.projections.empty()) return;

  const auto& metric       = *goal.target_metric;
  const auto  horizon_days = std::chrono::duration_cast<std::chrono::hours>(horizon.end - horizon.start).count() / 24;
  const auto  window_days  = std::max<std::int64_t>(metric.measurement_window_days.value_or(static_cast<int>(horizon_days)), 1);
  const auto  checkpoint   = util::AddDays(goal.activated_at.value_or(reference), window_days);
  if (!horizon.Contains(checkpoint)) return;

  const auto summary = FormatMetricDelta(DeltaValue(metric.target_value, metric.baseline_value), metric.unit, metric.label);

  TimelineEntry entry;
  entry.id             = goal.id + ":checkpoint";
  entry.goal_id        = goal.id;
  entry.goal_title     = goal.title;
  entry.kind           = EntryKind::kMetricCheckpoint;
  entry.title          = summary.value_or(metric.label);
  entry.detail         = metric.notes;
  entry.start          = checkpoint;
  entry.end            = checkpoint;
  entry.metric_summary = summary;
  out.push_back(std::move(entry));
}

} // namespace

TimelineEntry TimelineEntry::Enriched(EntryIntelligence annotation) const {
  TimelineEntry copy = *this;
  copy.intelligence  = std::move(annotation);
  return copy;
}

std::optional<std::string> FormatMetricDelta(std::optional<double> delta, const std::optional<std::string>& unit,
                                             const std::optional<std::string>& label) {
  if (!delta) return std::nullopt;

  const double rounded  = std::round(*delta * 10.0) / 10.0;
  const bool   integral = std::fmod(rounded, 1.0) == 0.0;

  std::ostringstream out;
  out << "\xCE\x94" << std::fixed << std::setprecision(integral ? 0 : 1) << rounded;
  if (unit && !unit->empty()) out << ' ' << *unit;
  if (label && !label->empty()) out << ' ' << Lowercase(*label);
  return Trim(out.str());
}

std::vector<TimelineEntry> BuildEntries(const Goal& goal, const Horizon& horizon, TimePoint reference, const TimelineOptions& options) {
  std::vector<TimelineEntry> entries;
  AppendEvents(goal, horizon, entries);
  AppendProjections(goal, horizon, entries);
  AppendPhases(goal, horizon, options, entries);
  AppendMetricCheckpoint(goal, horizon, reference, entries);

  std::stable_sort(entries.begin(), entries.end(), [](const TimelineEntry& lhs, const TimelineEntry& rhs) {
    if (lhs.start != rhs.start) return lhs.start < rhs.start;
    return static_cast<int>(lhs.kind) < static_cast<int>(rhs.kind);
  });
  return entries;
}

bool IsInHorizon(const Goal& goal, const Horizon& horizon, TimePoint reference, const TimelineOptions& options) {
  if (!BuildEntries(goal, horizon, reference, options).empty()) {
    return true;
  }

  const TimePoint anchor = goal.activated_at.value_or(goal.created_at);
  const TimePoint end    = std::max(anchor, goal.target_date.value_or(util::AddDays(anchor, options.default_span_days)));
  return horizon.Intersects(anchor, end);
}

} // namespace goalgraph::timeline
