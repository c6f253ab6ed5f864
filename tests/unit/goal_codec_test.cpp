#include "internal/db/codec/goal_codec.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/time.hpp"

namespace {

using goalgraph::db::codec::DecodeDependency;
using goalgraph::db::codec::DecodeGoal;
using goalgraph::db::codec::EncodeGoal;
using goalgraph::model::Goal;

const auto kT0 = goalgraph::util::FromUnixMillis(1'700'000'000'123);

template <typename Fn>
bool ThrowsRuntimeError(Fn&& fn) {
  try {
    fn();
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestLockedRoadmapStepSurvivesStorage() {
  Goal step;
  step.id            = "step-1";
  step.title         = "Two balls";
  step.created_at    = kT0;
  step.updated_at    = kT0;
  step.step_of       = "owner";
  step.sort_index    = 3;
  step.step_status   = goalgraph::model::StepStatus::kCompleted;
  step.is_final_step = true;
  step.is_locked     = true;
  step.locked_snapshot = goalgraph::model::CaptureSnapshot(step, "Step completed", kT0);
  step.completed_at  = kT0;
  goalgraph::model::AppendRevision(step, "Locked", std::string("Step completed"), kT0);

  const auto record = EncodeGoal(step);
  assert(record.owner_id == "owner");
  assert(record.parent_id.empty());
  assert(record.sort_index == 3);

  const auto decoded = DecodeGoal(record);
  assert(decoded.step_of == std::optional<std::string>("owner"));
  assert(!decoded.parent_id.has_value());
  assert(decoded.step_status == goalgraph::model::StepStatus::kCompleted);
  assert(decoded.is_final_step);
  assert(decoded.locked_snapshot && decoded.locked_snapshot->rationale == "Step completed");
  assert(decoded.completed_at == std::optional<goalgraph::model::TimePoint>(kT0));
  assert(!decoded.activated_at.has_value());
  assert(decoded.revisions.size() == 1);
  assert(decoded.revisions[0].rationale == std::optional<std::string>("Step completed"));
  assert(!decoded.revisions[0].before.has_value());
}

void TestEnrichmentSurvivesStorage() {
  Goal goal;
  goal.id                   = "goal";
  goal.title                = "Lose weight";
  goal.kind                 = goalgraph::model::GoalKind::kHybrid;
  goal.glyph                = "scale";
  goal.target_metric        = goalgraph::model::TargetMetric{};
  goal.target_metric->label = "Weight";
  goal.target_metric->target_value = 75.0;

  goalgraph::model::Projection projection;
  projection.id         = "p";
  projection.title      = "Month one";
  projection.start      = kT0;
  projection.end        = goalgraph::util::AddDays(kT0, 30);
  projection.confidence = 0.7;
  projection.status     = goalgraph::model::ProjectionStatus::kInProgress;
  goal.projections.push_back(projection);

  goal.scheduled_events.push_back(
      goalgraph::model::ScheduledEventLink{"evt-1", kT0, kT0 + std::chrono::hours(1), goalgraph::model::EventLinkStatus::kConfirmed});

  goalgraph::model::TreeSection section;
  section.title        = "Foundations";
  section.step_indices = {0, 1};
  goal.tree_sections.push_back(section);

  const auto decoded = DecodeGoal(EncodeGoal(goal));
  assert(decoded.kind == goalgraph::model::GoalKind::kHybrid);
  assert(decoded.glyph == std::optional<std::string>("scale"));
  assert(decoded.target_metric && !decoded.target_metric->baseline_value.has_value());
  assert(decoded.target_metric->target_value == std::optional<double>(75.0));
  assert(decoded.projections.size() == 1);
  assert(decoded.projections[0].status == goalgraph::model::ProjectionStatus::kInProgress);
  assert(decoded.projections[0].end == goalgraph::util::AddDays(kT0, 30));
  assert(decoded.scheduled_events[0].status == goalgraph::model::EventLinkStatus::kConfirmed);
  assert((decoded.tree_sections[0].step_indices == std::vector<std::size_t>{0, 1}));
}

void TestMalformedRowsAreRejected() {
  Goal goal;
  goal.id    = "goal";
  goal.title = "Anything";
  auto record = EncodeGoal(goal);

  auto mismatched = record;
  mismatched.id   = "other";
  assert(ThrowsRuntimeError([&] { DecodeGoal(mismatched); }));

  auto garbage     = record;
  garbage.document = "{not json";
  assert(ThrowsRuntimeError([&] { DecodeGoal(garbage); }));

  auto bad_enum     = record;
  bad_enum.document = R"({"id":"goal","title":"Anything","priority":7})";
  assert(ThrowsRuntimeError([&] { DecodeGoal(bad_enum); }));

  goalgraph::db::model::DependencyRecord edge;
  edge.prerequisite_id = "a";
  edge.dependent_id    = "b";
  edge.kind            = 9;
  assert(ThrowsRuntimeError([&] { DecodeDependency(edge); }));
}

void TestUnknownDocumentFieldsAreIgnored() {
  goalgraph::db::model::GoalRecord record;
  record.id       = "goal";
  record.document = R"({"id":"goal","title":"Future","addedLater":true})";
  assert(DecodeGoal(record).title == "Future");
}

} // namespace

int main() {
  TestLockedRoadmapStepSurvivesStorage();
  TestEnrichmentSurvivesStorage();
  TestMalformedRowsAreRejected();
  TestUnknownDocumentFieldsAreIgnored();

  std::cout << "goalgraph_unit_goal_codec: pass\n";
  return 0;
}
