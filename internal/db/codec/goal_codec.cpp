#include "goal_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>
#include <string>

#include "goalgraph/store/v1/goal_document.pb.h"
#include "internal/util/time.hpp"

namespace goalgraph::db::codec {

namespace {

namespace pb = goalgraph::store::v1;
namespace gm = goalgraph::model;

using util::FromUnixMillis;
using util::ToUnixMillis;

// Proto enum numbers mirror the model ordinals; reject anything else.
template <typename Model, typename Proto>
Model EnumFromProto(Proto value, bool (*is_valid)(int), const char* name) {
  if (!is_valid(static_cast<int>(value))) {
    throw std::runtime_error(std::string("invalid ") + name + " in goal document: " + std::to_string(static_cast<int>(value)));
  }
  return static_cast<Model>(static_cast<int>(value));
}

template <typename Proto, typename Model>
Proto EnumToProto(Model value) {
  return static_cast<Proto>(static_cast<int>(value));
}

std::optional<gm::TimePoint> OptionalTime(bool has, std::int64_t ms) {
  if (!has) return std::nullopt;
  return FromUnixMillis(ms);
}

void EncodeSnapshot(const gm::GoalSnapshot& in, pb::Snapshot* out) {
  out->set_title(in.title);
  out->set_body(in.body);
  out->set_progress(in.progress);
  out->set_rationale(in.rationale);
  out->set_captured_at_ms(ToUnixMillis(in.captured_at));
}

gm::GoalSnapshot DecodeSnapshot(const pb::Snapshot& in) {
  gm::GoalSnapshot out;
  out.title       = in.title();
  out.body        = in.body();
  out.progress    = in.progress();
  out.rationale   = in.rationale();
  out.captured_at = FromUnixMillis(in.captured_at_ms());
  return out;
}

void EncodeRevision(const gm::RevisionRecord& in, pb::Revision* out) {
  out->set_summary(in.summary);
  if (in.rationale) out->set_rationale(*in.rationale);
  if (in.before) EncodeSnapshot(*in.before, out->mutable_before());
  if (in.after) EncodeSnapshot(*in.after, out->mutable_after());
  out->set_recorded_at_ms(ToUnixMillis(in.recorded_at));
}

gm::RevisionRecord DecodeRevision(const pb::Revision& in) {
  gm::RevisionRecord out;
  out.summary = in.summary();
  if (in.has_rationale()) out.rationale = in.rationale();
  if (in.has_before()) out.before = DecodeSnapshot(in.before());
  if (in.has_after()) out.after = DecodeSnapshot(in.after());
  out.recorded_at = FromUnixMillis(in.recorded_at_ms());
  return out;
}

void EncodeMetric(const gm::TargetMetric& in, pb::TargetMetric* out) {
  out->set_label(in.label);
  if (in.baseline_value) out->set_baseline_value(*in.baseline_value);
  if (in.target_value) out->set_target_value(*in.target_value);
  if (in.unit) out->set_unit(*in.unit);
  if (in.measurement_window_days) out->set_measurement_window_days(*in.measurement_window_days);
  if (in.notes) out->set_notes(*in.notes);
}

gm::TargetMetric DecodeMetric(const pb::TargetMetric& in) {
  gm::TargetMetric out;
  out.label = in.label();
  if (in.has_baseline_value()) out.baseline_value = in.baseline_value();
  if (in.has_target_value()) out.target_value = in.target_value();
  if (in.has_unit()) out.unit = in.unit();
  if (in.has_measurement_window_days()) out.measurement_window_days = in.measurement_window_days();
  if (in.has_notes()) out.notes = in.notes();
  return out;
}

void EncodeProjection(const gm::Projection& in, pb::Projection* out) {
  out->set_id(in.id);
  out->set_title(in.title);
  if (in.detail) out->set_detail(*in.detail);
  out->set_start_ms(ToUnixMillis(in.start));
  out->set_end_ms(ToUnixMillis(in.end));
  if (in.expected_metric_delta) out->set_expected_metric_delta(*in.expected_metric_delta);
  if (in.metric_unit) out->set_metric_unit(*in.metric_unit);
  if (in.confidence) out->set_confidence(*in.confidence);
  out->set_status(EnumToProto<pb::ProjectionStatus>(in.status));
}

gm::Projection DecodeProjection(const pb::Projection& in) {
  gm::Projection out;
  out.id    = in.id();
  out.title = in.title();
  if (in.has_detail()) out.detail = in.detail();
  out.start = FromUnixMillis(in.start_ms());
  out.end   = FromUnixMillis(in.end_ms());
  if (in.has_expected_metric_delta()) out.expected_metric_delta = in.expected_metric_delta();
  if (in.has_metric_unit()) out.metric_unit = in.metric_unit();
  if (in.has_confidence()) out.confidence = in.confidence();
  out.status = EnumFromProto<gm::ProjectionStatus>(in.status(), pb::ProjectionStatus_IsValid, "projection status");
  return out;
}

void EncodePhase(const gm::Phase& in, pb::Phase* out) {
  out->set_id(in.id);
  out->set_title(in.title);
  if (in.summary) out->set_summary(*in.summary);
  if (in.started_at) out->set_started_at_ms(ToUnixMillis(*in.started_at));
  if (in.completed_at) out->set_completed_at_ms(ToUnixMillis(*in.completed_at));
  out->set_status(EnumToProto<pb::PhaseStatus>(in.status));
}

gm::Phase DecodePhase(const pb::Phase& in) {
  gm::Phase out;
  out.id    = in.id();
  out.title = in.title();
  if (in.has_summary()) out.summary = in.summary();
  out.started_at   = OptionalTime(in.has_started_at_ms(), in.started_at_ms());
  out.completed_at = OptionalTime(in.has_completed_at_ms(), in.completed_at_ms());
  out.status       = EnumFromProto<gm::PhaseStatus>(in.status(), pb::PhaseStatus_IsValid, "phase status");
  return out;
}

pb::GoalDocument ToDocument(const gm::Goal& goal) {
  pb::GoalDocument doc;
  doc.set_id(goal.id);
  doc.set_created_at_ms(ToUnixMillis(goal.created_at));
  doc.set_updated_at_ms(ToUnixMillis(goal.updated_at));

  doc.set_title(goal.title);
  doc.set_body(goal.body);
  doc.set_category(goal.category);
  doc.set_priority(EnumToProto<pb::Priority>(goal.priority));
  doc.set_progress(goal.progress);
  doc.set_kind(EnumToProto<pb::GoalKind>(goal.kind));

  if (goal.parent_id) doc.set_parent_id(*goal.parent_id);
  doc.set_sort_index(goal.sort_index);

  doc.set_state(EnumToProto<pb::ActivationState>(goal.state));
  doc.set_is_locked(goal.is_locked);
  if (goal.locked_snapshot) EncodeSnapshot(*goal.locked_snapshot, doc.mutable_locked_snapshot());
  if (goal.activated_at) doc.set_activated_at_ms(ToUnixMillis(*goal.activated_at));
  if (goal.completed_at) doc.set_completed_at_ms(ToUnixMillis(*goal.completed_at));

  doc.set_has_been_broken_down(goal.has_been_broken_down);
  doc.set_is_atomic(goal.is_atomic);

  for (const auto& revision : goal.revisions) {
    EncodeRevision(revision, doc.add_revisions());
  }

  doc.set_has_sequential_steps(goal.has_sequential_steps);
  for (const auto& step : goal.sequential_steps) {
    doc.add_sequential_steps(step);
  }
  for (const auto& section : goal.tree_sections) {
    auto* out = doc.add_tree_sections();
    out->set_title(section.title);
    for (const auto index : section.step_indices) {
      out->add_step_indices(index);
    }
    out->set_is_complete(section.is_complete);
  }
  if (goal.step_of) doc.set_step_of(*goal.step_of);
  doc.set_step_status(EnumToProto<pb::StepStatus>(goal.step_status));
  doc.set_is_final_step(goal.is_final_step);
  if (goal.target_date) doc.set_target_date_ms(ToUnixMillis(*goal.target_date));

  if (goal.glyph) doc.set_glyph(*goal.glyph);
  if (goal.target_metric) EncodeMetric(*goal.target_metric, doc.mutable_target_metric());
  for (const auto& projection : goal.projections) {
    EncodeProjection(projection, doc.add_projections());
  }
  for (const auto& phase : goal.phases) {
    EncodePhase(phase, doc.add_phases());
  }
  for (const auto& link : goal.scheduled_events) {
    auto* out = doc.add_scheduled_events();
    out->set_event_id(link.event_id);
    out->set_start_ms(ToUnixMillis(link.start));
    out->set_end_ms(ToUnixMillis(link.end));
    out->set_status(EnumToProto<pb::EventLinkStatus>(link.status));
  }
  return doc;
}

gm::Goal FromDocument(const pb::GoalDocument& doc) {
  gm::Goal goal;
  goal.id         = doc.id();
  goal.created_at = FromUnixMillis(doc.created_at_ms());
  goal.updated_at = FromUnixMillis(doc.updated_at_ms());

  goal.title    = doc.title();
  goal.body     = doc.body();
  goal.category = doc.category();
  goal.priority = EnumFromProto<gm::Priority>(doc.priority(), pb::Priority_IsValid, "priority");
  goal.progress = doc.progress();
  goal.kind     = EnumFromProto<gm::GoalKind>(doc.kind(), pb::GoalKind_IsValid, "goal kind");

  if (doc.has_parent_id()) goal.parent_id = doc.parent_id();
  goal.sort_index = doc.sort_index();

  goal.state     = EnumFromProto<gm::ActivationState>(doc.state(), pb::ActivationState_IsValid, "activation state");
  goal.is_locked = doc.is_locked();
  if (doc.has_locked_snapshot()) goal.locked_snapshot = DecodeSnapshot(doc.locked_snapshot());
  goal.activated_at = OptionalTime(doc.has_activated_at_ms(), doc.activated_at_ms());
  goal.completed_at = OptionalTime(doc.has_completed_at_ms(), doc.completed_at_ms());

  goal.has_been_broken_down = doc.has_been_broken_down();
  goal.is_atomic            = doc.is_atomic();

  for (const auto& revision : doc.revisions()) {
    goal.revisions.push_back(DecodeRevision(revision));
  }

  goal.has_sequential_steps = doc.has_sequential_steps();
  goal.sequential_steps.assign(doc.sequential_steps().begin(), doc.sequential_steps().end());
  for (const auto& section : doc.tree_sections()) {
    gm::TreeSection out;
    out.title = section.title();
    out.step_indices.assign(section.step_indices().begin(), section.step_indices().end());
    out.is_complete = section.is_complete();
    goal.tree_sections.push_back(std::move(out));
  }
  if (doc.has_step_of()) goal.step_of = doc.step_of();
  goal.step_status   = EnumFromProto<gm::StepStatus>(doc.step_status(), pb::StepStatus_IsValid, "step status");
  goal.is_final_step = doc.is_final_step();
  goal.target_date   = OptionalTime(doc.has_target_date_ms(), doc.target_date_ms());

  if (doc.has_glyph()) goal.glyph = doc.glyph();
  if (doc.has_target_metric()) goal.target_metric = DecodeMetric(doc.target_metric());
  for (const auto& projection : doc.projections()) {
    goal.projections.push_back(DecodeProjection(projection));
  }
  for (const auto& phase : doc.phases()) {
    goal.phases.push_back(DecodePhase(phase));
  }
  for (const auto& link : doc.scheduled_events()) {
    goal.scheduled_events.push_back(gm::ScheduledEventLink{link.event_id(), FromUnixMillis(link.start_ms()), FromUnixMillis(link.end_ms()),
                                                           EnumFromProto<gm::EventLinkStatus>(link.status(), pb::EventLinkStatus_IsValid,
                                                                                              "event link status")});
  }
  return goal;
}

} // namespace

model::GoalRecord EncodeGoal(const gm::Goal& goal) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(ToDocument(goal), &json);
  if (!status.ok()) {
    throw std::runtime_error("Failed to encode goal " + goal.id + ": " + std::string(status.message()));
  }

  model::GoalRecord record;
  record.id            = goal.id;
  record.parent_id     = goal.parent_id.value_or("");
  record.owner_id      = goal.step_of.value_or("");
  record.sort_index    = goal.sort_index;
  record.document      = std::move(json);
  record.updated_at_ms = static_cast<std::uint64_t>(ToUnixMillis(goal.updated_at));
  return record;
}

gm::Goal DecodeGoal(const model::GoalRecord& record) {
  pb::GoalDocument                         doc;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  auto status                   = google::protobuf::util::JsonStringToMessage(record.document, &doc, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to decode goal " + record.id + ": " + std::string(status.message()));
  }
  if (doc.id() != record.id) {
    throw std::runtime_error("Goal document id mismatch: row " + record.id + " holds " + doc.id());
  }
  return FromDocument(doc);
}

model::DependencyRecord EncodeDependency(const gm::DependencyEdge& edge) {
  model::DependencyRecord record;
  record.prerequisite_id = edge.prerequisite;
  record.dependent_id    = edge.dependent;
  record.kind            = static_cast<std::int32_t>(edge.kind);
  record.note            = edge.note;
  record.created_at_ms   = static_cast<std::uint64_t>(ToUnixMillis(edge.created_at));
  return record;
}

gm::DependencyEdge DecodeDependency(const model::DependencyRecord& record) {
  if (record.kind < 0 || record.kind > static_cast<std::int32_t>(gm::DependencyKind::kFinishToFinish)) {
    throw std::runtime_error("invalid dependency kind " + std::to_string(record.kind) + " for " + record.prerequisite_id + " -> " +
                             record.dependent_id);
  }
  gm::DependencyEdge edge;
  edge.prerequisite = record.prerequisite_id;
  edge.dependent    = record.dependent_id;
  edge.kind         = static_cast<gm::DependencyKind>(record.kind);
  edge.note         = record.note;
  edge.created_at   = FromUnixMillis(static_cast<std::int64_t>(record.created_at_ms));
  return edge;
}

} // namespace goalgraph::db::codec
