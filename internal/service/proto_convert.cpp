#include "proto_convert.hpp"

#include "internal/util/time.hpp"

namespace gencore::service {

using gencore::core::Outcome;

gencore::v1::Outcome ToProto(Outcome outcome) {
  switch (outcome) {
    case Outcome::Ok:
      return gencore::v1::OUTCOME_OK;
    case Outcome::Exists:
      return gencore::v1::OUTCOME_EXISTS;
    case Outcome::Invalid:
      return gencore::v1::OUTCOME_INVALID;
    case Outcome::Unreachable:
      return gencore::v1::OUTCOME_UNREACHABLE;
    case Outcome::NotFound:
      return gencore::v1::OUTCOME_NOT_FOUND;
    case Outcome::Changed:
      return gencore::v1::OUTCOME_CHANGED;
    case Outcome::Unchanged:
      return gencore::v1::OUTCOME_UNCHANGED;
  }
  return gencore::v1::OUTCOME_UNSPECIFIED;
}

gencore::v1::RunState ToProto(gencore::db::model::RunStatus status) {
  switch (status) {
    case gencore::db::model::RunStatus::Running:
      return gencore::v1::RUN_STATE_RUNNING;
    case gencore::db::model::RunStatus::Completed:
      return gencore::v1::RUN_STATE_COMPLETED;
    case gencore::db::model::RunStatus::Superseded:
      return gencore::v1::RUN_STATE_SUPERSEDED;
  }
  return gencore::v1::RUN_STATE_UNSPECIFIED;
}

gencore::v1::Kind ToProto(const gencore::db::model::KindRecord& record) {
  gencore::v1::Kind kind;
  kind.set_name(record.name);
  kind.set_category(record.category);
  *kind.mutable_created_at() = util::MillisToProto(record.created_at_ms);
  return kind;
}

gencore::v1::Edge ToProto(const gencore::db::model::EdgeRecord& record) {
  gencore::v1::Edge edge;
  edge.set_from_kind(record.from_kind);
  edge.set_to_kind(record.to_kind);
  edge.set_relation(record.relation);
  if (record.transform) {
    edge.set_transform(*record.transform);
  }
  *edge.mutable_created_at() = util::MillisToProto(record.created_at_ms);
  return edge;
}

gencore::v1::CacheEntry ToProto(const gencore::db::model::CacheEntryRecord& record) {
  gencore::v1::CacheEntry entry;
  entry.set_step_key(record.step_key);
  entry.set_input_hash(record.input_hash);
  entry.set_output_hash(record.output_hash);
  if (record.output_ref) {
    entry.set_output_ref(*record.output_ref);
  }
  if (record.source_locator) {
    entry.set_source_locator(*record.source_locator);
  }
  entry.set_deterministic(record.deterministic);
  entry.set_stale(record.stale);
  *entry.mutable_last_run() = util::MillisToProto(record.last_run_ms);
  return entry;
}

gencore::v1::Run ToProto(const gencore::db::model::RunRecord& record) {
  gencore::v1::Run run;
  run.set_run_id(record.run_id);
  run.set_sequence(record.sequence);
  *run.mutable_started_at() = util::MillisToProto(record.started_at_ms);
  if (record.completed_at_ms) {
    *run.mutable_completed_at() = util::MillisToProto(*record.completed_at_ms);
  }
  run.set_status(ToProto(record.status));
  return run;
}

} // namespace gencore::service
