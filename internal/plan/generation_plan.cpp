#include "generation_plan.hpp"

#include "internal/core/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace gencore::plan {

using gencore::core::ThrowIfDbError;
using gencore::observability::IntField;
using gencore::observability::StringField;

namespace {

std::string MakeRunId(uint64_t started_at_ms, uint64_t sequence) {
  return "gen-run-" + std::to_string(started_at_ms) + "-" + std::to_string(sequence);
}

template <typename Counts>
void Tally(Counts& counts, const db::model::StepRecord& step) {
  ++counts.total;
  if (step.status == kStepDone) {
    ++counts.executed;
  } else if (step.status == kStepCached) {
    ++counts.cached;
  } else if (step.status == kStepFailed) {
    ++counts.failed;
  }
}

} // namespace

std::string_view ToString(db::model::RunStatus status) {
  switch (status) {
    case db::model::RunStatus::Running:
      return "running";
    case db::model::RunStatus::Completed:
      return "completed";
    case db::model::RunStatus::Superseded:
      return "superseded";
  }
  return "unknown";
}

GenerationPlan::GenerationPlan(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

BeginResult GenerationPlan::Begin() {
  auto tx  = repository_->Begin();
  auto now = util::NowMillis();

  BeginResult result;

  if (auto active = repository_->GetActiveRun(*tx)) {
    auto previous = repository_->GetRun(*tx, *active);
    if (!previous) {
      throw util::InvalidState("active run " + *active + " has no run record");
    }
    previous->status          = db::model::RunStatus::Superseded;
    previous->completed_at_ms = now;
    ThrowIfDbError(repository_->UpdateRun(*tx, *previous), "supersede run " + *active);
    result.superseded = *active;
  }

  db::model::RunRecord run;
  run.sequence      = repository_->MaxRunSequence(*tx) + 1;
  run.started_at_ms = now;
  run.run_id        = MakeRunId(now, run.sequence);
  run.status        = db::model::RunStatus::Running;

  ThrowIfDbError(repository_->InsertRun(*tx, run), "begin run " + run.run_id);
  ThrowIfDbError(repository_->SetActiveRun(*tx, run.run_id), "activate run " + run.run_id);
  tx->Commit();

  if (result.superseded) {
    GENCORE_LOG_WARN("run superseded", {StringField("run", *result.superseded), StringField("by", run.run_id)});
  }
  GENCORE_LOG_INFO("run begun", {StringField("run", run.run_id), IntField("sequence", static_cast<int64_t>(run.sequence))});

  result.run = std::move(run);
  return result;
}

RecordStepResult GenerationPlan::RecordStep(const StepRequest& step) {
  auto tx     = repository_->Begin();
  auto active = repository_->GetActiveRun(*tx);
  if (!active) {
    return {};
  }

  db::model::StepRecord record;
  record.run_id         = *active;
  record.step_key       = step.step_key;
  record.status         = step.status;
  record.files_produced = step.files_produced;
  record.duration_ms    = step.duration_ms;
  record.cached         = step.cached;
  record.recorded_at_ms = util::NowMillis();

  ThrowIfDbError(repository_->UpsertStep(*tx, record), "record step " + step.step_key);
  tx->Commit();

  return {Outcome::Ok, *active};
}

CompleteResult GenerationPlan::Complete() {
  auto tx     = repository_->Begin();
  auto active = repository_->GetActiveRun(*tx);
  if (!active) {
    return {};
  }

  auto run = repository_->GetRun(*tx, *active);
  if (!run) {
    throw util::InvalidState("active run " + *active + " has no run record");
  }
  run->status          = db::model::RunStatus::Completed;
  run->completed_at_ms = util::NowMillis();

  ThrowIfDbError(repository_->UpdateRun(*tx, *run), "complete run " + *active);
  ThrowIfDbError(repository_->SetActiveRun(*tx, std::nullopt), "clear active run");
  tx->Commit();

  GENCORE_LOG_INFO("run completed", {StringField("run", run->run_id)});
  return {Outcome::Ok, std::move(run)};
}

std::vector<StepStatus> GenerationPlan::Status(const std::string& run_id) {
  auto tx = repository_->BeginRead();

  std::vector<StepStatus> steps;
  for (auto& step : repository_->ListSteps(*tx, run_id)) {
    steps.push_back({std::move(step.step_key), std::move(step.status), step.duration_ms, step.cached, step.files_produced});
  }
  return steps;
}

RunSummary GenerationPlan::Summary(const std::string& run_id) {
  auto tx = repository_->BeginRead();

  RunSummary summary;
  for (const auto& step : repository_->ListSteps(*tx, run_id)) {
    Tally(summary, step);
    summary.total_duration += step.duration_ms;
    summary.files_produced += step.files_produced;
  }
  return summary;
}

std::vector<HistoryEntry> GenerationPlan::History(std::size_t limit) {
  if (limit == 0) limit = kDefaultHistoryLimit;

  auto tx = repository_->BeginRead();

  std::vector<HistoryEntry> history;
  for (auto& run : repository_->ListRecentRuns(*tx, limit)) {
    HistoryEntry entry;
    for (const auto& step : repository_->ListSteps(*tx, run.run_id)) {
      Tally(entry, step);
    }
    entry.run = std::move(run);
    history.push_back(std::move(entry));
  }
  return history;
}

std::optional<std::string> GenerationPlan::ActiveRun() {
  auto tx = repository_->BeginRead();
  return repository_->GetActiveRun(*tx);
}

} // namespace gencore::plan
