#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/plan/generation_plan.hpp"

namespace {

using gencore::core::Outcome;
using gencore::db::model::RunStatus;
using gencore::plan::GenerationPlan;
using gencore::plan::StepRequest;

struct Fixture {
  std::shared_ptr<gencore::db::memory::MemoryRepository> repository = std::make_shared<gencore::db::memory::MemoryRepository>();
  GenerationPlan                                         plan{repository};
};

StepRequest MakeStep(std::string key, std::string status, uint64_t files, uint64_t duration_ms) {
  StepRequest step;
  step.step_key       = std::move(key);
  step.cached         = status == "cached";
  step.status         = std::move(status);
  step.files_produced = files;
  step.duration_ms    = duration_ms;
  return step;
}

void TestRecordStepWithoutRunIsDropped() {
  Fixture f;

  auto result = f.plan.RecordStep(MakeStep("fw:RustGen:todo", "done", 1, 5));
  assert(result.outcome == Outcome::Ok);
  assert(!result.run.has_value());
  assert(!f.plan.ActiveRun().has_value());
  assert(f.plan.History(0).empty());
}

void TestRunLifecycleAndSummary() {
  Fixture f;

  auto begun = f.plan.Begin();
  assert(begun.outcome == Outcome::Ok);
  assert(!begun.superseded.has_value());
  assert(begun.run.run_id.rfind("gen-run-", 0) == 0);
  assert(begun.run.status == RunStatus::Running);
  assert(f.plan.ActiveRun() == std::optional<std::string>(begun.run.run_id));

  f.plan.RecordStep(MakeStep("fw:TypeScriptGen:todo", "done", 3, 10));
  f.plan.RecordStep(MakeStep("fw:RustGen:todo", "cached", 0, 1));
  f.plan.RecordStep(MakeStep("fw:SwiftGen:todo", "failed", 0, 4));
  auto last = f.plan.RecordStep(MakeStep("fw:SolidityGen:todo", "skipped", 0, 0));
  assert(last.run == std::optional<std::string>(begun.run.run_id));

  auto steps = f.plan.Status(begun.run.run_id);
  assert(steps.size() == 4);
  assert(steps[0].step_key == "fw:TypeScriptGen:todo");
  assert(steps[0].files_produced == 3);
  assert(steps[1].cached);
  assert(steps[3].status == "skipped");

  auto summary = f.plan.Summary(begun.run.run_id);
  assert(summary.total == 4);
  assert(summary.executed == 1);
  assert(summary.cached == 1);
  assert(summary.failed == 1);
  assert(summary.executed + summary.cached + summary.failed <= summary.total);
  assert(summary.total_duration == 15);
  assert(summary.files_produced == 3);

  auto completed = f.plan.Complete();
  assert(completed.outcome == Outcome::Ok);
  assert(completed.run.has_value());
  assert(completed.run->run_id == begun.run.run_id);
  assert(completed.run->status == RunStatus::Completed);
  assert(completed.run->completed_at_ms.has_value());
  assert(!f.plan.ActiveRun().has_value());

  // steps after completion have nowhere to go
  assert(!f.plan.RecordStep(MakeStep("fw:Late:todo", "done", 1, 1)).run.has_value());
  assert(f.plan.Summary(begun.run.run_id).total == 4);
}

void TestRecordingSameStepTwiceReplacesIt() {
  Fixture f;
  auto    run = f.plan.Begin().run.run_id;

  f.plan.RecordStep(MakeStep("fw:RustGen:todo", "failed", 0, 2));
  f.plan.RecordStep(MakeStep("fw:RustGen:todo", "done", 2, 3));

  auto summary = f.plan.Summary(run);
  assert(summary.total == 1);
  assert(summary.executed == 1);
  assert(summary.failed == 0);
}

void TestBeginSupersedesActiveRun() {
  Fixture f;

  auto first = f.plan.Begin();
  f.plan.RecordStep(MakeStep("fw:RustGen:todo", "done", 1, 1));

  auto second = f.plan.Begin();
  assert(second.superseded == std::optional<std::string>(first.run.run_id));
  assert(second.run.run_id != first.run.run_id);
  assert(second.run.sequence > first.run.sequence);
  assert(f.plan.ActiveRun() == std::optional<std::string>(second.run.run_id));

  auto history = f.plan.History(0);
  assert(history.size() == 2);
  assert(history[0].run.run_id == second.run.run_id);
  assert(history[1].run.run_id == first.run.run_id);
  assert(history[1].run.status == RunStatus::Superseded);
  assert(history[1].run.completed_at_ms.has_value());
  assert(history[1].total == 1);

  f.plan.RecordStep(MakeStep("fw:SwiftGen:todo", "done", 1, 1));
  assert(f.plan.Summary(first.run.run_id).total == 1);
  assert(f.plan.Summary(second.run.run_id).total == 1);
}

void TestHistoryOrderingAndLimit() {
  Fixture f;

  std::set<std::string> ids;
  std::string           newest;
  for (int i = 0; i < 12; ++i) {
    newest = f.plan.Begin().run.run_id;
    f.plan.Complete();
    ids.insert(newest);
  }
  assert(ids.size() == 12);

  auto history = f.plan.History(0);
  assert(history.size() == GenerationPlan::kDefaultHistoryLimit);
  assert(history[0].run.run_id == newest);
  for (std::size_t i = 1; i < history.size(); ++i) {
    assert(history[i - 1].run.sequence > history[i].run.sequence);
    assert(history[i].run.status == RunStatus::Completed);
  }

  assert(f.plan.History(3).size() == 3);
  assert(f.plan.History(50).size() == 12);
}

void TestCompleteWithoutRun() {
  Fixture f;
  auto    result = f.plan.Complete();
  assert(result.outcome == Outcome::Ok);
  assert(!result.run.has_value());
}

void TestUnknownRunReportsNothing() {
  Fixture f;
  assert(f.plan.Status("gen-run-0-0").empty());
  auto summary = f.plan.Summary("gen-run-0-0");
  assert(summary.total == 0);
  assert(summary.total_duration == 0);
}

void TestRunStatusNames() {
  assert(gencore::plan::ToString(RunStatus::Running) == "running");
  assert(gencore::plan::ToString(RunStatus::Completed) == "completed");
  assert(gencore::plan::ToString(RunStatus::Superseded) == "superseded");
}

} // namespace

int main() {
  TestRecordStepWithoutRunIsDropped();
  TestRunLifecycleAndSummary();
  TestRecordingSameStepTwiceReplacesIt();
  TestBeginSupersedesActiveRun();
  TestHistoryOrderingAndLimit();
  TestCompleteWithoutRun();
  TestUnknownRunReportsNothing();
  TestRunStatusNames();

  std::cout << "gencore_unit_generation_plan: pass\n";
  return 0;
}
