#include "generation_plan_service.hpp"

#include <string>

#include "internal/plan/generation_plan.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"
#include "proto_convert.hpp"

namespace gencore::service {

using namespace gencore::v1;

namespace {

void Require(const std::string& value, const char* field) {
  if (value.empty()) {
    throw util::InvalidArgument(std::string(field) + " is required");
  }
}

} // namespace

GenerationPlanService::GenerationPlanService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

BeginRunResponse GenerationPlanService::BeginRun(const BeginRunRequest&) {
  return ObserveRpc("GenerationPlan.BeginRun", [&] {
    auto result = ctx_.generation_plan->Begin();

    BeginRunResponse resp;
    resp.set_outcome(ToProto(result.outcome));
    *resp.mutable_run() = ToProto(result.run);
    if (result.superseded) {
      resp.set_superseded(*result.superseded);
    }
    return resp;
  });
}

RecordStepResponse GenerationPlanService::RecordStep(const RecordStepRequest& req) {
  return ObserveRpc("GenerationPlan.RecordStep", [&] {
    Require(req.step_key(), "step_key");
    Require(req.status(), "status");

    gencore::plan::StepRequest step;
    step.step_key       = req.step_key();
    step.status         = req.status();
    step.files_produced = req.files_produced();
    step.duration_ms    = req.duration_ms();
    step.cached         = req.cached();

    auto result = ctx_.generation_plan->RecordStep(step);

    RecordStepResponse resp;
    resp.set_outcome(ToProto(result.outcome));
    if (result.run) {
      resp.set_run_id(*result.run);
    }
    return resp;
  });
}

CompleteRunResponse GenerationPlanService::CompleteRun(const CompleteRunRequest&) {
  return ObserveRpc("GenerationPlan.CompleteRun", [&] {
    auto result = ctx_.generation_plan->Complete();

    CompleteRunResponse resp;
    resp.set_outcome(ToProto(result.outcome));
    if (result.run) {
      *resp.mutable_run() = ToProto(*result.run);
    }
    return resp;
  });
}

RunStatusResponse GenerationPlanService::RunStatus(const RunStatusRequest& req) {
  return ObserveRpc("GenerationPlan.RunStatus", [&] {
    Require(req.run_id(), "run_id");

    RunStatusResponse resp;
    resp.set_outcome(OUTCOME_OK);
    for (const auto& step : ctx_.generation_plan->Status(req.run_id())) {
      auto* out = resp.add_steps();
      out->set_step_key(step.step_key);
      out->set_status(step.status);
      out->set_duration_ms(step.duration_ms);
      out->set_cached(step.cached);
      out->set_files_produced(step.files_produced);
    }
    return resp;
  });
}

RunSummaryResponse GenerationPlanService::RunSummary(const RunSummaryRequest& req) {
  return ObserveRpc("GenerationPlan.RunSummary", [&] {
    Require(req.run_id(), "run_id");

    auto summary = ctx_.generation_plan->Summary(req.run_id());

    RunSummaryResponse resp;
    resp.set_outcome(OUTCOME_OK);
    auto* out = resp.mutable_summary();
    out->set_total(summary.total);
    out->set_executed(summary.executed);
    out->set_cached(summary.cached);
    out->set_failed(summary.failed);
    out->set_total_duration_ms(summary.total_duration);
    out->set_files_produced(summary.files_produced);
    return resp;
  });
}

HistoryResponse GenerationPlanService::History(const HistoryRequest& req) {
  return ObserveRpc("GenerationPlan.History", [&] {
    HistoryResponse resp;
    resp.set_outcome(OUTCOME_OK);
    for (const auto& entry : ctx_.generation_plan->History(req.limit())) {
      auto* out                 = resp.add_runs();
      *out->mutable_run()       = ToProto(entry.run);
      out->set_total(entry.total);
      out->set_executed(entry.executed);
      out->set_cached(entry.cached);
      out->set_failed(entry.failed);
    }
    return resp;
  });
}

} // namespace gencore::service
