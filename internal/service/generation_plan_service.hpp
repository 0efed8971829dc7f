#pragma once

#include "gencore/v1/generation_plan_service.pb.h"
#include "service_context.hpp"

namespace gencore::service {

class GenerationPlanService {
public:
  explicit GenerationPlanService(ServiceContext ctx);

  gencore::v1::BeginRunResponse BeginRun(const gencore::v1::BeginRunRequest& req);

  gencore::v1::RecordStepResponse RecordStep(const gencore::v1::RecordStepRequest& req);

  gencore::v1::CompleteRunResponse CompleteRun(const gencore::v1::CompleteRunRequest& req);

  gencore::v1::RunStatusResponse RunStatus(const gencore::v1::RunStatusRequest& req);

  gencore::v1::RunSummaryResponse RunSummary(const gencore::v1::RunSummaryRequest& req);

  gencore::v1::HistoryResponse History(const gencore::v1::HistoryRequest& req);

private:
  ServiceContext ctx_;
};

} // namespace gencore::service
