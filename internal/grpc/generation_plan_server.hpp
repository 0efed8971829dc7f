#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "api/gencore/v1.hpp"
#include "internal/service/generation_plan_service.hpp"

namespace gencore::grpc {

class GenerationPlanServer final : public gencore::v1::GenerationPlanService::Service {
public:
  explicit GenerationPlanServer(std::shared_ptr<gencore::service::GenerationPlanService> svc);

  ::grpc::Status BeginRun(::grpc::ServerContext*,
                          const gencore::v1::BeginRunRequest*,
                          gencore::v1::BeginRunResponse*) override;

  ::grpc::Status RecordStep(::grpc::ServerContext*,
                            const gencore::v1::RecordStepRequest*,
                            gencore::v1::RecordStepResponse*) override;

  ::grpc::Status CompleteRun(::grpc::ServerContext*,
                             const gencore::v1::CompleteRunRequest*,
                             gencore::v1::CompleteRunResponse*) override;

  ::grpc::Status RunStatus(::grpc::ServerContext*,
                           const gencore::v1::RunStatusRequest*,
                           gencore::v1::RunStatusResponse*) override;

  ::grpc::Status RunSummary(::grpc::ServerContext*,
                            const gencore::v1::RunSummaryRequest*,
                            gencore::v1::RunSummaryResponse*) override;

  ::grpc::Status History(::grpc::ServerContext*,
                         const gencore::v1::HistoryRequest*,
                         gencore::v1::HistoryResponse*) override;

private:
  std::shared_ptr<gencore::service::GenerationPlanService> service_;
};

} // namespace gencore::grpc
