#include "generation_plan_server.hpp"
#include "grpc_error.hpp"

namespace gencore::grpc {

GenerationPlanServer::GenerationPlanServer(std::shared_ptr<gencore::service::GenerationPlanService> svc)
    : service_(std::move(svc)) {}

::grpc::Status GenerationPlanServer::BeginRun(::grpc::ServerContext*,
                                              const gencore::v1::BeginRunRequest* req,
                                              gencore::v1::BeginRunResponse* resp) {
  try {
    *resp = service_->BeginRun(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status GenerationPlanServer::RecordStep(::grpc::ServerContext*,
                                                const gencore::v1::RecordStepRequest* req,
                                                gencore::v1::RecordStepResponse* resp) {
  try {
    *resp = service_->RecordStep(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status GenerationPlanServer::CompleteRun(::grpc::ServerContext*,
                                                 const gencore::v1::CompleteRunRequest* req,
                                                 gencore::v1::CompleteRunResponse* resp) {
  try {
    *resp = service_->CompleteRun(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status GenerationPlanServer::RunStatus(::grpc::ServerContext*,
                                               const gencore::v1::RunStatusRequest* req,
                                               gencore::v1::RunStatusResponse* resp) {
  try {
    *resp = service_->RunStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status GenerationPlanServer::RunSummary(::grpc::ServerContext*,
                                                const gencore::v1::RunSummaryRequest* req,
                                                gencore::v1::RunSummaryResponse* resp) {
  try {
    *resp = service_->RunSummary(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status GenerationPlanServer::History(::grpc::ServerContext*,
                                             const gencore::v1::HistoryRequest* req,
                                             gencore::v1::HistoryResponse* resp) {
  try {
    *resp = service_->History(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace gencore::grpc
