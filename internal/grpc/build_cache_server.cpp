#include "build_cache_server.hpp"
#include "grpc_error.hpp"

namespace gencore::grpc {

BuildCacheServer::BuildCacheServer(std::shared_ptr<gencore::service::BuildCacheService> svc)
    : service_(std::move(svc)) {}

::grpc::Status BuildCacheServer::Check(::grpc::ServerContext*,
                                       const gencore::v1::CheckRequest* req,
                                       gencore::v1::CheckResponse* resp) {
  try {
    *resp = service_->Check(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BuildCacheServer::Record(::grpc::ServerContext*,
                                        const gencore::v1::RecordRequest* req,
                                        gencore::v1::RecordResponse* resp) {
  try {
    *resp = service_->Record(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BuildCacheServer::Invalidate(::grpc::ServerContext*,
                                            const gencore::v1::InvalidateRequest* req,
                                            gencore::v1::InvalidateResponse* resp) {
  try {
    *resp = service_->Invalidate(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BuildCacheServer::InvalidateBySource(::grpc::ServerContext*,
                                                    const gencore::v1::InvalidateBySourceRequest* req,
                                                    gencore::v1::InvalidateBySourceResponse* resp) {
  try {
    *resp = service_->InvalidateBySource(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BuildCacheServer::InvalidateByKind(::grpc::ServerContext*,
                                                  const gencore::v1::InvalidateByKindRequest* req,
                                                  gencore::v1::InvalidateByKindResponse* resp) {
  try {
    *resp = service_->InvalidateByKind(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BuildCacheServer::InvalidateAll(::grpc::ServerContext*,
                                               const gencore::v1::InvalidateAllRequest* req,
                                               gencore::v1::InvalidateAllResponse* resp) {
  try {
    *resp = service_->InvalidateAll(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BuildCacheServer::Status(::grpc::ServerContext*,
                                        const gencore::v1::CacheStatusRequest* req,
                                        gencore::v1::CacheStatusResponse* resp) {
  try {
    *resp = service_->Status(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BuildCacheServer::StaleSteps(::grpc::ServerContext*,
                                            const gencore::v1::StaleStepsRequest* req,
                                            gencore::v1::StaleStepsResponse* resp) {
  try {
    *resp = service_->StaleSteps(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace gencore::grpc
