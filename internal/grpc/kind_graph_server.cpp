#include "kind_graph_server.hpp"
#include "grpc_error.hpp"

namespace gencore::grpc {

KindGraphServer::KindGraphServer(std::shared_ptr<gencore::service::KindGraphService> svc)
    : service_(std::move(svc)) {}

::grpc::Status KindGraphServer::DefineKind(::grpc::ServerContext*,
                                           const gencore::v1::DefineKindRequest* req,
                                           gencore::v1::DefineKindResponse* resp) {
  try {
    *resp = service_->DefineKind(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status KindGraphServer::Connect(::grpc::ServerContext*,
                                        const gencore::v1::ConnectRequest* req,
                                        gencore::v1::ConnectResponse* resp) {
  try {
    *resp = service_->Connect(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status KindGraphServer::Route(::grpc::ServerContext*,
                                      const gencore::v1::RouteRequest* req,
                                      gencore::v1::RouteResponse* resp) {
  try {
    *resp = service_->Route(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status KindGraphServer::Validate(::grpc::ServerContext*,
                                         const gencore::v1::ValidateRequest* req,
                                         gencore::v1::ValidateResponse* resp) {
  try {
    *resp = service_->Validate(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status KindGraphServer::Dependents(::grpc::ServerContext*,
                                           const gencore::v1::DependentsRequest* req,
                                           gencore::v1::DependentsResponse* resp) {
  try {
    *resp = service_->Dependents(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status KindGraphServer::Producers(::grpc::ServerContext*,
                                          const gencore::v1::ProducersRequest* req,
                                          gencore::v1::ProducersResponse* resp) {
  try {
    *resp = service_->Producers(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status KindGraphServer::Consumers(::grpc::ServerContext*,
                                          const gencore::v1::ConsumersRequest* req,
                                          gencore::v1::ConsumersResponse* resp) {
  try {
    *resp = service_->Consumers(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status KindGraphServer::Graph(::grpc::ServerContext*,
                                      const gencore::v1::GraphRequest* req,
                                      gencore::v1::GraphResponse* resp) {
  try {
    *resp = service_->Graph(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace gencore::grpc
