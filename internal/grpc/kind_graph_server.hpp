#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "api/gencore/v1.hpp"
#include "internal/service/kind_graph_service.hpp"

namespace gencore::grpc {

class KindGraphServer final : public gencore::v1::KindGraphService::Service {
public:
  explicit KindGraphServer(std::shared_ptr<gencore::service::KindGraphService> svc);

  ::grpc::Status DefineKind(::grpc::ServerContext*,
                            const gencore::v1::DefineKindRequest*,
                            gencore::v1::DefineKindResponse*) override;

  ::grpc::Status Connect(::grpc::ServerContext*,
                         const gencore::v1::ConnectRequest*,
                         gencore::v1::ConnectResponse*) override;

  ::grpc::Status Route(::grpc::ServerContext*,
                       const gencore::v1::RouteRequest*,
                       gencore::v1::RouteResponse*) override;

  ::grpc::Status Validate(::grpc::ServerContext*,
                          const gencore::v1::ValidateRequest*,
                          gencore::v1::ValidateResponse*) override;

  ::grpc::Status Dependents(::grpc::ServerContext*,
                            const gencore::v1::DependentsRequest*,
                            gencore::v1::DependentsResponse*) override;

  ::grpc::Status Producers(::grpc::ServerContext*,
                           const gencore::v1::ProducersRequest*,
                           gencore::v1::ProducersResponse*) override;

  ::grpc::Status Consumers(::grpc::ServerContext*,
                           const gencore::v1::ConsumersRequest*,
                           gencore::v1::ConsumersResponse*) override;

  ::grpc::Status Graph(::grpc::ServerContext*,
                       const gencore::v1::GraphRequest*,
                       gencore::v1::GraphResponse*) override;

private:
  std::shared_ptr<gencore::service::KindGraphService> service_;
};

} // namespace gencore::grpc
