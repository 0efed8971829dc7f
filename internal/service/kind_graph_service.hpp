#pragma once

#include "gencore/v1/kind_graph_service.pb.h"
#include "service_context.hpp"

namespace gencore::service {

class KindGraphService {
public:
  explicit KindGraphService(ServiceContext ctx);

  gencore::v1::DefineKindResponse DefineKind(const gencore::v1::DefineKindRequest& req);

  gencore::v1::ConnectResponse Connect(const gencore::v1::ConnectRequest& req);

  gencore::v1::RouteResponse Route(const gencore::v1::RouteRequest& req);

  gencore::v1::ValidateResponse Validate(const gencore::v1::ValidateRequest& req);

  gencore::v1::DependentsResponse Dependents(const gencore::v1::DependentsRequest& req);

  gencore::v1::ProducersResponse Producers(const gencore::v1::ProducersRequest& req);

  gencore::v1::ConsumersResponse Consumers(const gencore::v1::ConsumersRequest& req);

  gencore::v1::GraphResponse Graph(const gencore::v1::GraphRequest& req);

private:
  ServiceContext ctx_;
};

} // namespace gencore::service
