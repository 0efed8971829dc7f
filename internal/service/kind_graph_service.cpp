#include "kind_graph_service.hpp"

#include <optional>
#include <string>

#include "internal/graph/kind_graph.hpp"
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

template <typename Response>
void FillTransformRefs(const std::vector<gencore::graph::TransformRef>& refs, Response& resp,
                       TransformRef* (Response::*add)()) {
  for (const auto& ref : refs) {
    auto* out = (resp.*add)();
    out->set_kind(ref.kind);
    if (ref.transform) {
      out->set_transform(*ref.transform);
    }
  }
}

} // namespace

KindGraphService::KindGraphService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

DefineKindResponse KindGraphService::DefineKind(const DefineKindRequest& req) {
  return ObserveRpc("KindGraph.DefineKind", [&] {
    auto result = ctx_.kind_graph->Define(req.name(), req.category());

    DefineKindResponse resp;
    resp.set_outcome(ToProto(result.outcome));
    resp.set_kind(result.kind);
    resp.set_message(result.message);
    return resp;
  });
}

ConnectResponse KindGraphService::Connect(const ConnectRequest& req) {
  return ObserveRpc("KindGraph.Connect", [&] {
    Require(req.from_kind(), "from_kind");
    Require(req.to_kind(), "to_kind");
    Require(req.relation(), "relation");

    std::optional<std::string> transform;
    if (req.has_transform()) {
      transform = req.transform();
    }
    auto result = ctx_.kind_graph->Connect(req.from_kind(), req.to_kind(), req.relation(), transform);

    ConnectResponse resp;
    resp.set_outcome(ToProto(result.outcome));
    resp.set_message(result.message);
    return resp;
  });
}

RouteResponse KindGraphService::Route(const RouteRequest& req) {
  return ObserveRpc("KindGraph.Route", [&] {
    Require(req.from_kind(), "from_kind");
    Require(req.to_kind(), "to_kind");

    auto result = ctx_.kind_graph->Route(req.from_kind(), req.to_kind());

    RouteResponse resp;
    resp.set_outcome(ToProto(result.outcome));
    resp.set_message(result.message);
    for (const auto& hop : result.path) {
      auto* out = resp.add_path();
      out->set_kind(hop.kind);
      out->set_relation(hop.relation);
      if (hop.transform) {
        out->set_transform(*hop.transform);
      }
    }
    return resp;
  });
}

ValidateResponse KindGraphService::Validate(const ValidateRequest& req) {
  return ObserveRpc("KindGraph.Validate", [&] {
    Require(req.from_kind(), "from_kind");
    Require(req.to_kind(), "to_kind");

    auto result = ctx_.kind_graph->Validate(req.from_kind(), req.to_kind());

    ValidateResponse resp;
    resp.set_outcome(ToProto(result.outcome));
    resp.set_message(result.message);
    return resp;
  });
}

DependentsResponse KindGraphService::Dependents(const DependentsRequest& req) {
  return ObserveRpc("KindGraph.Dependents", [&] {
    Require(req.kind(), "kind");

    auto result = ctx_.kind_graph->Dependents(req.kind());

    DependentsResponse resp;
    resp.set_outcome(ToProto(result.outcome));
    for (const auto& kind : result.downstream) {
      resp.add_downstream(kind);
    }
    return resp;
  });
}

ProducersResponse KindGraphService::Producers(const ProducersRequest& req) {
  return ObserveRpc("KindGraph.Producers", [&] {
    Require(req.kind(), "kind");

    ProducersResponse resp;
    resp.set_outcome(OUTCOME_OK);
    FillTransformRefs(ctx_.kind_graph->Producers(req.kind()), resp, &ProducersResponse::add_producers);
    return resp;
  });
}

ConsumersResponse KindGraphService::Consumers(const ConsumersRequest& req) {
  return ObserveRpc("KindGraph.Consumers", [&] {
    Require(req.kind(), "kind");

    ConsumersResponse resp;
    resp.set_outcome(OUTCOME_OK);
    FillTransformRefs(ctx_.kind_graph->Consumers(req.kind()), resp, &ConsumersResponse::add_consumers);
    return resp;
  });
}

GraphResponse KindGraphService::Graph(const GraphRequest&) {
  return ObserveRpc("KindGraph.Graph", [&] {
    auto dump = ctx_.kind_graph->Graph();

    GraphResponse resp;
    resp.set_outcome(OUTCOME_OK);
    for (const auto& kind : dump.kinds) {
      *resp.add_kinds() = ToProto(kind);
    }
    for (const auto& edge : dump.edges) {
      *resp.add_edges() = ToProto(edge);
    }
    return resp;
  });
}

} // namespace gencore::service
