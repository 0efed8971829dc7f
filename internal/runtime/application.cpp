#include "application.hpp"

#include "internal/grpc/build_cache_server.hpp"
#include "internal/grpc/generation_plan_server.hpp"
#include "internal/grpc/kind_graph_server.hpp"
#include "internal/service/build_cache_service.hpp"
#include "internal/service/generation_plan_service.hpp"
#include "internal/service/kind_graph_service.hpp"
#include "internal/service/service_context.hpp"

namespace gencore::runtime {

Application BuildApplication(const gencore::runtime::config::RuntimeConfig& config) {
  Application app;
  app.components = factory::BuildComponents(config);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.kind_graph      = app.components.kind_graph;
  ctx.build_cache     = app.components.build_cache;
  ctx.generation_plan = app.components.generation_plan;
  ctx.repository      = app.components.repository;

  auto kind_graph_service      = std::make_shared<service::KindGraphService>(ctx);
  auto build_cache_service     = std::make_shared<service::BuildCacheService>(ctx);
  auto generation_plan_service = std::make_shared<service::GenerationPlanService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<gencore::grpc::KindGraphServer>(kind_graph_service));
  app.grpc_services.push_back(std::make_unique<gencore::grpc::BuildCacheServer>(build_cache_service));
  app.grpc_services.push_back(std::make_unique<gencore::grpc::GenerationPlanServer>(generation_plan_service));

  return app;
}

} // namespace gencore::runtime
