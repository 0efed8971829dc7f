#pragma once

#include <memory>

namespace gencore::graph { class KindGraph; }
namespace gencore::cache { class BuildCache; }
namespace gencore::plan { class GenerationPlan; }
namespace gencore::db { class Repository; }

namespace gencore::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<gencore::graph::KindGraph> kind_graph;
  std::shared_ptr<gencore::cache::BuildCache> build_cache;
  std::shared_ptr<gencore::plan::GenerationPlan> generation_plan;
  std::shared_ptr<gencore::db::Repository> repository;
};

} // namespace gencore::service
