#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/cache/build_cache.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/graph/kind_graph.hpp"
#include "internal/plan/generation_plan.hpp"

namespace gencore::factory {

/*
  Components

  Long-lived core objects sharing one repository. Everything here lives
  for the lifetime of the process.
*/
struct Components {
  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<graph::KindGraph>      kind_graph;
  std::shared_ptr<cache::BuildCache>     build_cache;
  std::shared_ptr<plan::GenerationPlan>  generation_plan;
};

/*
  Picks the backend named in config.database (memory when unset) and
  installs the schema where the backend needs one.

  This is the only place allowed to know concrete DB types.
*/
std::shared_ptr<db::Repository> BuildRepository(const gencore::runtime::config::RuntimeConfig& config);

// Defines the configured taxonomy: the standard kinds first when enabled,
// then config.taxonomy kinds and edges.
void BootstrapTaxonomy(graph::KindGraph& kind_graph, const gencore::runtime::config::TaxonomyConfig& taxonomy);

Components BuildComponents(const gencore::runtime::config::RuntimeConfig& config);

} // namespace gencore::factory
