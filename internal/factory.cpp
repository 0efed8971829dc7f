#include "factory.hpp"

#include <stdexcept>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/graph/standard_kinds.hpp"
#include "internal/observability/logging.hpp"
#if GENCORE_DB_SQLITE
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace gencore::factory {

using gencore::observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const gencore::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if GENCORE_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sql::RunMigrations(*sqlite_db, db::sql::SchemaMigrations());
    GENCORE_LOG_INFO("repository ready", {StringField("backend", "sqlite"), StringField("path", sqlite_db->Path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  GENCORE_LOG_INFO("repository ready", {StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

void BootstrapTaxonomy(graph::KindGraph& kind_graph, const gencore::runtime::config::TaxonomyConfig& taxonomy) {
  if (taxonomy.standard_kinds()) {
    graph::Bootstrap(kind_graph, graph::StandardTaxonomy());
  }

  if (taxonomy.kinds_size() == 0 && taxonomy.edges_size() == 0) {
    return;
  }

  graph::Taxonomy configured;
  for (const auto& kind : taxonomy.kinds()) {
    configured.kinds.push_back({kind.name(), kind.category()});
  }
  for (const auto& edge : taxonomy.edges()) {
    graph::EdgeSpec spec{edge.from(), edge.to(), edge.relation(), std::nullopt};
    if (!edge.transform().empty()) {
      spec.transform = edge.transform();
    }
    configured.edges.push_back(std::move(spec));
  }
  graph::Bootstrap(kind_graph, configured);
}

Components BuildComponents(const gencore::runtime::config::RuntimeConfig& config) {
  Components components;
  components.repository      = BuildRepository(config);
  components.kind_graph      = std::make_shared<graph::KindGraph>(components.repository);
  components.build_cache     = std::make_shared<cache::BuildCache>(components.repository);
  components.generation_plan = std::make_shared<plan::GenerationPlan>(components.repository);

  BootstrapTaxonomy(*components.kind_graph, config.taxonomy());
  return components;
}

} // namespace gencore::factory
