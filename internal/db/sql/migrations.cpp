#include "migrations.hpp"

#include <stdexcept>

namespace gencore::db::sql {

const std::vector<std::string>& SchemaMigrations() {
  static const std::vector<std::string> kSchema = {
      // kind graph
      "CREATE TABLE IF NOT EXISTS kinds (name TEXT PRIMARY KEY, category TEXT NOT NULL, created_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS kind_edges (from_kind TEXT NOT NULL REFERENCES kinds(name), to_kind TEXT NOT NULL REFERENCES kinds(name), "
      "relation TEXT NOT NULL, transform TEXT, created_at_ms INTEGER NOT NULL, PRIMARY KEY (from_kind, to_kind, relation));",
      "CREATE INDEX IF NOT EXISTS kind_edges_to_idx ON kind_edges(to_kind);",

      // build cache
      "CREATE TABLE IF NOT EXISTS build_cache_entries (step_key TEXT PRIMARY KEY, input_hash TEXT NOT NULL, output_hash TEXT NOT NULL, "
      "output_ref TEXT, source_locator TEXT, deterministic INTEGER NOT NULL, stale INTEGER NOT NULL DEFAULT 0, last_run_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS build_cache_entries_source_idx ON build_cache_entries(source_locator);",

      // generation plan
      "CREATE TABLE IF NOT EXISTS generation_runs (run_id TEXT PRIMARY KEY, sequence INTEGER NOT NULL UNIQUE, started_at_ms INTEGER NOT NULL, "
      "completed_at_ms INTEGER, status INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS generation_steps (run_id TEXT NOT NULL REFERENCES generation_runs(run_id), step_key TEXT NOT NULL, "
      "status TEXT NOT NULL, files_produced INTEGER NOT NULL, duration_ms INTEGER NOT NULL, cached INTEGER NOT NULL, "
      "recorded_at_ms INTEGER NOT NULL, PRIMARY KEY (run_id, step_key));",
      "CREATE TABLE IF NOT EXISTS generation_active_run (slot INTEGER PRIMARY KEY CHECK (slot = 0), run_id TEXT);",
  };
  return kSchema;
}

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (size_t i = 0; i < ordered_sql.size(); ++i) {
    try {
      executor.ExecuteSQL(ordered_sql[i]);
    } catch (const std::exception& e) {
      throw std::runtime_error("migration " + std::to_string(i) + " failed: " + e.what());
    }
  }
}

} // namespace gencore::db::sql
