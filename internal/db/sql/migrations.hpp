#pragma once

#include <string>
#include <vector>

namespace gencore::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL().
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

/*
  Ordered, idempotent DDL for the kind graph, build cache and generation
  plan relations. Safe to run on every start.
*/
const std::vector<std::string>& SchemaMigrations();

/*
  Runs migrations in order.
*/
void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

} // namespace gencore::db::sql
