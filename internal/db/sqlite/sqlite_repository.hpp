#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace gencore::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginRead() override;

  Result InsertKind(Transaction&, const model::KindRecord&) override;
  std::optional<model::KindRecord> GetKind(Transaction&, const std::string&) override;
  std::vector<model::KindRecord> ListKinds(Transaction&) override;
  Result UpsertEdge(Transaction&, const model::EdgeRecord&) override;
  std::vector<model::EdgeRecord> ListEdges(Transaction&) override;
  std::vector<model::EdgeRecord> ListEdgesFrom(Transaction&, const std::string&) override;
  std::vector<model::EdgeRecord> ListEdgesTo(Transaction&, const std::string&) override;

  Result UpsertCacheEntry(Transaction&, const model::CacheEntryRecord&) override;
  std::optional<model::CacheEntryRecord> GetCacheEntry(Transaction&, const std::string&) override;
  std::vector<model::CacheEntryRecord> ListCacheEntries(Transaction&) override;
  std::vector<model::CacheEntryRecord> ListCacheEntriesBySource(Transaction&, const std::string&) override;
  Result SetCacheEntryStale(Transaction&, const std::string&, bool) override;

  Result InsertRun(Transaction&, const model::RunRecord&) override;
  Result UpdateRun(Transaction&, const model::RunRecord&) override;
  std::optional<model::RunRecord> GetRun(Transaction&, const std::string&) override;
  std::vector<model::RunRecord> ListRecentRuns(Transaction&, std::size_t limit) override;
  uint64_t MaxRunSequence(Transaction&) override;
  Result UpsertStep(Transaction&, const model::StepRecord&) override;
  std::vector<model::StepRecord> ListSteps(Transaction&, const std::string&) override;
  std::optional<std::string> GetActiveRun(Transaction&) override;
  Result SetActiveRun(Transaction&, const std::optional<std::string>&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

} // namespace gencore::db::sqlite
