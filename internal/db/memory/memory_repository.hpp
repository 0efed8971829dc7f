#pragma once

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace gencore::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  // Vectors keep insertion order; the maps index into them.
  struct KindTable {
    std::vector<model::KindRecord>          rows;
    std::unordered_map<std::string, size_t> index;
  };
  struct EdgeTable {
    std::vector<model::EdgeRecord> rows;
  };
  struct CacheTable {
    std::vector<model::CacheEntryRecord>    rows;
    std::unordered_map<std::string, size_t> index;
  };
  struct RunTable {
    std::vector<model::RunRecord>           rows;
    std::unordered_map<std::string, size_t> index;
  };
  struct StepTable {
    std::unordered_map<std::string, std::shared_ptr<const std::vector<model::StepRecord>>> by_run;
  };

  // Committed relations are immutable and shared between snapshots. A
  // writer clones a relation the first time it touches it.
  struct State {
    std::shared_ptr<const KindTable>  kinds;
    std::shared_ptr<const EdgeTable>  edges;
    std::shared_ptr<const CacheTable> cache;
    std::shared_ptr<const RunTable>   runs;
    std::shared_ptr<const StepTable>  steps;
    std::optional<std::string>        active_run;
  };

  // write_mutex_ serializes writers for their whole lifetime. state_mutex_
  // only guards the committed_ pointers while they are copied or swapped.
  std::mutex                write_mutex_;
  mutable std::shared_mutex state_mutex_;
  State                     committed_;
};

} // namespace gencore::db::memory
