#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/cache_entry_record.hpp"
#include "internal/db/model/edge_record.hpp"
#include "internal/db/model/kind_record.hpp"
#include "internal/db/model/run_record.hpp"
#include "internal/db/model/step_record.hpp"

namespace gencore::db {

/*
  Repository abstraction.

  This is the storage collaborator of the kind graph, the build cache and
  the generation plan. Each relation is owned by exactly one of them.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - Single-key writes are atomic; a transaction makes a group of them atomic
    (connect relies on this for check-then-insert)
  - List operations return rows in insertion order unless stated otherwise
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  // Read-write. Writers are serialized for the lifetime of the transaction.
  virtual std::unique_ptr<Transaction> Begin() = 0;

  // Read-only snapshot. Does not wait for, or block, open writers. Writing
  // through it throws util::InvalidState.
  virtual std::unique_ptr<Transaction> BeginRead() = 0;

  // ---------------------------------------------------------------------
  // Kind graph
  // ---------------------------------------------------------------------

  // AlreadyExists if the name is taken.
  virtual Result InsertKind(Transaction&, const model::KindRecord&) = 0;

  virtual std::optional<model::KindRecord> GetKind(Transaction&, const std::string& name) = 0;

  virtual std::vector<model::KindRecord> ListKinds(Transaction&) = 0;

  // Upsert on (from_kind, to_kind, relation); a re-declared edge keeps its position.
  virtual Result UpsertEdge(Transaction&, const model::EdgeRecord&) = 0;

  virtual std::vector<model::EdgeRecord> ListEdges(Transaction&) = 0;

  virtual std::vector<model::EdgeRecord> ListEdgesFrom(Transaction&, const std::string& from_kind) = 0;

  virtual std::vector<model::EdgeRecord> ListEdgesTo(Transaction&, const std::string& to_kind) = 0;

  // ---------------------------------------------------------------------
  // Build cache
  // ---------------------------------------------------------------------

  virtual Result UpsertCacheEntry(Transaction&, const model::CacheEntryRecord&) = 0;

  virtual std::optional<model::CacheEntryRecord> GetCacheEntry(Transaction&, const std::string& step_key) = 0;

  virtual std::vector<model::CacheEntryRecord> ListCacheEntries(Transaction&) = 0;

  virtual std::vector<model::CacheEntryRecord> ListCacheEntriesBySource(Transaction&, const std::string& source_locator) = 0;

  // NotFound if the key was never recorded.
  virtual Result SetCacheEntryStale(Transaction&, const std::string& step_key, bool stale) = 0;

  // ---------------------------------------------------------------------
  // Generation plan
  // ---------------------------------------------------------------------

  virtual Result InsertRun(Transaction&, const model::RunRecord&) = 0;

  // NotFound if the run does not exist.
  virtual Result UpdateRun(Transaction&, const model::RunRecord&) = 0;

  virtual std::optional<model::RunRecord> GetRun(Transaction&, const std::string& run_id) = 0;

  // Highest sequence first; limit 0 means all.
  virtual std::vector<model::RunRecord> ListRecentRuns(Transaction&, std::size_t limit) = 0;

  virtual uint64_t MaxRunSequence(Transaction&) = 0;

  virtual Result UpsertStep(Transaction&, const model::StepRecord&) = 0;

  virtual std::vector<model::StepRecord> ListSteps(Transaction&, const std::string& run_id) = 0;

  // Single-slot active run pointer.
  virtual std::optional<std::string> GetActiveRun(Transaction&) = 0;

  virtual Result SetActiveRun(Transaction&, const std::optional<std::string>& run_id) = 0;
};

} // namespace gencore::db
