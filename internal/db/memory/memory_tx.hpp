#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace gencore::db::memory {

/*
  Transaction = snapshot + write set

  The snapshot shares every relation with the committed state. A writer
  holds the repository writer lock from construction until commit or
  rollback, so writers are serialized and a commit can never conflict.
  Readers hold no lock once the snapshot is taken.

  Do not open a second write transaction on the same thread while one is
  alive.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  enum class Mode { kRead, kWrite };

  MemoryTransaction(MemoryRepository& repo, Mode mode);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  const MemoryRepository::State& View() const {
    return working_;
  }

  // Copy-on-write accessors. Throw util::InvalidState on a read transaction.
  MemoryRepository::KindTable&    Kinds();
  MemoryRepository::EdgeTable&    Edges();
  MemoryRepository::CacheTable&   Cache();
  MemoryRepository::RunTable&     Runs();
  std::vector<model::StepRecord>& StepsOf(const std::string& run_id);
  void                            SetActiveRun(const std::optional<std::string>& run_id);

 private:
  void RequireWrite() const;

  MemoryRepository&            repo_;
  Mode                         mode_;
  std::unique_lock<std::mutex> write_lock_;
  MemoryRepository::State      working_;

  // Relations this transaction already cloned.
  std::shared_ptr<MemoryRepository::KindTable>  own_kinds_;
  std::shared_ptr<MemoryRepository::EdgeTable>  own_edges_;
  std::shared_ptr<MemoryRepository::CacheTable> own_cache_;
  std::shared_ptr<MemoryRepository::RunTable>   own_runs_;
  std::shared_ptr<MemoryRepository::StepTable>  own_steps_;
  std::unordered_map<std::string, std::shared_ptr<std::vector<model::StepRecord>>> own_run_steps_;

  bool committed_   = false;
  bool rolled_back_ = false;
};

} // namespace gencore::db::memory
