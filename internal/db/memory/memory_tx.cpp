#include "memory_tx.hpp"

#include <shared_mutex>

#include "internal/util/errors.hpp"

namespace gencore::db::memory {

namespace {

template <typename T>
T& CopyOnWrite(std::shared_ptr<const T>& slot, std::shared_ptr<T>& owned) {
  if (!owned) {
    owned = std::make_shared<T>(*slot);
    slot  = owned;
  }
  return *owned;
}

} // namespace

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, Mode mode) : repo_(repo), mode_(mode) {
  if (mode_ == Mode::kWrite) {
    write_lock_ = std::unique_lock<std::mutex>(repo_.write_mutex_);
  }
  std::shared_lock<std::shared_mutex> lock(repo_.state_mutex_);
  working_ = repo_.committed_; // snapshot: pointer copies only
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::RequireWrite() const {
  if (mode_ != Mode::kWrite) {
    throw util::InvalidState("write through a read-only memory transaction");
  }
  if (committed_ || rolled_back_) {
    throw util::InvalidState("memory transaction already finished");
  }
}

MemoryRepository::KindTable& MemoryTransaction::Kinds() {
  RequireWrite();
  return CopyOnWrite(working_.kinds, own_kinds_);
}

MemoryRepository::EdgeTable& MemoryTransaction::Edges() {
  RequireWrite();
  return CopyOnWrite(working_.edges, own_edges_);
}

MemoryRepository::CacheTable& MemoryTransaction::Cache() {
  RequireWrite();
  return CopyOnWrite(working_.cache, own_cache_);
}

MemoryRepository::RunTable& MemoryTransaction::Runs() {
  RequireWrite();
  return CopyOnWrite(working_.runs, own_runs_);
}

std::vector<model::StepRecord>& MemoryTransaction::StepsOf(const std::string& run_id) {
  RequireWrite();
  auto& table = CopyOnWrite(working_.steps, own_steps_);

  auto owned = own_run_steps_.find(run_id);
  if (owned != own_run_steps_.end()) return *owned->second;

  auto copy = std::make_shared<std::vector<model::StepRecord>>();
  auto it   = table.by_run.find(run_id);
  if (it != table.by_run.end()) *copy = *it->second;
  table.by_run[run_id]   = copy;
  own_run_steps_[run_id] = copy;
  return *copy;
}

void MemoryTransaction::SetActiveRun(const std::optional<std::string>& run_id) {
  RequireWrite();
  working_.active_run = run_id;
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw util::InvalidState("memory transaction already finished");
  }
  if (mode_ == Mode::kWrite) {
    std::unique_lock<std::shared_mutex> lock(repo_.state_mutex_);
    repo_.committed_ = std::move(working_);
  }
  committed_ = true;
  if (write_lock_.owns_lock()) {
    write_lock_.unlock();
  }
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
  if (write_lock_.owns_lock()) {
    write_lock_.unlock();
  }
}

} // namespace gencore::db::memory
