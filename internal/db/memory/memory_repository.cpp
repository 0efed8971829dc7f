#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace gencore::db::memory {

namespace {

bool SameEdge(const model::EdgeRecord& a, const model::EdgeRecord& b) {
  return a.from_kind == b.from_kind && a.to_kind == b.to_kind && a.relation == b.relation;
}

} // namespace

MemoryRepository::MemoryRepository() {
  committed_.kinds = std::make_shared<KindTable>();
  committed_.edges = std::make_shared<EdgeTable>();
  committed_.cache = std::make_shared<CacheTable>();
  committed_.runs  = std::make_shared<RunTable>();
  committed_.steps = std::make_shared<StepTable>();
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this, MemoryTransaction::Mode::kWrite);
}

std::unique_ptr<db::Transaction> MemoryRepository::BeginRead() {
  return std::make_unique<MemoryTransaction>(*this, MemoryTransaction::Mode::kRead);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Kind graph
// ------------------------------------------------------------------

Result MemoryRepository::InsertKind(Transaction& t, const model::KindRecord& r) {
  if (TX(t).View().kinds->index.contains(r.name)) return Result::Err(ErrorCode::AlreadyExists, "kind " + r.name);
  auto& kinds          = TX(t).Kinds();
  kinds.index[r.name] = kinds.rows.size();
  kinds.rows.push_back(r);
  return Result::Ok();
}

std::optional<model::KindRecord> MemoryRepository::GetKind(Transaction& t, const std::string& name) {
  const auto& kinds = *TX(t).View().kinds;
  auto        it    = kinds.index.find(name);
  if (it == kinds.index.end()) return std::nullopt;
  return kinds.rows[it->second];
}

std::vector<model::KindRecord> MemoryRepository::ListKinds(Transaction& t) {
  return TX(t).View().kinds->rows;
}

Result MemoryRepository::UpsertEdge(Transaction& t, const model::EdgeRecord& r) {
  auto& edges = TX(t).Edges().rows;
  auto  it    = std::find_if(edges.begin(), edges.end(), [&](const model::EdgeRecord& e) { return SameEdge(e, r); });
  if (it != edges.end()) {
    it->transform = r.transform;
    return Result::Ok();
  }
  edges.push_back(r);
  return Result::Ok();
}

std::vector<model::EdgeRecord> MemoryRepository::ListEdges(Transaction& t) {
  return TX(t).View().edges->rows;
}

std::vector<model::EdgeRecord> MemoryRepository::ListEdgesFrom(Transaction& t, const std::string& from_kind) {
  std::vector<model::EdgeRecord> out;
  for (auto& e : TX(t).View().edges->rows)
    if (e.from_kind == from_kind) out.push_back(e);
  return out;
}

std::vector<model::EdgeRecord> MemoryRepository::ListEdgesTo(Transaction& t, const std::string& to_kind) {
  std::vector<model::EdgeRecord> out;
  for (auto& e : TX(t).View().edges->rows)
    if (e.to_kind == to_kind) out.push_back(e);
  return out;
}

// ------------------------------------------------------------------
// Build cache
// ------------------------------------------------------------------

Result MemoryRepository::UpsertCacheEntry(Transaction& t, const model::CacheEntryRecord& r) {
  auto& cache = TX(t).Cache();
  auto  it    = cache.index.find(r.step_key);
  if (it != cache.index.end()) {
    cache.rows[it->second] = r;
    return Result::Ok();
  }
  cache.index[r.step_key] = cache.rows.size();
  cache.rows.push_back(r);
  return Result::Ok();
}

std::optional<model::CacheEntryRecord> MemoryRepository::GetCacheEntry(Transaction& t, const std::string& step_key) {
  const auto& cache = *TX(t).View().cache;
  auto        it    = cache.index.find(step_key);
  if (it == cache.index.end()) return std::nullopt;
  return cache.rows[it->second];
}

std::vector<model::CacheEntryRecord> MemoryRepository::ListCacheEntries(Transaction& t) {
  return TX(t).View().cache->rows;
}

std::vector<model::CacheEntryRecord> MemoryRepository::ListCacheEntriesBySource(Transaction& t, const std::string& source_locator) {
  std::vector<model::CacheEntryRecord> out;
  for (auto& e : TX(t).View().cache->rows)
    if (e.source_locator && *e.source_locator == source_locator) out.push_back(e);
  return out;
}

Result MemoryRepository::SetCacheEntryStale(Transaction& t, const std::string& step_key, bool stale) {
  const auto& committed = *TX(t).View().cache;
  auto        it        = committed.index.find(step_key);
  if (it == committed.index.end()) return Result::Err(ErrorCode::NotFound, "cache entry " + step_key);
  const size_t pos = it->second;
  TX(t).Cache().rows[pos].stale = stale;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Generation plan
// ------------------------------------------------------------------

Result MemoryRepository::InsertRun(Transaction& t, const model::RunRecord& r) {
  if (TX(t).View().runs->index.contains(r.run_id)) return Result::Err(ErrorCode::AlreadyExists, "run " + r.run_id);
  auto& runs            = TX(t).Runs();
  runs.index[r.run_id] = runs.rows.size();
  runs.rows.push_back(r);
  return Result::Ok();
}

Result MemoryRepository::UpdateRun(Transaction& t, const model::RunRecord& r) {
  const auto& committed = *TX(t).View().runs;
  auto        it        = committed.index.find(r.run_id);
  if (it == committed.index.end()) return Result::Err(ErrorCode::NotFound, "run " + r.run_id);
  const size_t pos = it->second;
  TX(t).Runs().rows[pos] = r;
  return Result::Ok();
}

std::optional<model::RunRecord> MemoryRepository::GetRun(Transaction& t, const std::string& run_id) {
  const auto& runs = *TX(t).View().runs;
  auto        it   = runs.index.find(run_id);
  if (it == runs.index.end()) return std::nullopt;
  return runs.rows[it->second];
}

std::vector<model::RunRecord> MemoryRepository::ListRecentRuns(Transaction& t, std::size_t limit) {
  auto runs = TX(t).View().runs->rows;
  std::sort(runs.begin(), runs.end(), [](const model::RunRecord& a, const model::RunRecord& b) { return a.sequence > b.sequence; });
  if (limit > 0 && runs.size() > limit) {
    runs.resize(limit);
  }
  return runs;
}

uint64_t MemoryRepository::MaxRunSequence(Transaction& t) {
  uint64_t max_sequence = 0;
  for (const auto& run : TX(t).View().runs->rows) {
    max_sequence = std::max(max_sequence, run.sequence);
  }
  return max_sequence;
}

Result MemoryRepository::UpsertStep(Transaction& t, const model::StepRecord& r) {
  if (!TX(t).View().runs->index.contains(r.run_id)) return Result::Err(ErrorCode::NotFound, "run " + r.run_id);

  auto& steps = TX(t).StepsOf(r.run_id);
  auto  it    = std::find_if(steps.begin(), steps.end(), [&](const model::StepRecord& step) { return step.step_key == r.step_key; });
  if (it != steps.end()) {
    *it = r;
    return Result::Ok();
  }
  steps.push_back(r);
  return Result::Ok();
}

std::vector<model::StepRecord> MemoryRepository::ListSteps(Transaction& t, const std::string& run_id) {
  const auto& steps = *TX(t).View().steps;
  auto        it    = steps.by_run.find(run_id);
  if (it == steps.by_run.end()) return {};
  return *it->second;
}

std::optional<std::string> MemoryRepository::GetActiveRun(Transaction& t) {
  return TX(t).View().active_run;
}

Result MemoryRepository::SetActiveRun(Transaction& t, const std::optional<std::string>& run_id) {
  TX(t).SetActiveRun(run_id);
  return Result::Ok();
}

} // namespace gencore::db::memory
