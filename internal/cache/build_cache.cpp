#include "build_cache.hpp"

#include "internal/core/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/step_key.hpp"
#include "internal/util/time.hpp"

namespace gencore::cache {

using gencore::core::ThrowIfDbError;
using gencore::observability::BoolField;
using gencore::observability::IntField;
using gencore::observability::StringField;

BuildCache::BuildCache(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

CheckResult BuildCache::Check(const std::string& step_key, const std::string& input_hash, bool deterministic) {
  auto tx    = repository_->BeginRead();
  auto entry = repository_->GetCacheEntry(*tx, step_key);

  CheckResult result;
  if (!entry) {
    return result;
  }

  if (!deterministic || entry->stale || entry->input_hash != input_hash) {
    result.previous_hash = entry->input_hash;
    return result;
  }

  result.outcome     = Outcome::Unchanged;
  result.last_run_ms = entry->last_run_ms;
  result.output_ref  = entry->output_ref;
  return result;
}

RecordResult BuildCache::Record(const RecordRequest& request) {
  if (request.step_key.empty()) {
    return {Outcome::Invalid, {}, "step key must not be empty"};
  }

  db::model::CacheEntryRecord entry;
  entry.step_key       = request.step_key;
  entry.input_hash     = request.input_hash;
  entry.output_hash    = request.output_hash;
  entry.output_ref     = request.output_ref;
  entry.source_locator = request.source_locator;
  entry.deterministic  = request.deterministic;
  entry.stale          = false;
  entry.last_run_ms    = util::NowMillis();

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->UpsertCacheEntry(*tx, entry), "record cache entry " + request.step_key);
  tx->Commit();

  GENCORE_LOG_INFO("cache entry recorded", {StringField("step", request.step_key), BoolField("deterministic", request.deterministic)});

  return {Outcome::Ok, request.step_key, {}};
}

InvalidateResult BuildCache::Invalidate(const std::string& step_key) {
  auto tx = repository_->Begin();
  if (!repository_->GetCacheEntry(*tx, step_key)) {
    return {Outcome::NotFound, step_key};
  }

  ThrowIfDbError(repository_->SetCacheEntryStale(*tx, step_key, true), "invalidate " + step_key);
  tx->Commit();
  return {Outcome::Ok, step_key};
}

InvalidateManyResult BuildCache::InvalidateBySource(const std::string& source_locator) {
  auto tx = repository_->Begin();

  InvalidateManyResult result;
  for (const auto& entry : repository_->ListCacheEntriesBySource(*tx, source_locator)) {
    ThrowIfDbError(repository_->SetCacheEntryStale(*tx, entry.step_key, true), "invalidate " + entry.step_key);
    result.invalidated.push_back(entry.step_key);
  }
  tx->Commit();

  GENCORE_LOG_INFO("cache invalidated by source",
                   {StringField("source", source_locator), IntField("count", static_cast<int64_t>(result.invalidated.size()))});
  return result;
}

InvalidateManyResult BuildCache::InvalidateByKind(const std::string& kind_name) {
  auto tx = repository_->Begin();

  InvalidateManyResult result;
  for (const auto& entry : repository_->ListCacheEntries(*tx)) {
    if (!util::MatchesGenerator(entry.step_key, kind_name)) continue;
    ThrowIfDbError(repository_->SetCacheEntryStale(*tx, entry.step_key, true), "invalidate " + entry.step_key);
    result.invalidated.push_back(entry.step_key);
  }
  tx->Commit();

  GENCORE_LOG_INFO("cache invalidated by kind",
                   {StringField("kind", kind_name), IntField("count", static_cast<int64_t>(result.invalidated.size()))});
  return result;
}

InvalidateAllResult BuildCache::InvalidateAll() {
  auto tx = repository_->Begin();

  InvalidateAllResult result;
  for (const auto& entry : repository_->ListCacheEntries(*tx)) {
    ThrowIfDbError(repository_->SetCacheEntryStale(*tx, entry.step_key, true), "invalidate " + entry.step_key);
    ++result.cleared;
  }
  tx->Commit();

  GENCORE_LOG_INFO("cache invalidated", {IntField("count", static_cast<int64_t>(result.cleared))});
  return result;
}

std::vector<db::model::CacheEntryRecord> BuildCache::Status() {
  auto tx = repository_->BeginRead();
  return repository_->ListCacheEntries(*tx);
}

std::vector<std::string> BuildCache::StaleSteps() {
  auto tx = repository_->BeginRead();

  std::vector<std::string> steps;
  for (const auto& entry : repository_->ListCacheEntries(*tx)) {
    if (entry.stale) steps.push_back(entry.step_key);
  }
  return steps;
}

} // namespace gencore::cache
