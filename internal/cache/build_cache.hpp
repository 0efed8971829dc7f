#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/outcome.hpp"
#include "internal/db/api/repository.hpp"

namespace gencore::cache {

using gencore::core::Outcome;

struct CheckResult {
  Outcome outcome = Outcome::Changed; // Changed | Unchanged

  // Changed: stored input hash, absent when the step was never recorded.
  std::optional<std::string> previous_hash;

  // Unchanged: when the reusable output was produced and where it lives.
  uint64_t                   last_run_ms = 0;
  std::optional<std::string> output_ref;
};

struct RecordRequest {
  std::string                step_key;
  std::string                input_hash;
  std::string                output_hash;
  std::optional<std::string> output_ref;
  std::optional<std::string> source_locator;
  bool                       deterministic = true;
};

struct RecordResult {
  Outcome     outcome = Outcome::Ok; // Ok | Invalid
  std::string step_key;
  std::string message;
};

struct InvalidateResult {
  Outcome     outcome = Outcome::Ok; // Ok | NotFound
  std::string step_key;
};

struct InvalidateManyResult {
  Outcome                  outcome = Outcome::Ok;
  std::vector<std::string> invalidated;
};

struct InvalidateAllResult {
  Outcome  outcome = Outcome::Ok;
  uint64_t cleared = 0;
};

/*
  BuildCache

  Decides per step whether prior output can be reused. A stale flag set by
  any invalidate call wins over a matching input hash until the step is
  recorded again.
*/
class BuildCache {
 public:
  explicit BuildCache(std::shared_ptr<db::Repository> repository);

  CheckResult Check(const std::string& step_key, const std::string& input_hash, bool deterministic);

  RecordResult Record(const RecordRequest& request);

  InvalidateResult     Invalidate(const std::string& step_key);
  InvalidateManyResult InvalidateBySource(const std::string& source_locator);
  // Matches the generator segment of the step key exactly.
  InvalidateManyResult InvalidateByKind(const std::string& kind_name);
  InvalidateAllResult  InvalidateAll();

  std::vector<db::model::CacheEntryRecord> Status();
  std::vector<std::string>                 StaleSteps();

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace gencore::cache
