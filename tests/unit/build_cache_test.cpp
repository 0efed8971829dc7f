#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/cache/build_cache.hpp"
#include "internal/db/memory/memory_repository.hpp"

namespace {

using gencore::cache::BuildCache;
using gencore::cache::RecordRequest;
using gencore::core::Outcome;

std::shared_ptr<BuildCache> NewCache() {
  return std::make_shared<BuildCache>(std::make_shared<gencore::db::memory::MemoryRepository>());
}

RecordRequest MakeRecord(std::string step_key, std::string input_hash, std::optional<std::string> source = std::nullopt) {
  RecordRequest request;
  request.step_key       = std::move(step_key);
  request.input_hash     = std::move(input_hash);
  request.output_hash    = "out-" + request.input_hash;
  request.output_ref     = "gen/" + request.step_key;
  request.source_locator = std::move(source);
  return request;
}

bool Contains(const std::vector<std::string>& values, const std::string& value) {
  return std::find(values.begin(), values.end(), value) != values.end();
}

void TestCheckWithoutEntryIsChanged() {
  auto cache  = NewCache();
  auto result = cache->Check("fw:TypeScriptGen:todo", "h1", true);
  assert(result.outcome == Outcome::Changed);
  assert(!result.previous_hash.has_value());
}

void TestRecordThenCheckIsUnchanged() {
  auto cache = NewCache();

  auto recorded = cache->Record(MakeRecord("fw:TypeScriptGen:todo", "h1"));
  assert(recorded.outcome == Outcome::Ok);
  assert(recorded.step_key == "fw:TypeScriptGen:todo");

  auto result = cache->Check("fw:TypeScriptGen:todo", "h1", true);
  assert(result.outcome == Outcome::Unchanged);
  assert(result.output_ref == std::optional<std::string>("gen/fw:TypeScriptGen:todo"));
  assert(result.last_run_ms > 0);
}

void TestHashMismatchReportsPrevious() {
  auto cache = NewCache();
  cache->Record(MakeRecord("fw:RustGen:todo", "h1"));

  auto result = cache->Check("fw:RustGen:todo", "h2", true);
  assert(result.outcome == Outcome::Changed);
  assert(result.previous_hash == std::optional<std::string>("h1"));
}

void TestNonDeterministicAlwaysChanged() {
  auto cache = NewCache();
  cache->Record(MakeRecord("fw:RustGen:todo", "h1"));

  for (int i = 0; i < 3; ++i) {
    auto result = cache->Check("fw:RustGen:todo", "h1", false);
    assert(result.outcome == Outcome::Changed);
    assert(result.previous_hash == std::optional<std::string>("h1"));
  }
}

void TestEmptyStepKeyRejected() {
  auto cache  = NewCache();
  auto result = cache->Record(MakeRecord("", "h1"));
  assert(result.outcome == Outcome::Invalid);
  assert(cache->Status().empty());
}

void TestInvalidateForcesChangeUntilRecorded() {
  auto cache = NewCache();
  cache->Record(MakeRecord("fw:SwiftGen:todo", "h1"));

  auto invalidated = cache->Invalidate("fw:SwiftGen:todo");
  assert(invalidated.outcome == Outcome::Ok);
  assert(invalidated.step_key == "fw:SwiftGen:todo");

  auto stale = cache->Check("fw:SwiftGen:todo", "h1", true);
  assert(stale.outcome == Outcome::Changed);
  assert(stale.previous_hash == std::optional<std::string>("h1"));
  assert(cache->StaleSteps() == std::vector<std::string>{"fw:SwiftGen:todo"});

  cache->Record(MakeRecord("fw:SwiftGen:todo", "h1"));
  assert(cache->Check("fw:SwiftGen:todo", "h1", true).outcome == Outcome::Unchanged);
  assert(cache->StaleSteps().empty());
}

void TestInvalidateUnknownKeyIsNotFound() {
  auto cache  = NewCache();
  auto result = cache->Invalidate("fw:Nothing:here");
  assert(result.outcome == Outcome::NotFound);
  assert(result.step_key == "fw:Nothing:here");
}

void TestInvalidateBySourceTouchesOnlyMatches() {
  auto cache = NewCache();
  cache->Record(MakeRecord("fw:TypeScriptGen:todo", "h1", std::string("specs/todo.concept")));
  cache->Record(MakeRecord("fw:RustGen:todo", "h2", std::string("specs/todo.concept")));
  cache->Record(MakeRecord("fw:RustGen:user", "h3", std::string("specs/user.concept")));
  cache->Record(MakeRecord("fw:RustGen:misc", "h4"));

  auto result = cache->InvalidateBySource("specs/todo.concept");
  assert(result.outcome == Outcome::Ok);
  assert(result.invalidated.size() == 2);
  assert(Contains(result.invalidated, "fw:TypeScriptGen:todo"));
  assert(Contains(result.invalidated, "fw:RustGen:todo"));

  assert(cache->Check("fw:RustGen:user", "h3", true).outcome == Outcome::Unchanged);
  assert(cache->Check("fw:RustGen:misc", "h4", true).outcome == Outcome::Unchanged);

  assert(cache->InvalidateBySource("specs/none.concept").invalidated.empty());
}

void TestInvalidateByKindMatchesGeneratorExactly() {
  auto cache = NewCache();
  cache->Record(MakeRecord("fw:Rust:todo", "h1"));
  cache->Record(MakeRecord("fw:RustGen:todo", "h2"));
  cache->Record(MakeRecord("iface:Rust:user", "h3"));
  cache->Record(MakeRecord("Rust", "h4"));

  auto result = cache->InvalidateByKind("Rust");
  assert(result.invalidated.size() == 3);
  assert(Contains(result.invalidated, "fw:Rust:todo"));
  assert(Contains(result.invalidated, "iface:Rust:user"));
  assert(Contains(result.invalidated, "Rust"));
  assert(!Contains(result.invalidated, "fw:RustGen:todo"));

  assert(cache->Check("fw:RustGen:todo", "h2", true).outcome == Outcome::Unchanged);
}

void TestInvalidateAllCountsEntries() {
  auto cache = NewCache();
  assert(cache->InvalidateAll().cleared == 0);

  cache->Record(MakeRecord("a:G:1", "h1"));
  cache->Record(MakeRecord("a:G:2", "h2"));
  cache->Record(MakeRecord("a:H:3", "h3"));

  auto result = cache->InvalidateAll();
  assert(result.outcome == Outcome::Ok);
  assert(result.cleared == 3);
  assert(cache->StaleSteps().size() == 3);
  assert(cache->Status().size() == 3);

  for (const auto& entry : cache->Status()) {
    assert(entry.stale);
    assert(cache->Check(entry.step_key, entry.input_hash, true).outcome == Outcome::Changed);
  }
}

} // namespace

int main() {
  TestCheckWithoutEntryIsChanged();
  TestRecordThenCheckIsUnchanged();
  TestHashMismatchReportsPrevious();
  TestNonDeterministicAlwaysChanged();
  TestEmptyStepKeyRejected();
  TestInvalidateForcesChangeUntilRecorded();
  TestInvalidateUnknownKeyIsNotFound();
  TestInvalidateBySourceTouchesOnlyMatches();
  TestInvalidateByKindMatchesGeneratorExactly();
  TestInvalidateAllCountsEntries();

  std::cout << "gencore_unit_build_cache: pass\n";
  return 0;
}
