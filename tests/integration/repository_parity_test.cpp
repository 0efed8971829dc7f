#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/cache_entry_record.hpp"
#include "internal/db/model/edge_record.hpp"
#include "internal/db/model/kind_record.hpp"
#include "internal/db/model/run_record.hpp"
#include "internal/db/model/step_record.hpp"
#include "internal/util/errors.hpp"

#if GENCORE_DB_SQLITE
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using gencore::db::ErrorCode;
using gencore::db::Repository;
using gencore::db::memory::MemoryRepository;
using gencore::db::model::CacheEntryRecord;
using gencore::db::model::EdgeRecord;
using gencore::db::model::KindRecord;
using gencore::db::model::RunRecord;
using gencore::db::model::RunStatus;
using gencore::db::model::StepRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                        name;
  std::function<std::shared_ptr<Repository>()>       make_repository;
  std::function<bool()>                              supports_restart;
  std::function<void(std::shared_ptr<Repository>&)>  restart;
  std::function<void()>                              cleanup;
};

void VerifyKindsAndEdges(Repository& repo, const std::string& prefix) {
  const auto a = prefix + "-A";
  const auto b = prefix + "-B";
  const auto c = prefix + "-C";

  auto tx = repo.Begin();

  assert(repo.InsertKind(*tx, KindRecord{.name = a, .category = "source", .created_at_ms = NowMs()}));
  assert(repo.InsertKind(*tx, KindRecord{.name = b, .category = "model", .created_at_ms = NowMs()}));
  assert(repo.InsertKind(*tx, KindRecord{.name = c, .category = "artifact", .created_at_ms = NowMs()}));

  auto dup = repo.InsertKind(*tx, KindRecord{.name = a, .category = "model", .created_at_ms = NowMs()});
  assert(!dup);
  assert(dup.code == ErrorCode::AlreadyExists);

  auto kind = repo.GetKind(*tx, a);
  assert(kind.has_value());
  assert(kind->category == "source");
  assert(!repo.GetKind(*tx, prefix + "-missing").has_value());

  assert(repo.UpsertEdge(*tx, EdgeRecord{.from_kind = a, .to_kind = b, .relation = "parses_to", .transform = "Parser", .created_at_ms = NowMs()}));
  assert(repo.UpsertEdge(*tx, EdgeRecord{.from_kind = a, .to_kind = c, .relation = "renders_to", .transform = std::nullopt, .created_at_ms = NowMs()}));
  assert(repo.UpsertEdge(*tx, EdgeRecord{.from_kind = b, .to_kind = c, .relation = "renders_to", .transform = "Emit", .created_at_ms = NowMs()}));

  // re-declaring the same triple replaces the transform and keeps its position
  assert(repo.UpsertEdge(*tx, EdgeRecord{.from_kind = a, .to_kind = b, .relation = "parses_to", .transform = "Parser2", .created_at_ms = NowMs()}));

  tx->Commit();

  auto read_tx = repo.Begin();

  std::vector<EdgeRecord> edges;
  for (auto& edge : repo.ListEdges(*read_tx)) {
    if (edge.from_kind.rfind(prefix, 0) == 0) edges.push_back(edge);
  }
  assert(edges.size() == 3);
  assert(edges[0].to_kind == b);
  assert(edges[0].transform == std::optional<std::string>("Parser2"));
  assert(edges[1].to_kind == c);
  assert(!edges[1].transform.has_value());
  assert(edges[2].from_kind == b);

  auto from_a = repo.ListEdgesFrom(*read_tx, a);
  assert(from_a.size() == 2);
  assert(from_a[0].to_kind == b);
  assert(from_a[1].to_kind == c);

  auto to_c = repo.ListEdgesTo(*read_tx, c);
  assert(to_c.size() == 2);
  assert(to_c[0].from_kind == a);
  assert(to_c[1].from_kind == b);

  std::vector<std::string> names;
  for (auto& k : repo.ListKinds(*read_tx)) {
    if (k.name.rfind(prefix, 0) == 0) names.push_back(k.name);
  }
  assert((names == std::vector<std::string>{a, b, c}));

  read_tx->Commit();
}

void VerifyCacheEntries(Repository& repo, const std::string& prefix) {
  const auto key_a = prefix + ":TypeScriptGen:user";
  const auto key_b = prefix + ":RustGen:user";

  auto tx = repo.Begin();

  CacheEntryRecord a{.step_key = key_a, .input_hash = "h1", .output_hash = "o1", .output_ref = "ref-a", .source_locator = "specs/user.concept",
                     .deterministic = true, .stale = false, .last_run_ms = 1000};
  CacheEntryRecord b{.step_key = key_b, .input_hash = "h2", .output_hash = "o2", .output_ref = std::nullopt, .source_locator = std::nullopt,
                     .deterministic = false, .stale = false, .last_run_ms = 2000};
  assert(repo.UpsertCacheEntry(*tx, a));
  assert(repo.UpsertCacheEntry(*tx, b));

  auto read = repo.GetCacheEntry(*tx, key_a);
  assert(read.has_value());
  assert(read->input_hash == "h1");
  assert(read->output_ref == std::optional<std::string>("ref-a"));
  assert(read->source_locator == std::optional<std::string>("specs/user.concept"));
  assert(read->deterministic);
  assert(!read->stale);
  assert(read->last_run_ms == 1000);

  auto read_b = repo.GetCacheEntry(*tx, key_b);
  assert(read_b.has_value());
  assert(!read_b->output_ref.has_value());
  assert(!read_b->source_locator.has_value());
  assert(!read_b->deterministic);

  a.input_hash  = "h1b";
  a.last_run_ms = 3000;
  assert(repo.UpsertCacheEntry(*tx, a));
  assert(repo.GetCacheEntry(*tx, key_a)->input_hash == "h1b");

  auto by_source = repo.ListCacheEntriesBySource(*tx, "specs/user.concept");
  assert(by_source.size() == 1);
  assert(by_source[0].step_key == key_a);

  assert(repo.SetCacheEntryStale(*tx, key_b, true));
  assert(repo.GetCacheEntry(*tx, key_b)->stale);

  auto missing = repo.SetCacheEntryStale(*tx, prefix + ":nope:x", true);
  assert(!missing);
  assert(missing.code == ErrorCode::NotFound);

  tx->Commit();
}

void VerifyRunsAndSteps(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();

  const auto base = repo.MaxRunSequence(*tx);

  RunRecord first{.run_id = prefix + "-run-1", .sequence = base + 1, .started_at_ms = 100, .completed_at_ms = std::nullopt, .status = RunStatus::Running};
  RunRecord second{.run_id = prefix + "-run-2", .sequence = base + 2, .started_at_ms = 200, .completed_at_ms = std::nullopt, .status = RunStatus::Running};
  assert(repo.InsertRun(*tx, first));
  assert(repo.InsertRun(*tx, second));
  assert(repo.MaxRunSequence(*tx) == base + 2);

  auto dup = repo.InsertRun(*tx, first);
  assert(!dup);
  assert(dup.code == ErrorCode::AlreadyExists);

  first.status          = RunStatus::Superseded;
  first.completed_at_ms = 150;
  assert(repo.UpdateRun(*tx, first));

  auto read = repo.GetRun(*tx, first.run_id);
  assert(read.has_value());
  assert(read->status == RunStatus::Superseded);
  assert(read->completed_at_ms == std::optional<uint64_t>(150));

  RunRecord ghost{.run_id = prefix + "-ghost", .sequence = 0, .started_at_ms = 0, .completed_at_ms = std::nullopt, .status = RunStatus::Running};
  assert(repo.UpdateRun(*tx, ghost).code == ErrorCode::NotFound);

  auto recent = repo.ListRecentRuns(*tx, 1);
  assert(recent.size() == 1);
  assert(recent[0].run_id == second.run_id);

  auto all = repo.ListRecentRuns(*tx, 0);
  assert(all.size() >= 2);
  assert(all[0].run_id == second.run_id);
  assert(all[1].run_id == first.run_id);

  StepRecord step1{.run_id = second.run_id, .step_key = "ns:gen:a", .status = "done", .files_produced = 3, .duration_ms = 40, .cached = false,
                   .recorded_at_ms = 210};
  StepRecord step2{.run_id = second.run_id, .step_key = "ns:gen:b", .status = "cached", .files_produced = 0, .duration_ms = 1, .cached = true,
                   .recorded_at_ms = 220};
  assert(repo.UpsertStep(*tx, step1));
  assert(repo.UpsertStep(*tx, step2));

  step1.status = "failed";
  assert(repo.UpsertStep(*tx, step1));

  auto steps = repo.ListSteps(*tx, second.run_id);
  assert(steps.size() == 2);
  assert(steps[0].step_key == "ns:gen:a");
  assert(steps[0].status == "failed");
  assert(steps[1].cached);

  StepRecord orphan{.run_id = prefix + "-ghost", .step_key = "x", .status = "done"};
  assert(repo.UpsertStep(*tx, orphan).code == ErrorCode::NotFound);
  assert(repo.ListSteps(*tx, prefix + "-ghost").empty());

  assert(repo.SetActiveRun(*tx, second.run_id));
  assert(repo.GetActiveRun(*tx) == std::optional<std::string>(second.run_id));
  assert(repo.SetActiveRun(*tx, std::nullopt));
  assert(!repo.GetActiveRun(*tx).has_value());

  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& prefix) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertKind(*tx, KindRecord{.name = prefix + "-rolled-back", .category = "model", .created_at_ms = NowMs()}));
    tx->Rollback();
  }

  {
    // destruction without commit rolls back too
    auto tx = repo.Begin();
    assert(repo.InsertKind(*tx, KindRecord{.name = prefix + "-dropped", .category = "model", .created_at_ms = NowMs()}));
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetKind(*check_tx, prefix + "-rolled-back").has_value());
  assert(!repo.GetKind(*check_tx, prefix + "-dropped").has_value());
  check_tx->Commit();
}

void VerifyReadTransactions(Repository& repo, const std::string& prefix) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertKind(*tx, KindRecord{.name = prefix + "-kind", .category = "model", .created_at_ms = NowMs()}));
    tx->Commit();
  }

  auto reader = repo.BeginRead();
  assert(repo.GetKind(*reader, prefix + "-kind").has_value());

  bool threw = false;
  try {
    (void)repo.InsertKind(*reader, KindRecord{.name = prefix + "-through-reader", .category = "model", .created_at_ms = NowMs()});
  } catch (const gencore::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  reader.reset();

  auto check_tx = repo.BeginRead();
  assert(!repo.GetKind(*check_tx, prefix + "-through-reader").has_value());
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->InsertKind(*tx, KindRecord{.name = prefix + "-kind", .category = "source", .created_at_ms = NowMs()}));
    assert(repo->UpsertCacheEntry(*tx, CacheEntryRecord{.step_key = prefix + ":gen:spec", .input_hash = "h", .output_hash = "o"}));
    assert(repo->InsertRun(*tx, RunRecord{.run_id = prefix + "-run", .sequence = repo->MaxRunSequence(*tx) + 1, .started_at_ms = NowMs()}));
    assert(repo->SetActiveRun(*tx, prefix + "-run"));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  assert(repo->GetKind(*tx, prefix + "-kind").has_value());
  assert(repo->GetCacheEntry(*tx, prefix + ":gen:spec").has_value());
  assert(repo->GetRun(*tx, prefix + "-run").has_value());
  assert(repo->GetActiveRun(*tx) == std::optional<std::string>(prefix + "-run"));
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if GENCORE_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  const auto db_path = std::filesystem::temp_directory_path() / "gencore_repository_parity.sqlite";
  std::filesystem::remove(db_path);

  auto make_repo = [db_path]() -> std::shared_ptr<Repository> {
    auto db = std::make_shared<gencore::db::sqlite::SqliteDB>(db_path.string());
    gencore::db::sql::RunMigrations(*db, gencore::db::sql::SchemaMigrations());
    return std::make_shared<gencore::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path.string() + "-wal");
        std::filesystem::remove(db_path.string() + "-shm");
      },
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  {
    auto repo = backend.make_repository();

    VerifyKindsAndEdges(*repo, backend.name + "-graph");
    VerifyCacheEntries(*repo, backend.name + "-cache");
    VerifyRunsAndSteps(*repo, backend.name + "-plan");
    VerifyRollbackBehavior(*repo, backend.name + "-rollback");
    VerifyReadTransactions(*repo, backend.name + "-read");
  }

  VerifyRestartDurability(backend, backend.name + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if GENCORE_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "gencore_integration_repository_parity: pass\n";
  return 0;
}
