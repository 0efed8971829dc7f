#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/util/errors.hpp"

namespace gencore::db::sqlite {

using gencore::db::ErrorCode;
using gencore::db::Result;

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

// Reads have no Result to carry a failure, so they throw.
StmtPtr PrepareOrThrow(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw util::StorageError(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return StmtPtr(st, &sqlite3_finalize);
}

StmtPtr Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    return StmtPtr(nullptr, &sqlite3_finalize);
  }
  return StmtPtr(st, &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptU64(sqlite3_stmt* st, int idx, const std::optional<uint64_t>& v) {
  if (v) {
    BindU64(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindBool(sqlite3_stmt* st, int idx, bool v) {
  sqlite3_bind_int(st, idx, v ? 1 : 0);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

std::optional<uint64_t> ColOptU64(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColU64(st, col);
}

bool ColBool(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col) != 0;
}

// Drains a SELECT, converting each row. Throws on a step error.
template <typename Record, typename RowFn>
std::vector<Record> Collect(sqlite3* db, sqlite3_stmt* st, RowFn&& row_fn) {
  std::vector<Record> out;
  int                 rc;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    out.push_back(row_fn(st));
  }
  if (rc != SQLITE_DONE) {
    throw util::StorageError(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
  return out;
}

model::KindRecord ReadKind(sqlite3_stmt* st) {
  model::KindRecord r;
  r.name          = ColText(st, 0);
  r.category      = ColText(st, 1);
  r.created_at_ms = ColU64(st, 2);
  return r;
}

model::EdgeRecord ReadEdge(sqlite3_stmt* st) {
  model::EdgeRecord r;
  r.from_kind     = ColText(st, 0);
  r.to_kind       = ColText(st, 1);
  r.relation      = ColText(st, 2);
  r.transform     = ColOptText(st, 3);
  r.created_at_ms = ColU64(st, 4);
  return r;
}

model::CacheEntryRecord ReadCacheEntry(sqlite3_stmt* st) {
  model::CacheEntryRecord r;
  r.step_key       = ColText(st, 0);
  r.input_hash     = ColText(st, 1);
  r.output_hash    = ColText(st, 2);
  r.output_ref     = ColOptText(st, 3);
  r.source_locator = ColOptText(st, 4);
  r.deterministic  = ColBool(st, 5);
  r.stale          = ColBool(st, 6);
  r.last_run_ms    = ColU64(st, 7);
  return r;
}

model::RunRecord ReadRun(sqlite3_stmt* st) {
  model::RunRecord r;
  r.run_id          = ColText(st, 0);
  r.sequence        = ColU64(st, 1);
  r.started_at_ms   = ColU64(st, 2);
  r.completed_at_ms = ColOptU64(st, 3);
  r.status          = static_cast<model::RunStatus>(sqlite3_column_int(st, 4));
  return r;
}

model::StepRecord ReadStep(sqlite3_stmt* st) {
  model::StepRecord r;
  r.run_id         = ColText(st, 0);
  r.step_key       = ColText(st, 1);
  r.status         = ColText(st, 2);
  r.files_produced = ColU64(st, 3);
  r.duration_ms    = ColU64(st, 4);
  r.cached         = ColBool(st, 5);
  r.recorded_at_ms = ColU64(st, 6);
  return r;
}

constexpr const char* kEdgeColumns  = "SELECT from_kind,to_kind,relation,transform,created_at_ms FROM kind_edges ";
constexpr const char* kCacheColumns = "SELECT step_key,input_hash,output_hash,output_ref,source_locator,deterministic,stale,last_run_ms FROM build_cache_entries ";

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_, SqliteTransaction::Mode::kWrite);
}

std::unique_ptr<db::Transaction> SqliteRepository::BeginRead() {
  return std::make_unique<SqliteTransaction>(db_, SqliteTransaction::Mode::kRead);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT: {
      const int extended = sqlite3_extended_errcode(db);
      if (extended == SQLITE_CONSTRAINT_PRIMARYKEY || extended == SQLITE_CONSTRAINT_UNIQUE)
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    }
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Kind graph
// ------------------------------------------------------------------

Result SqliteRepository::InsertKind(Transaction& t, const model::KindRecord& r) {
  auto* db = TX(t).WriteHandle();

  auto st = Prepare(db, "INSERT INTO kinds(name,category,created_at_ms) VALUES(?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.name);
  BindText(st.get(), 2, r.category);
  BindU64(st.get(), 3, r.created_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::KindRecord> SqliteRepository::GetKind(Transaction& t, const std::string& name) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, "SELECT name,category,created_at_ms FROM kinds WHERE name=?;");
  BindText(st.get(), 1, name);

  auto rows = Collect<model::KindRecord>(db, st.get(), ReadKind);
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

std::vector<model::KindRecord> SqliteRepository::ListKinds(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, "SELECT name,category,created_at_ms FROM kinds ORDER BY rowid;");
  return Collect<model::KindRecord>(db, st.get(), ReadKind);
}

Result SqliteRepository::UpsertEdge(Transaction& t, const model::EdgeRecord& r) {
  auto* db = TX(t).WriteHandle();

  // DO UPDATE keeps the rowid, so a re-declared edge keeps its position.
  auto st = Prepare(db,
                    "INSERT INTO kind_edges(from_kind,to_kind,relation,transform,created_at_ms) VALUES(?,?,?,?,?) "
                    "ON CONFLICT(from_kind,to_kind,relation) DO UPDATE SET transform=excluded.transform;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.from_kind);
  BindText(st.get(), 2, r.to_kind);
  BindText(st.get(), 3, r.relation);
  BindOptText(st.get(), 4, r.transform);
  BindU64(st.get(), 5, r.created_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::EdgeRecord> SqliteRepository::ListEdges(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, (std::string(kEdgeColumns) + "ORDER BY rowid;").c_str());
  return Collect<model::EdgeRecord>(db, st.get(), ReadEdge);
}

std::vector<model::EdgeRecord> SqliteRepository::ListEdgesFrom(Transaction& t, const std::string& from_kind) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, (std::string(kEdgeColumns) + "WHERE from_kind=? ORDER BY rowid;").c_str());
  BindText(st.get(), 1, from_kind);
  return Collect<model::EdgeRecord>(db, st.get(), ReadEdge);
}

std::vector<model::EdgeRecord> SqliteRepository::ListEdgesTo(Transaction& t, const std::string& to_kind) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, (std::string(kEdgeColumns) + "WHERE to_kind=? ORDER BY rowid;").c_str());
  BindText(st.get(), 1, to_kind);
  return Collect<model::EdgeRecord>(db, st.get(), ReadEdge);
}

// ------------------------------------------------------------------
// Build cache
// ------------------------------------------------------------------

Result SqliteRepository::UpsertCacheEntry(Transaction& t, const model::CacheEntryRecord& r) {
  auto* db = TX(t).WriteHandle();

  auto st = Prepare(db,
                    "INSERT INTO build_cache_entries(step_key,input_hash,output_hash,output_ref,source_locator,deterministic,stale,last_run_ms) "
                    "VALUES(?,?,?,?,?,?,?,?) "
                    "ON CONFLICT(step_key) DO UPDATE SET input_hash=excluded.input_hash, output_hash=excluded.output_hash, "
                    "output_ref=excluded.output_ref, source_locator=excluded.source_locator, deterministic=excluded.deterministic, "
                    "stale=excluded.stale, last_run_ms=excluded.last_run_ms;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.step_key);
  BindText(st.get(), 2, r.input_hash);
  BindText(st.get(), 3, r.output_hash);
  BindOptText(st.get(), 4, r.output_ref);
  BindOptText(st.get(), 5, r.source_locator);
  BindBool(st.get(), 6, r.deterministic);
  BindBool(st.get(), 7, r.stale);
  BindU64(st.get(), 8, r.last_run_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::CacheEntryRecord> SqliteRepository::GetCacheEntry(Transaction& t, const std::string& step_key) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, (std::string(kCacheColumns) + "WHERE step_key=?;").c_str());
  BindText(st.get(), 1, step_key);

  auto rows = Collect<model::CacheEntryRecord>(db, st.get(), ReadCacheEntry);
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

std::vector<model::CacheEntryRecord> SqliteRepository::ListCacheEntries(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, (std::string(kCacheColumns) + "ORDER BY rowid;").c_str());
  return Collect<model::CacheEntryRecord>(db, st.get(), ReadCacheEntry);
}

std::vector<model::CacheEntryRecord> SqliteRepository::ListCacheEntriesBySource(Transaction& t, const std::string& source_locator) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, (std::string(kCacheColumns) + "WHERE source_locator=? ORDER BY rowid;").c_str());
  BindText(st.get(), 1, source_locator);
  return Collect<model::CacheEntryRecord>(db, st.get(), ReadCacheEntry);
}

Result SqliteRepository::SetCacheEntryStale(Transaction& t, const std::string& step_key, bool stale) {
  auto* db = TX(t).WriteHandle();

  auto st = Prepare(db, "UPDATE build_cache_entries SET stale=? WHERE step_key=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindBool(st.get(), 1, stale);
  BindText(st.get(), 2, step_key);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (result && sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::NotFound, "cache entry " + step_key);
  }
  return result;
}

// ------------------------------------------------------------------
// Generation plan
// ------------------------------------------------------------------

Result SqliteRepository::InsertRun(Transaction& t, const model::RunRecord& r) {
  auto* db = TX(t).WriteHandle();

  auto st = Prepare(db, "INSERT INTO generation_runs(run_id,sequence,started_at_ms,completed_at_ms,status) VALUES(?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.run_id);
  BindU64(st.get(), 2, r.sequence);
  BindU64(st.get(), 3, r.started_at_ms);
  BindOptU64(st.get(), 4, r.completed_at_ms);
  sqlite3_bind_int(st.get(), 5, static_cast<int>(r.status));

  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::UpdateRun(Transaction& t, const model::RunRecord& r) {
  auto* db = TX(t).WriteHandle();

  auto st = Prepare(db, "UPDATE generation_runs SET sequence=?,started_at_ms=?,completed_at_ms=?,status=? WHERE run_id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, r.sequence);
  BindU64(st.get(), 2, r.started_at_ms);
  BindOptU64(st.get(), 3, r.completed_at_ms);
  sqlite3_bind_int(st.get(), 4, static_cast<int>(r.status));
  BindText(st.get(), 5, r.run_id);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (result && sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::NotFound, "run " + r.run_id);
  }
  return result;
}

std::optional<model::RunRecord> SqliteRepository::GetRun(Transaction& t, const std::string& run_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, "SELECT run_id,sequence,started_at_ms,completed_at_ms,status FROM generation_runs WHERE run_id=?;");
  BindText(st.get(), 1, run_id);

  auto rows = Collect<model::RunRecord>(db, st.get(), ReadRun);
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

std::vector<model::RunRecord> SqliteRepository::ListRecentRuns(Transaction& t, std::size_t limit) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, "SELECT run_id,sequence,started_at_ms,completed_at_ms,status FROM generation_runs ORDER BY sequence DESC LIMIT ?;");

  // negative LIMIT means no limit in sqlite
  sqlite3_bind_int64(st.get(), 1, limit == 0 ? -1 : static_cast<sqlite3_int64>(limit));
  return Collect<model::RunRecord>(db, st.get(), ReadRun);
}

uint64_t SqliteRepository::MaxRunSequence(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, "SELECT COALESCE(MAX(sequence),0) FROM generation_runs;");

  auto rows = Collect<uint64_t>(db, st.get(), [](sqlite3_stmt* row) { return ColU64(row, 0); });
  return rows.empty() ? 0 : rows.front();
}

Result SqliteRepository::UpsertStep(Transaction& t, const model::StepRecord& r) {
  if (!GetRun(t, r.run_id)) {
    return Result::Err(ErrorCode::NotFound, "run " + r.run_id);
  }

  auto* db = TX(t).WriteHandle();

  auto st = Prepare(db,
                    "INSERT INTO generation_steps(run_id,step_key,status,files_produced,duration_ms,cached,recorded_at_ms) VALUES(?,?,?,?,?,?,?) "
                    "ON CONFLICT(run_id,step_key) DO UPDATE SET status=excluded.status, files_produced=excluded.files_produced, "
                    "duration_ms=excluded.duration_ms, cached=excluded.cached, recorded_at_ms=excluded.recorded_at_ms;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.run_id);
  BindText(st.get(), 2, r.step_key);
  BindText(st.get(), 3, r.status);
  BindU64(st.get(), 4, r.files_produced);
  BindU64(st.get(), 5, r.duration_ms);
  BindBool(st.get(), 6, r.cached);
  BindU64(st.get(), 7, r.recorded_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::StepRecord> SqliteRepository::ListSteps(Transaction& t, const std::string& run_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db,
                            "SELECT run_id,step_key,status,files_produced,duration_ms,cached,recorded_at_ms FROM generation_steps "
                             "WHERE run_id=? ORDER BY rowid;");
  BindText(st.get(), 1, run_id);
  return Collect<model::StepRecord>(db, st.get(), ReadStep);
}

std::optional<std::string> SqliteRepository::GetActiveRun(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, "SELECT run_id FROM generation_active_run WHERE slot=0;");

  auto rows = Collect<std::optional<std::string>>(db, st.get(), [](sqlite3_stmt* row) { return ColOptText(row, 0); });
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

Result SqliteRepository::SetActiveRun(Transaction& t, const std::optional<std::string>& run_id) {
  auto* db = TX(t).WriteHandle();

  auto st = Prepare(db, "INSERT INTO generation_active_run(slot,run_id) VALUES(0,?) ON CONFLICT(slot) DO UPDATE SET run_id=excluded.run_id;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindOptText(st.get(), 1, run_id);
  return Translate(db, sqlite3_step(st.get()));
}

} // namespace gencore::db::sqlite
