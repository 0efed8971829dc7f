#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace gencore::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, Mode mode)
    : db_(std::move(db)), mode_(mode), lock_(db_->LockForTransaction()) {
  db_->Exec(mode_ == Mode::kWrite ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      GENCORE_LOG_WARN("sqlite rollback failed", {gencore::observability::StringField("error", e.what())});
    }
  }
}

sqlite3* SqliteTransaction::WriteHandle() const {
  if (mode_ != Mode::kWrite) {
    throw util::InvalidState("write through a read-only sqlite transaction");
  }
  return db_->Handle();
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  db_->Exec("ROLLBACK;");
}

} // namespace gencore::db::sqlite
