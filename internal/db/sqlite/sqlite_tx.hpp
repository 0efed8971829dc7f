#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace gencore::db::sqlite {

/*
  SQLite transaction wrapper.

  Writers use BEGIN IMMEDIATE:
    - grabs write lock early
    - a connect() cycle check and its insert cannot interleave with
      another writer

  Readers use BEGIN DEFERRED and refuse writes.
*/
class SqliteTransaction final : public db::Transaction {
public:
  enum class Mode { kRead, kWrite };

  SqliteTransaction(std::shared_ptr<SqliteDB> db, Mode mode);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  // Throws util::InvalidState on a read transaction.
  sqlite3* WriteHandle() const;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB> db_;
  Mode mode_;
  std::unique_lock<std::mutex> lock_;
  bool committed_ = false;
  bool finished_  = false;
};

} // namespace gencore::db::sqlite
