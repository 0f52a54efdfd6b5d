#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace tempo::db::sqlite {

/*
  SQLite transaction wrapper.

  ReadWrite uses BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later
  ReadOnly uses BEGIN DEFERRED and never upgrades. It runs on a reader
  connection of its own, so it does not contend with writers.

  Throws DbError(Busy) if the connection stays taken past the busy timeout.
*/
class SqliteTransaction final : public db::Transaction {
public:
  SqliteTransaction(std::shared_ptr<SqliteDB> db, TxMode mode);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }
  SqliteDB& DB() const { return *db_; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }
  TxMode Mode() const override { return mode_; }

  // Throws DbError(Unsupported) on a ReadOnly transaction.
  void RequireWrite() const;

private:
  std::shared_ptr<SqliteDB>          db_;
  TxMode                             mode_;
  std::unique_lock<std::timed_mutex> lock_;
  bool                               committed_ = false;
  bool                               finished_  = false;
};

}
