#include "sqlite_tx.hpp"

#include "internal/db/api/result.hpp"

namespace tempo::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, TxMode mode)
    : db_(std::move(db)), mode_(mode), lock_(db_->TxMutex(), std::defer_lock) {
  if (!lock_.try_lock_for(db_->BusyTimeout())) {
    throw DbError(ErrorCode::Busy, "sqlite: timed out waiting for connection " + db_->Path());
  }
  db_->Exec(mode_ == TxMode::ReadWrite ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (...) {
    }
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
  lock_.unlock();
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  db_->Exec("ROLLBACK;");
  lock_.unlock();
}

void SqliteTransaction::RequireWrite() const {
  if (mode_ != TxMode::ReadWrite) {
    throw DbError(ErrorCode::Unsupported, "sqlite: write attempted in a read-only transaction");
  }
}

} // namespace tempo::db::sqlite
