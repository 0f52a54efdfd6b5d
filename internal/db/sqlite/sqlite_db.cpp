#include "sqlite_db.hpp"

#include "internal/db/api/result.hpp"

namespace tempo::db::sqlite {

namespace {

ErrorCode CodeFor(int rc) {
  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return ErrorCode::Busy;
    case SQLITE_CONSTRAINT:
      return ErrorCode::ConstraintViolation;
    case SQLITE_IOERR:
    case SQLITE_CANTOPEN:
    case SQLITE_FULL:
      return ErrorCode::IOError;
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return ErrorCode::Corruption;
    default:
      return ErrorCode::InternalError;
  }
}

void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw DbError(CodeFor(rc), std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

} // namespace

SqliteDB::SqliteDB(std::string path, std::chrono::milliseconds busy_timeout, TxMode access)
    : path_(std::move(path)), busy_timeout_(busy_timeout), access_(access) {
  const int flags = access_ == TxMode::ReadWrite ? SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX
                                                 : SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX;
  int       rc    = sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw DbError(ErrorCode::Unavailable, "sqlite open " + path_ + ": " + msg);
  }

  try {
    Configure();
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw DbError(CodeFor(rc), msg);
  }
}

Statement SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  Statement     owned(stmt);
  ThrowIf(rc, db_, "sqlite prepare");
  return owned;
}

void SqliteDB::Configure() {
  if (access_ == TxMode::ReadWrite) {
    // WAL lets readers run while we hold the write lock
    Exec("PRAGMA journal_mode=WAL;");
    Exec("PRAGMA synchronous=NORMAL;");
  } else {
    Exec("PRAGMA query_only=ON;");
  }

  // off by default in sqlite; events cascade with their bucket
  Exec("PRAGMA foreign_keys=ON;");

  ThrowIf(sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout_.count())), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
  Exec("PRAGMA cache_size=-20000;"); // ~20MB (negative means KB)
}

SqliteReaderPool::SqliteReaderPool(std::string path, std::chrono::milliseconds busy_timeout)
    : path_(std::move(path)), busy_timeout_(busy_timeout) {
}

std::shared_ptr<SqliteDB> SqliteReaderPool::Acquire() {
  {
    std::lock_guard lock(mutex_);
    if (!idle_.empty()) {
      auto db = std::move(idle_.back());
      idle_.pop_back();
      return Wrap(db.release());
    }
  }

  auto db = std::make_unique<SqliteDB>(path_, busy_timeout_, TxMode::ReadOnly);
  return Wrap(db.release());
}

std::shared_ptr<SqliteDB> SqliteReaderPool::Wrap(SqliteDB* db) {
  std::weak_ptr<SqliteReaderPool> weak_self = shared_from_this();
  return std::shared_ptr<SqliteDB>(db, [weak_self](SqliteDB* released_db) {
    if (auto self = weak_self.lock()) {
      self->Release(released_db);
      return;
    }
    delete released_db;
  });
}

void SqliteReaderPool::Release(SqliteDB* db) {
  std::unique_ptr<SqliteDB> owned(db);
  std::lock_guard           lock(mutex_);
  if (idle_.size() < kMaxIdleReaders) {
    idle_.push_back(std::move(owned));
  }
}

} // namespace tempo::db::sqlite
