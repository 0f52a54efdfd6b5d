#pragma once

#include <sqlite3.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/api/transaction.hpp"

namespace tempo::db::sqlite {

struct StatementDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

/*
  Thin RAII wrapper around one sqlite3* connection.

  A transaction holds TxMutex() from BEGIN to COMMIT/ROLLBACK. Waiting for
  it is bounded by the same busy timeout sqlite uses for file locks.

  A ReadOnly connection opens an existing file with query_only set; it
  never creates the file or changes the journal mode.
*/
class SqliteDB {
 public:
  SqliteDB(std::string path, std::chrono::milliseconds busy_timeout, TxMode access = TxMode::ReadWrite);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::chrono::milliseconds BusyTimeout() const {
    return busy_timeout_;
  }

  std::timed_mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (pragmas, migrations, BEGIN/COMMIT).
  // Throws DbError with the translated sqlite code.
  void Exec(const std::string& sql);

  // Throws DbError on prepare failure.
  Statement Prepare(const std::string& sql);

 private:
  void Configure();

  sqlite3*                  db_ = nullptr;
  std::string               path_;
  std::chrono::milliseconds busy_timeout_;
  TxMode                    access_;
  std::timed_mutex          tx_mutex_;
};

/*
  Read connections for BEGIN DEFERRED transactions.

  The file runs in WAL mode, so readers on their own connections never
  wait for the writer connection or block it. Each reader is handed to
  one transaction at a time; up to kMaxIdleReaders stay open between
  transactions and the rest are closed on release.
*/
class SqliteReaderPool : public std::enable_shared_from_this<SqliteReaderPool> {
 public:
  static constexpr std::size_t kMaxIdleReaders = 4;

  SqliteReaderPool(std::string path, std::chrono::milliseconds busy_timeout);

  // Throws DbError(Unavailable) if a new reader cannot be opened.
  std::shared_ptr<SqliteDB> Acquire();

 private:
  std::shared_ptr<SqliteDB> Wrap(SqliteDB* db);
  void                      Release(SqliteDB* db);

  std::string               path_;
  std::chrono::milliseconds busy_timeout_;

  std::mutex                             mutex_;
  std::vector<std::unique_ptr<SqliteDB>> idle_;
};

} // namespace tempo::db::sqlite
