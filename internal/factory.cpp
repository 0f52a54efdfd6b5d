#include "factory.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#if TEMPO_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"
#endif
#if TEMPO_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace tempo::factory {

using tempo::runtime::config::DatabaseConfig;
using tempo::runtime::config::RuntimeConfig;

namespace {

constexpr uint32_t kDefaultBusyTimeoutMs    = 5000;
constexpr uint32_t kDefaultFreshnessMs      = 5000;
constexpr uint32_t kDefaultMaxConnections   = 16;
constexpr const char* kDefaultDataset       = "tempo";

std::string Dataset(const DatabaseConfig& database) {
  return database.dataset().empty() ? kDefaultDataset : database.dataset();
}

std::chrono::milliseconds BusyTimeout(uint32_t configured_ms) {
  return std::chrono::milliseconds(configured_ms == 0 ? kDefaultBusyTimeoutMs : configured_ms);
}

#if TEMPO_DB_SQLITE
class SqliteMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(db::sqlite::SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

  int64_t AppliedVersion() override {
    auto st = db_.Prepare("SELECT COALESCE(MAX(version), 0) FROM schema_migrations;");
    if (sqlite3_step(st.get()) != SQLITE_ROW) return 0;
    return sqlite3_column_int64(st.get(), 0);
  }

 private:
  db::sqlite::SqliteDB& db_;
};

std::shared_ptr<db::Repository> BuildSqlite(const DatabaseConfig& database) {
  const std::filesystem::path directory = database.sqlite().directory().empty() ? "." : database.sqlite().directory();

  std::error_code ec;
  std::filesystem::create_directories(directory, ec);
  if (ec) {
    throw util::BackendUnavailable("sqlite: cannot create directory " + directory.string() + ": " + ec.message());
  }

  const auto path      = (directory / SqliteFileName(database)).string();
  auto       sqlite_db = std::make_shared<db::sqlite::SqliteDB>(path, BusyTimeout(database.sqlite().busy_timeout_ms()));

  {
    db::sqlite::SqliteTransaction tx(sqlite_db, db::TxMode::ReadWrite);
    SqliteMigrationExecutor       executor(tx.DB());
    db::sql::RunMigrations(executor, db::sql::SqliteMigrations(), util::ToUnixMicros(util::Now()));
    tx.Commit();
  }

  TEMPO_LOG_INFO("sqlite backend ready", {observability::StringField("path", path)});
  return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
}
#endif

#if TEMPO_DB_POSTGRES
class PgMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(pqxx::work& tx) : tx_(tx) {
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

  int64_t AppliedVersion() override {
    return tx_.query_value<int64_t>("SELECT COALESCE(MAX(version), 0) FROM schema_migrations;");
  }

 private:
  pqxx::work& tx_;
};

std::shared_ptr<db::Repository> BuildPostgres(const DatabaseConfig& database) {
  const auto& postgres        = database.postgres();
  const auto  max_connections = postgres.max_connections() == 0 ? kDefaultMaxConnections : postgres.max_connections();
  auto        pool = std::make_shared<db::postgres::PgPool>(postgres.connection_uri(), PostgresSchemaName(database), max_connections);

  try {
    auto       conn = pool->Acquire();
    pqxx::work tx(*conn);
    tx.exec("CREATE SCHEMA IF NOT EXISTS " + tx.quote_name(pool->Schema()));
    PgMigrationExecutor executor(tx);
    db::sql::RunMigrations(executor, db::sql::PostgresMigrations(), util::ToUnixMicros(util::Now()));
    tx.commit();
  } catch (const pqxx::broken_connection& e) {
    throw util::BackendUnavailable(std::string("postgres: ") + e.what());
  } catch (const pqxx::sql_error& e) {
    throw db::DbError(db::ErrorCode::InternalError, std::string("postgres schema bootstrap: ") + e.what());
  }

  TEMPO_LOG_INFO("postgres backend ready", {observability::StringField("schema", pool->Schema())});
  return std::make_shared<db::postgres::PgRepository>(std::move(pool));
}
#endif

} // namespace

std::string SqliteFileName(const DatabaseConfig& database) {
  return Dataset(database) + (database.testing() ? "-testing" : "") + ".v" + std::to_string(db::sql::kSchemaVersion) + ".db";
}

std::string PostgresSchemaName(const DatabaseConfig& database) {
  return Dataset(database) + (database.testing() ? "_testing" : "");
}

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if TEMPO_DB_SQLITE
    return BuildSqlite(database);
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if TEMPO_DB_POSTGRES
    return BuildPostgres(database);
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>(BusyTimeout(database.memory().busy_timeout_ms()));
}

std::shared_ptr<core::StorageEngine> BuildEngine(const RuntimeConfig& config, util::NowFn now) {
  std::shared_ptr<db::Repository> repository;
  try {
    repository = BuildRepository(config);
  } catch (const db::DbError& e) {
    throw util::BackendUnavailable(std::string("storage backend unavailable: ") + e.what());
  }

  core::StorageEngineOptions options;
  options.now = std::move(now);
  options.buckets.freshness_window =
      std::chrono::milliseconds(config.bucket_cache().freshness_ms() == 0 ? kDefaultFreshnessMs : config.bucket_cache().freshness_ms());
  if (config.events().insert_chunk_size() != 0) {
    options.events.insert_chunk_size = config.events().insert_chunk_size();
  }

  auto engine = std::make_shared<core::StorageEngine>(std::move(repository), std::move(options));
  TEMPO_LOG_INFO("storage engine built", {observability::StringField("backend", engine->BackendName()),
                                          observability::StringField("dataset", Dataset(config.database())),
                                          observability::BoolField("testing", config.database().testing())});
  return engine;
}

} // namespace tempo::factory
