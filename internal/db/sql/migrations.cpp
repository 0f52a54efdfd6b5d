#include "migrations.hpp"

#include <string>

namespace tempo::db::sql {

const std::vector<Migration>& SqliteMigrations() {
  static const std::vector<Migration> kMigrations = {
      {1,
       {"CREATE TABLE IF NOT EXISTS buckets (bucket_key INTEGER PRIMARY KEY AUTOINCREMENT, id TEXT NOT NULL UNIQUE, name TEXT NOT NULL, type TEXT NOT NULL, client TEXT NOT NULL, hostname TEXT NOT NULL, created_us INTEGER NOT NULL);",
        "CREATE TABLE IF NOT EXISTS events (id INTEGER PRIMARY KEY AUTOINCREMENT, bucket_key INTEGER NOT NULL REFERENCES buckets(bucket_key) ON DELETE CASCADE, timestamp_us INTEGER NOT NULL, duration_us INTEGER NOT NULL, data TEXT NOT NULL);",
        "CREATE INDEX IF NOT EXISTS events_bucket_timestamp ON events(bucket_key, timestamp_us);",
        "CREATE TABLE IF NOT EXISTS accounts (id INTEGER PRIMARY KEY AUTOINCREMENT, device_id TEXT NOT NULL, name TEXT NOT NULL, email TEXT NOT NULL UNIQUE, access_token TEXT NOT NULL, refresh_token TEXT NOT NULL, last_used_at_us INTEGER);",
        "CREATE TABLE IF NOT EXISTS reports (id INTEGER PRIMARY KEY AUTOINCREMENT, email TEXT NOT NULL, spent_time REAL NOT NULL, call_time REAL NOT NULL, date_us INTEGER NOT NULL, wfh INTEGER NOT NULL);",
        "CREATE INDEX IF NOT EXISTS reports_email_date ON reports(email, date_us);"}},
  };
  return kMigrations;
}

const std::vector<Migration>& PostgresMigrations() {
  static const std::vector<Migration> kMigrations = {
      {1,
       {"CREATE TABLE IF NOT EXISTS buckets (bucket_key BIGSERIAL PRIMARY KEY, id TEXT NOT NULL UNIQUE, name TEXT NOT NULL, type TEXT NOT NULL, client TEXT NOT NULL, hostname TEXT NOT NULL, created_us BIGINT NOT NULL);",
        "CREATE TABLE IF NOT EXISTS events (id BIGSERIAL PRIMARY KEY, bucket_key BIGINT NOT NULL REFERENCES buckets(bucket_key) ON DELETE CASCADE, timestamp_us BIGINT NOT NULL, duration_us BIGINT NOT NULL, data JSONB NOT NULL);",
        "CREATE INDEX IF NOT EXISTS events_bucket_timestamp ON events(bucket_key, timestamp_us);",
        "CREATE TABLE IF NOT EXISTS accounts (id BIGSERIAL PRIMARY KEY, device_id TEXT NOT NULL, name TEXT NOT NULL, email TEXT NOT NULL UNIQUE, access_token TEXT NOT NULL, refresh_token TEXT NOT NULL, last_used_at_us BIGINT);",
        "CREATE TABLE IF NOT EXISTS reports (id BIGSERIAL PRIMARY KEY, email TEXT NOT NULL, spent_time DOUBLE PRECISION NOT NULL, call_time DOUBLE PRECISION NOT NULL, date_us BIGINT NOT NULL, wfh BOOLEAN NOT NULL);",
        "CREATE INDEX IF NOT EXISTS reports_email_date ON reports(email, date_us);"}},
  };
  return kMigrations;
}

int64_t RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered, int64_t now_us) {
  executor.ExecuteSQL("CREATE TABLE IF NOT EXISTS schema_migrations (version BIGINT PRIMARY KEY, applied_at_us BIGINT NOT NULL);");

  int64_t version = executor.AppliedVersion();
  for (const auto& migration : ordered) {
    if (migration.version <= version) continue;

    for (const auto& sql : migration.statements) {
      executor.ExecuteSQL(sql);
    }
    executor.ExecuteSQL("INSERT INTO schema_migrations(version,applied_at_us) VALUES(" + std::to_string(migration.version) + "," +
                        std::to_string(now_us) + ");");
    version = migration.version;
  }
  return version;
}

} // namespace tempo::db::sql
