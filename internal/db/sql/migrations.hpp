#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace tempo::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL() and AppliedVersion() on top of an
  open transaction or connection; the caller commits.
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;

  // Highest version recorded in schema_migrations, 0 when empty.
  virtual int64_t AppliedVersion() = 0;
};

struct Migration {
  int64_t                  version = 0;
  std::vector<std::string> statements;
};

inline constexpr int64_t kSchemaVersion = 1;

const std::vector<Migration>& SqliteMigrations();
const std::vector<Migration>& PostgresMigrations();

/*
  Creates schema_migrations if needed, then applies every migration newer
  than AppliedVersion() in order. Returns the resulting version.
*/
int64_t RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered, int64_t now_us);

} // namespace tempo::db::sql
