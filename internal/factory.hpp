#pragma once

#include <memory>
#include <string>

#include "config/config.pb.h"

#include "internal/core/storage_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace tempo::factory {

/*
  BuildEngine

  Composition root. The ONLY place allowed to know concrete backend types.

  Connects to the configured backend and bootstraps its schema before
  returning, so an unreachable backend fails here with BackendUnavailable
  instead of on the first operation.

  `now` overrides the clock for every component (tests).
*/
std::shared_ptr<core::StorageEngine> BuildEngine(const tempo::runtime::config::RuntimeConfig& config, util::NowFn now = {});

// Backend selection and schema bootstrap only. Throws DbError or
// BackendUnavailable when the backend cannot be opened.
std::shared_ptr<db::Repository> BuildRepository(const tempo::runtime::config::RuntimeConfig& config);

// "<dataset>[-testing].v<version>.db"
std::string SqliteFileName(const tempo::runtime::config::DatabaseConfig& database);

// "<dataset>[_testing]"
std::string PostgresSchemaName(const tempo::runtime::config::DatabaseConfig& database);

} // namespace tempo::factory
