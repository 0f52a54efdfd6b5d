#pragma once

#include "config/config.pb.h"

#include "internal/config/config_loader.hpp"
#include "internal/core/storage_engine.hpp"
#include "internal/core/time_range.hpp"
#include "internal/factory.hpp"
#include "internal/model/account.hpp"
#include "internal/model/bucket.hpp"
#include "internal/model/event.hpp"
#include "internal/model/report.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace tempo::store::v1 {
using namespace ::tempo::runtime::config;
using ::tempo::config::ConfigLoader;
using ::tempo::core::StorageEngine;
using ::tempo::core::TimeRange;
using ::tempo::factory::BuildEngine;
}
