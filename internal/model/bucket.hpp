#pragma once

#include <cstdint>
#include <string>

#include "internal/util/time.hpp"

namespace tempo::model {

// Public bucket shape, identical for every backend.
struct BucketMetadata {
  std::string     id;
  std::string     name;
  std::string     type;
  std::string     client;
  std::string     hostname;
  util::TimePoint created{};
};

} // namespace tempo::model
