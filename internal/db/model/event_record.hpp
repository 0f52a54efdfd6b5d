#pragma once

#include <cstdint>
#include <string>

namespace tempo::db::model {

/*
  Persistent event row.

  Payload is stored as JSON text for portability:
    postgres -> jsonb
    sqlite   -> text
    memory   -> string
*/

struct EventRecord {
  int64_t id         = 0;  // 0 = not yet assigned
  int64_t bucket_key = 0;

  int64_t timestamp_us = 0;  // UTC, microseconds since epoch
  int64_t duration_us  = 0;

  std::string data;
};

} // namespace tempo::db::model
