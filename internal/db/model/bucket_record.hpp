#pragma once

#include <cstdint>
#include <string>

namespace tempo::db::model {

/*
  Persistent bucket row.

  `key` is the backend-assigned internal identity. Event rows reference the
  bucket through it, never through the string id.
*/

struct BucketRecord {
  int64_t key = 0;  // assigned by InsertBucket

  std::string id;
  std::string name;
  std::string type;
  std::string client;
  std::string hostname;

  int64_t created_us = 0;
};

} // namespace tempo::db::model
