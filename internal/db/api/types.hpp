#pragma once

#include <cstdint>
#include <optional>

namespace tempo::db {

/*
  Event range filter, in stored units (microseconds since the Unix epoch).

  start_us / end_us select by interval overlap:
    timestamp <= end  AND  timestamp + duration >= start

  min_timestamp_us is a plain point filter (timestamp >= min).

  Results are ordered by timestamp DESC, id DESC. `limit` caps the row
  count; nullopt means no cap. CountEvents ignores it.
*/
struct EventQuery {
  int64_t bucket_key = 0;

  std::optional<int64_t> start_us;
  std::optional<int64_t> end_us;
  std::optional<int64_t> min_timestamp_us;

  std::optional<uint64_t> limit;
};

// Report day window: date in [from_us, to_us).
struct ReportWindow {
  int64_t from_us = 0;
  int64_t to_us   = 0;
};

} // namespace tempo::db
