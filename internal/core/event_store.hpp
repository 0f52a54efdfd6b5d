#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/core/bucket_directory.hpp"
#include "internal/core/time_range.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/event.hpp"

namespace tempo::core {

// Ceiling used when a caller asks for "no limit".
inline constexpr int64_t kUnboundedLimit = 1'000'000'000;

// Largest bulk insert statement; four bound parameters per row keeps it
// under the sqlite and postgres parameter limits.
inline constexpr std::size_t kMaxInsertChunkSize = 1000;

struct EventStoreOptions {
  // 0 means 100. ValidationError above kMaxInsertChunkSize.
  std::size_t insert_chunk_size = 100;
};

/*
  Event operations, keyed by public bucket id.

  Every call resolves the bucket through the directory first, so an
  unknown id always surfaces as BucketNotFound.

  Listings are ordered timestamp DESC (ties: id DESC) and clipped to the
  requested window. Counts use the same overlap filter without clipping.
*/
class EventStore {
 public:
  EventStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<BucketDirectory> directory, EventStoreOptions options);

  std::optional<model::Event> Get(const std::string& bucket_id, model::EventId event_id);

  // limit == 0 -> empty; limit < 0 -> kUnboundedLimit.
  std::vector<model::Event> GetRange(const std::string& bucket_id, int64_t limit, const TimeRange& range = {});

  uint64_t Count(const std::string& bucket_id, const TimeRange& range = {});

  // The event must not carry an id. Returns it with the assigned one.
  model::Event InsertOne(const std::string& bucket_id, const model::Event& event);

  // Pending writes are bulk inserted, persisted writes overwrite in place.
  // One transaction: either everything is applied or nothing is.
  void InsertMany(const std::string& bucket_id, const std::vector<model::EventWrite>& writes);

  // EventNotFound if the id is not in this bucket.
  model::Event Replace(const std::string& bucket_id, model::EventId event_id, const model::Event& event);

  // Overwrites the newest event, keeping its id. EventNotFound on an empty bucket.
  model::Event ReplaceLast(const std::string& bucket_id, const model::Event& event);

  // false when nothing was removed.
  bool Delete(const std::string& bucket_id, model::EventId event_id);

  // Newest event whose timestamp falls on the UTC day containing `day`.
  std::optional<model::Event> GetLastOnDay(const std::string& bucket_id, util::TimePoint day);

  // Buckets with a ReplaceLast in flight.
  std::size_t LockedBuckets() const;

 private:
  std::shared_ptr<std::mutex> BucketMutex(int64_t bucket_key);
  void                        ReleaseBucketMutex(int64_t bucket_key, std::shared_ptr<std::mutex>& bucket_mutex);

  // Runs a write against the bucket key. A key that went stale because the
  // bucket was recreated elsewhere is resolved again once.
  template <typename Fn>
  void WriteToBucket(const std::string& bucket_id, Fn&& write);

  void UpdateIn(db::Transaction& tx, const std::string& bucket_id, int64_t bucket_key, model::EventId event_id, const model::Event& event);

  std::shared_ptr<db::Repository>  repository_;
  std::shared_ptr<BucketDirectory> directory_;
  EventStoreOptions                options_;

  // Serializes ReplaceLast per bucket. Entries live while a call holds them.
  mutable std::mutex                                       bucket_mutexes_guard_;
  std::unordered_map<int64_t, std::shared_ptr<std::mutex>> bucket_mutexes_;
};

} // namespace tempo::core
