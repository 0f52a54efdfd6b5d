#include "event_store.hpp"

#include <algorithm>
#include <chrono>

#include "internal/core/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace tempo::core {

namespace {

std::string EventContext(const std::string& bucket_id, model::EventId event_id) {
  return "event " + std::to_string(event_id) + " in bucket " + bucket_id;
}

db::model::EventRecord ToRecord(int64_t bucket_key, const model::Event& event) {
  if (event.duration.count() < 0) {
    throw util::ValidationError("event duration must not be negative");
  }

  db::model::EventRecord record;
  record.bucket_key   = bucket_key;
  record.timestamp_us = util::ToUnixMicros(event.timestamp);
  record.duration_us  = event.duration.count();
  record.data         = model::DataToJson(event.data);
  return record;
}

model::Event FromRecord(const db::model::EventRecord& record) {
  model::Event event;
  event.id        = record.id;
  event.timestamp = util::FromUnixMicros(record.timestamp_us);
  event.duration  = util::Duration(record.duration_us);
  event.data      = model::DataFromJson(record.data);
  return event;
}

// Stored instants are whole micros, so rounding start up and end down
// selects exactly the events that overlap the unrounded range.
db::EventQuery ToQuery(int64_t bucket_key, const TimeRange& range) {
  if (range.start.has_value() && range.end.has_value() && *range.start > *range.end) {
    throw util::ValidationError("query start must not be after end");
  }

  db::EventQuery query;
  query.bucket_key = bucket_key;
  if (range.start.has_value()) {
    query.start_us = std::chrono::ceil<std::chrono::microseconds>(range.start->time_since_epoch()).count();
  }
  if (range.end.has_value()) query.end_us = util::ToUnixMicros(*range.end);
  return query;
}

} // namespace

EventStore::EventStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<BucketDirectory> directory, EventStoreOptions options)
    : repository_(std::move(repository)), directory_(std::move(directory)), options_(options) {
  if (options_.insert_chunk_size == 0) options_.insert_chunk_size = 100;
  if (options_.insert_chunk_size > kMaxInsertChunkSize) {
    throw util::ValidationError("insert chunk size " + std::to_string(options_.insert_chunk_size) + " exceeds " +
                                std::to_string(kMaxInsertChunkSize));
  }
}

std::shared_ptr<std::mutex> EventStore::BucketMutex(int64_t bucket_key) {
  std::lock_guard<std::mutex> lock(bucket_mutexes_guard_);
  auto&                       bucket_mutex = bucket_mutexes_[bucket_key];
  if (!bucket_mutex) {
    bucket_mutex = std::make_shared<std::mutex>();
  }
  return bucket_mutex;
}

void EventStore::ReleaseBucketMutex(int64_t bucket_key, std::shared_ptr<std::mutex>& bucket_mutex) {
  std::lock_guard<std::mutex> lock(bucket_mutexes_guard_);
  bucket_mutex.reset();
  auto it = bucket_mutexes_.find(bucket_key);
  if (it != bucket_mutexes_.end() && it->second.use_count() == 1) {
    bucket_mutexes_.erase(it);
  }
}

std::size_t EventStore::LockedBuckets() const {
  std::lock_guard<std::mutex> lock(bucket_mutexes_guard_);
  return bucket_mutexes_.size();
}

template <typename Fn>
void EventStore::WriteToBucket(const std::string& bucket_id, Fn&& write) {
  const auto key = directory_->Resolve(bucket_id);
  try {
    write(key);
    return;
  } catch (const util::BucketNotFound&) {
    directory_->Forget(bucket_id);
  }

  const auto fresh_key = directory_->Resolve(bucket_id);
  if (fresh_key == key) throw util::BucketNotFound(bucket_id);
  TEMPO_LOG_DEBUG("bucket key refreshed", {observability::StringField("bucket_id", bucket_id), observability::IntField("bucket_key", fresh_key)});
  write(fresh_key);
}

std::optional<model::Event> EventStore::Get(const std::string& bucket_id, model::EventId event_id) {
  const auto key = directory_->Resolve(bucket_id);

  auto record = WithBackend("get " + EventContext(bucket_id, event_id), [&] {
    auto tx = repository_->BeginRead();
    return repository_->GetEvent(*tx, key, event_id);
  });
  if (!record.has_value()) return std::nullopt;
  return FromRecord(*record);
}

std::vector<model::Event> EventStore::GetRange(const std::string& bucket_id, int64_t limit, const TimeRange& range) {
  const auto key = directory_->Resolve(bucket_id);
  if (limit == 0) return {};

  auto query  = ToQuery(key, range);
  query.limit = static_cast<uint64_t>(limit < 0 ? kUnboundedLimit : std::min(limit, kUnboundedLimit));

  auto records = WithBackend("list events in bucket " + bucket_id, [&] {
    auto tx = repository_->BeginRead();
    return repository_->ListEvents(*tx, query);
  });

  std::vector<model::Event> events;
  events.reserve(records.size());
  for (const auto& record : records) {
    events.push_back(Clip(FromRecord(record), range));
  }
  return events;
}

uint64_t EventStore::Count(const std::string& bucket_id, const TimeRange& range) {
  const auto key   = directory_->Resolve(bucket_id);
  const auto query = ToQuery(key, range);

  return WithBackend("count events in bucket " + bucket_id, [&] {
    auto tx = repository_->BeginRead();
    return repository_->CountEvents(*tx, query);
  });
}

model::Event EventStore::InsertOne(const std::string& bucket_id, const model::Event& event) {
  if (event.id.has_value()) {
    throw util::ValidationError("insert into bucket " + bucket_id + ": event already has id " + std::to_string(*event.id));
  }

  db::model::EventRecord record;
  WriteToBucket(bucket_id, [&](int64_t key) {
    record = ToRecord(key, event);
    WithBackend("insert event into bucket " + bucket_id, [&] {
      auto tx     = repository_->Begin();
      auto result = repository_->InsertEvent(*tx, record);
      if (result.code == db::ErrorCode::NotFound) throw util::BucketNotFound(bucket_id);
      ThrowIfDbError(result, "insert event into bucket " + bucket_id);
      tx->Commit();
    });
  });

  auto stored = event;
  stored.id   = record.id;
  return stored;
}

void EventStore::UpdateIn(db::Transaction& tx, const std::string& bucket_id, int64_t bucket_key, model::EventId event_id,
                          const model::Event& event) {
  auto record = ToRecord(bucket_key, event);
  record.id   = event_id;

  auto result = repository_->UpdateEvent(tx, record);
  if (result.code == db::ErrorCode::NotFound) {
    throw util::EventNotFound(EventContext(bucket_id, event_id) + " not found");
  }
  ThrowIfDbError(result, "replace " + EventContext(bucket_id, event_id));
}

void EventStore::InsertMany(const std::string& bucket_id, const std::vector<model::EventWrite>& writes) {
  std::vector<db::model::EventRecord> pending;

  WriteToBucket(bucket_id, [&](int64_t key) {
    pending.clear();
    for (const auto& write : writes) {
      if (const auto* p = std::get_if<model::PendingEvent>(&write)) {
        pending.push_back(ToRecord(key, p->event));
      }
    }

    WithBackend("insert events into bucket " + bucket_id, [&] {
      auto tx = repository_->Begin();

      for (const auto& write : writes) {
        if (const auto* persisted = std::get_if<model::PersistedEvent>(&write)) {
          UpdateIn(*tx, bucket_id, key, persisted->id, persisted->event);
        }
      }

      for (std::size_t offset = 0; offset < pending.size(); offset += options_.insert_chunk_size) {
        const auto end = std::min(pending.size(), offset + options_.insert_chunk_size);
        std::vector<db::model::EventRecord> chunk(pending.begin() + static_cast<std::ptrdiff_t>(offset),
                                                  pending.begin() + static_cast<std::ptrdiff_t>(end));

        auto result = repository_->InsertEvents(*tx, chunk);
        if (result.code == db::ErrorCode::NotFound) throw util::BucketNotFound(bucket_id);
        ThrowIfDbError(result, "insert events into bucket " + bucket_id);
      }

      tx->Commit();
    });
  });

  TEMPO_LOG_DEBUG("events written", {observability::StringField("bucket_id", bucket_id),
                                     observability::IntField("inserted", static_cast<int64_t>(pending.size())),
                                     observability::IntField("replaced", static_cast<int64_t>(writes.size() - pending.size()))});
}

model::Event EventStore::Replace(const std::string& bucket_id, model::EventId event_id, const model::Event& event) {
  const auto key = directory_->Resolve(bucket_id);

  WithBackend("replace " + EventContext(bucket_id, event_id), [&] {
    auto tx = repository_->Begin();
    UpdateIn(*tx, bucket_id, key, event_id, event);
    tx->Commit();
  });

  auto stored = event;
  stored.id   = event_id;
  return stored;
}

model::Event EventStore::ReplaceLast(const std::string& bucket_id, const model::Event& event) {
  const auto key = directory_->Resolve(bucket_id);

  auto           bucket_mutex = BucketMutex(key);
  model::EventId event_id     = 0;
  try {
    std::lock_guard<std::mutex> bucket_lock(*bucket_mutex);

    event_id = WithBackend("replace last event in bucket " + bucket_id, [&] {
      auto tx   = repository_->Begin();
      auto last = repository_->GetLastEvent(*tx, key);
      if (!last.has_value()) {
        throw util::EventNotFound("replace last: bucket " + bucket_id + " has no events");
      }
      UpdateIn(*tx, bucket_id, key, last->id, event);
      tx->Commit();
      return last->id;
    });
  } catch (...) {
    ReleaseBucketMutex(key, bucket_mutex);
    throw;
  }
  ReleaseBucketMutex(key, bucket_mutex);

  TEMPO_LOG_DEBUG("last event replaced", {observability::StringField("bucket_id", bucket_id), observability::IntField("event_id", event_id)});

  auto stored = event;
  stored.id   = event_id;
  return stored;
}

bool EventStore::Delete(const std::string& bucket_id, model::EventId event_id) {
  const auto key = directory_->Resolve(bucket_id);

  return WithBackend("delete " + EventContext(bucket_id, event_id), [&] {
    auto tx     = repository_->Begin();
    auto result = repository_->DeleteEvent(*tx, key, event_id);
    if (result.code == db::ErrorCode::NotFound) return false;
    ThrowIfDbError(result, "delete " + EventContext(bucket_id, event_id));
    tx->Commit();
    return true;
  });
}

std::optional<model::Event> EventStore::GetLastOnDay(const std::string& bucket_id, util::TimePoint day) {
  const auto key   = directory_->Resolve(bucket_id);
  const auto start = util::StartOfDayUtc(day);

  db::EventQuery query;
  query.bucket_key       = key;
  query.min_timestamp_us = util::ToUnixMicros(start);
  query.end_us           = util::ToUnixMicros(start + std::chrono::hours(24)) - 1;
  query.limit            = 1;

  auto records = WithBackend("last event on day in bucket " + bucket_id, [&] {
    auto tx = repository_->BeginRead();
    return repository_->ListEvents(*tx, query);
  });
  if (records.empty()) return std::nullopt;
  return FromRecord(records.front());
}

} // namespace tempo::core
