#include "bucket_directory.hpp"

#include "internal/core/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace tempo::core {

namespace {

model::BucketMetadata ToMetadata(const db::model::BucketRecord& record) {
  return model::BucketMetadata{
      .id       = record.id,
      .name     = record.name,
      .type     = record.type,
      .client   = record.client,
      .hostname = record.hostname,
      .created  = util::FromUnixMicros(record.created_us),
  };
}

} // namespace

BucketDirectory::BucketDirectory(std::shared_ptr<db::Repository> repository, BucketDirectoryOptions options)
    : repository_(std::move(repository)), options_(std::move(options)) {
}

util::TimePoint BucketDirectory::Now() const {
  return options_.now ? options_.now() : util::Now();
}

model::BucketMetadata BucketDirectory::Create(const std::string& id, const std::string& type, const std::string& client,
                                              const std::string& hostname, util::TimePoint created, const std::optional<std::string>& name) {
  if (id.empty()) throw util::ValidationError("bucket id must not be empty");

  db::model::BucketRecord record;
  record.id         = id;
  record.name       = name.value_or(id);
  record.type       = type;
  record.client     = client;
  record.hostname   = hostname;
  record.created_us = util::ToUnixMicros(created);

  WithBackend("create bucket " + id, [&] {
    auto tx     = repository_->Begin();
    auto result = repository_->InsertBucket(*tx, record);
    if (result.code == db::ErrorCode::AlreadyExists || result.code == db::ErrorCode::ConstraintViolation) {
      throw util::DuplicateBucket(id);
    }
    ThrowIfDbError(result, "create bucket " + id);
    tx->Commit();
  });

  Invalidate();
  TEMPO_LOG_INFO("bucket created", {observability::StringField("bucket_id", id), observability::StringField("type", type),
                                    observability::IntField("bucket_key", record.key)});
  return ToMetadata(record);
}

void BucketDirectory::Delete(const std::string& id) {
  const auto key = Resolve(id);

  WithBackend("delete bucket " + id, [&] {
    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->DeleteBucketEvents(*tx, key), "delete events of bucket " + id);

    auto result = repository_->DeleteBucket(*tx, key);
    if (result.code == db::ErrorCode::NotFound) {
      // deleted behind our back; the cached key was stale
      Invalidate();
      throw util::BucketNotFound(id);
    }
    ThrowIfDbError(result, "delete bucket " + id);
    tx->Commit();
  });

  Invalidate();
  TEMPO_LOG_INFO("bucket deleted", {observability::StringField("bucket_id", id)});
}

model::BucketMetadata BucketDirectory::GetMetadata(const std::string& id) {
  Resolve(id);

  auto record = WithBackend("get bucket " + id, [&] {
    auto tx = repository_->BeginRead();
    return repository_->GetBucket(*tx, id);
  });
  if (!record.has_value()) {
    Invalidate();
    throw util::BucketNotFound(id);
  }
  return ToMetadata(*record);
}

std::map<std::string, model::BucketMetadata> BucketDirectory::List() {
  const auto now = Now();
  {
    std::lock_guard lock(mutex_);
    if (listing_refreshed_at_.has_value() && now - *listing_refreshed_at_ < options_.freshness_window) {
      return listing_;
    }
  }

  auto records = WithBackend("list buckets", [&] {
    auto tx = repository_->BeginRead();
    return repository_->ListBuckets(*tx);
  });

  std::map<std::string, model::BucketMetadata> listing;
  std::unordered_map<std::string, CachedKey>   keys;
  for (const auto& record : records) {
    listing.emplace(record.id, ToMetadata(record));
    keys.emplace(record.id, CachedKey{.key = record.key, .resolved_at = now});
  }

  std::lock_guard lock(mutex_);
  listing_              = listing;
  keys_                 = std::move(keys);
  listing_refreshed_at_ = now;
  TEMPO_LOG_DEBUG("bucket listing refreshed", {observability::IntField("buckets", static_cast<int64_t>(listing.size()))});
  return listing;
}

int64_t BucketDirectory::Resolve(const std::string& id) {
  const auto now = Now();
  {
    std::lock_guard lock(mutex_);
    auto            it = keys_.find(id);
    if (it != keys_.end()) {
      if (now - it->second.resolved_at < options_.freshness_window) return it->second.key;
      keys_.erase(it);
    }
  }

  auto record = WithBackend("resolve bucket " + id, [&] {
    auto tx = repository_->BeginRead();
    return repository_->GetBucket(*tx, id);
  });
  if (!record.has_value()) throw util::BucketNotFound(id);

  std::lock_guard lock(mutex_);
  keys_[id] = CachedKey{.key = record->key, .resolved_at = now};
  return record->key;
}

void BucketDirectory::Forget(const std::string& id) {
  std::lock_guard lock(mutex_);
  keys_.erase(id);
}

void BucketDirectory::Invalidate() {
  std::lock_guard lock(mutex_);
  keys_.clear();
  listing_.clear();
  listing_refreshed_at_.reset();
}

} // namespace tempo::core
