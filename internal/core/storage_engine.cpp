#include "storage_engine.hpp"

namespace tempo::core {

namespace {

BucketDirectoryOptions WithClock(BucketDirectoryOptions options, const util::NowFn& now) {
  if (!options.now) options.now = now;
  return options;
}

} // namespace

StorageEngine::StorageEngine(std::shared_ptr<db::Repository> repository, StorageEngineOptions options)
    : repository_(std::move(repository)),
      directory_(std::make_shared<BucketDirectory>(repository_, WithClock(options.buckets, options.now))),
      events_(repository_, directory_, options.events),
      accounts_(repository_, options.now),
      reports_(repository_) {
}

std::string StorageEngine::BackendName() const {
  return repository_->BackendName();
}

model::BucketMetadata StorageEngine::CreateBucket(const std::string& id, const std::string& type, const std::string& client,
                                                  const std::string& hostname, util::TimePoint created, const std::optional<std::string>& name) {
  return directory_->Create(id, type, client, hostname, created, name);
}

void StorageEngine::DeleteBucket(const std::string& id) {
  directory_->Delete(id);
}

model::BucketMetadata StorageEngine::GetMetadata(const std::string& id) {
  return directory_->GetMetadata(id);
}

std::map<std::string, model::BucketMetadata> StorageEngine::Buckets() {
  return directory_->List();
}

std::optional<model::Event> StorageEngine::GetEvent(const std::string& bucket_id, model::EventId event_id) {
  return events_.Get(bucket_id, event_id);
}

std::vector<model::Event> StorageEngine::GetEvents(const std::string& bucket_id, int64_t limit, const TimeRange& range) {
  return events_.GetRange(bucket_id, limit, range);
}

uint64_t StorageEngine::GetEventCount(const std::string& bucket_id, const TimeRange& range) {
  return events_.Count(bucket_id, range);
}

model::Event StorageEngine::InsertOne(const std::string& bucket_id, const model::Event& event) {
  return events_.InsertOne(bucket_id, event);
}

void StorageEngine::InsertMany(const std::string& bucket_id, const std::vector<model::EventWrite>& writes) {
  events_.InsertMany(bucket_id, writes);
}

model::Event StorageEngine::Replace(const std::string& bucket_id, model::EventId event_id, const model::Event& event) {
  return events_.Replace(bucket_id, event_id, event);
}

model::Event StorageEngine::ReplaceLast(const std::string& bucket_id, const model::Event& event) {
  return events_.ReplaceLast(bucket_id, event);
}

bool StorageEngine::DeleteEvent(const std::string& bucket_id, model::EventId event_id) {
  return events_.Delete(bucket_id, event_id);
}

std::optional<model::Event> StorageEngine::GetLastEventOnDay(const std::string& bucket_id, util::TimePoint day) {
  return events_.GetLastOnDay(bucket_id, day);
}

} // namespace tempo::core
