#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/bucket_directory.hpp"
#include "internal/core/event_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/records/account_store.hpp"
#include "internal/records/report_store.hpp"

namespace tempo::core {

struct StorageEngineOptions {
  BucketDirectoryOptions buckets;
  EventStoreOptions      events;
  util::NowFn            now;  // shared by every component that needs "now"
};

/*
  Single entry point over one backend.

  Owns the bucket directory, the event store and the auxiliary record
  stores, all sharing the same repository. Callers never see which
  backend is behind it apart from BackendName().
*/
class StorageEngine {
 public:
  StorageEngine(std::shared_ptr<db::Repository> repository, StorageEngineOptions options);

  std::string BackendName() const;

  // buckets

  model::BucketMetadata CreateBucket(const std::string& id, const std::string& type, const std::string& client, const std::string& hostname,
                                     util::TimePoint created, const std::optional<std::string>& name = std::nullopt);
  void                  DeleteBucket(const std::string& id);
  model::BucketMetadata GetMetadata(const std::string& id);
  std::map<std::string, model::BucketMetadata> Buckets();

  // events

  std::optional<model::Event> GetEvent(const std::string& bucket_id, model::EventId event_id);
  std::vector<model::Event>   GetEvents(const std::string& bucket_id, int64_t limit, const TimeRange& range = {});
  uint64_t                    GetEventCount(const std::string& bucket_id, const TimeRange& range = {});
  model::Event                InsertOne(const std::string& bucket_id, const model::Event& event);
  void                        InsertMany(const std::string& bucket_id, const std::vector<model::EventWrite>& writes);
  model::Event                Replace(const std::string& bucket_id, model::EventId event_id, const model::Event& event);
  model::Event                ReplaceLast(const std::string& bucket_id, const model::Event& event);
  bool                        DeleteEvent(const std::string& bucket_id, model::EventId event_id);
  std::optional<model::Event> GetLastEventOnDay(const std::string& bucket_id, util::TimePoint day);

  // auxiliary records

  records::AccountStore& Accounts() {
    return accounts_;
  }

  records::ReportStore& Reports() {
    return reports_;
  }

 private:
  std::shared_ptr<db::Repository>  repository_;
  std::shared_ptr<BucketDirectory> directory_;
  EventStore                       events_;
  records::AccountStore            accounts_;
  records::ReportStore             reports_;
};

} // namespace tempo::core
