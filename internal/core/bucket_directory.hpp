#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "internal/db/api/repository.hpp"
#include "internal/model/bucket.hpp"
#include "internal/util/time.hpp"

namespace tempo::core {

struct BucketDirectoryOptions {
  std::chrono::milliseconds freshness_window{5000};

  // Clock used for cache ageing; util::Now when empty.
  util::NowFn now;
};

/*
  Bucket registry plus the id -> internal key map every event operation
  goes through.

  Cache consistency model:
  - List() serves a snapshot while it is younger than freshness_window.
  - Resolve() serves a cached key while it is younger than
    freshness_window and asks the backend otherwise.
  - Create()/Delete() through this directory invalidate both synchronously
    after commit. Out-of-band writes are visible once the window elapses,
    or immediately for ids that were never cached.
*/
class BucketDirectory {
 public:
  BucketDirectory(std::shared_ptr<db::Repository> repository, BucketDirectoryOptions options);

  // DuplicateBucket if the id is taken. Name defaults to the id.
  model::BucketMetadata Create(const std::string& id, const std::string& type, const std::string& client, const std::string& hostname,
                               util::TimePoint created, const std::optional<std::string>& name = std::nullopt);

  // Removes the bucket and all of its events atomically. BucketNotFound if unknown.
  void Delete(const std::string& id);

  model::BucketMetadata GetMetadata(const std::string& id);

  std::map<std::string, model::BucketMetadata> List();

  // Internal key for an id. BucketNotFound if unknown.
  int64_t Resolve(const std::string& id);

  // Drops the cached key of one id; the next Resolve() asks the backend.
  void Forget(const std::string& id);

  void Invalidate();

 private:
  struct CachedKey {
    int64_t         key = 0;
    util::TimePoint resolved_at{};
  };

  util::TimePoint Now() const;

  std::shared_ptr<db::Repository> repository_;
  BucketDirectoryOptions          options_;

  mutable std::mutex                           mutex_;
  std::unordered_map<std::string, CachedKey>   keys_;
  std::map<std::string, model::BucketMetadata> listing_;
  std::optional<util::TimePoint>               listing_refreshed_at_;
};

} // namespace tempo::core
