#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace tempo::db::memory {

class MemoryTransaction;

/*
  In-process backend.

  Writers are serialized by a timed writer lock (same contract as the
  sqlite busy timeout: waiting longer than busy_timeout fails with Busy).
  Readers copy the committed snapshot and never wait for writers.
*/
class MemoryRepository final : public db::Repository {
public:
  explicit MemoryRepository(std::chrono::milliseconds busy_timeout = std::chrono::milliseconds(5000));

  std::string BackendName() const override {
    return "memory";
  }

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginRead() override;

  Result InsertBucket(Transaction&, model::BucketRecord&) override;
  std::optional<model::BucketRecord> GetBucket(Transaction&, const std::string& id) override;
  std::vector<model::BucketRecord> ListBuckets(Transaction&) override;
  Result DeleteBucket(Transaction&, int64_t bucket_key) override;

  Result InsertEvent(Transaction&, model::EventRecord&) override;
  Result InsertEvents(Transaction&, const std::vector<model::EventRecord>&) override;
  std::optional<model::EventRecord> GetEvent(Transaction&, int64_t bucket_key, int64_t event_id) override;
  std::optional<model::EventRecord> GetLastEvent(Transaction&, int64_t bucket_key) override;
  std::vector<model::EventRecord> ListEvents(Transaction&, const EventQuery& query) override;
  uint64_t CountEvents(Transaction&, const EventQuery& query) override;
  Result UpdateEvent(Transaction&, const model::EventRecord&) override;
  Result DeleteEvent(Transaction&, int64_t bucket_key, int64_t event_id) override;
  Result DeleteBucketEvents(Transaction&, int64_t bucket_key) override;

  Result InsertAccount(Transaction&, model::AccountRecord&) override;
  Result DeleteAccountsByEmail(Transaction&, const std::string& email) override;
  std::optional<model::AccountRecord> GetAccountByEmail(Transaction&, const std::string& email) override;
  std::vector<model::AccountRecord> ListAccounts(Transaction&, std::optional<int64_t> used_since_us) override;

  Result InsertReport(Transaction&, model::ReportRecord&) override;
  Result DeleteReports(Transaction&, const std::string& email, const ReportWindow& window) override;
  std::optional<model::ReportRecord> GetReport(Transaction&, const std::string& email, const ReportWindow& window) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::BucketRecord> buckets;  // by public id
    std::unordered_map<int64_t, std::string>             bucket_ids;  // key -> public id

    // bucket key -> (event id -> row)
    std::unordered_map<int64_t, std::map<int64_t, model::EventRecord>> events;

    std::map<int64_t, model::AccountRecord> accounts;
    std::map<int64_t, model::ReportRecord>  reports;

    int64_t next_bucket_key = 1;
    int64_t next_event_id   = 1;
    int64_t next_account_id = 1;
    int64_t next_report_id  = 1;
  };

  std::chrono::milliseconds busy_timeout_;

  std::timed_mutex writer_mutex_;  // held for the lifetime of a ReadWrite transaction
  std::mutex       state_mutex_;   // guards committed_
  State            committed_;
};

}
