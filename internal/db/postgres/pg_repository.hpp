#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace tempo::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::string BackendName() const override { return "postgres"; }

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

}
