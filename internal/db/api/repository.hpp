#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/account_record.hpp"
#include "internal/db/model/bucket_record.hpp"
#include "internal/db/model/event_record.hpp"
#include "internal/db/model/report_record.hpp"

namespace tempo::db {

/*
  Repository abstraction.

  One implementation per backend (memory, sqlite, postgres). This is the
  only layer that knows storage-specific query syntax.

  CRITICAL GUARANTEES:

  - All writes require a ReadWrite Transaction
  - Reads inside a transaction see its writes
  - A single call is atomic
  - Event listings are ordered timestamp DESC, id DESC on every backend
  - Writes report statement failures through Result; reads throw DbError
  - Lock waits past the busy timeout throw DbError(Busy) from Begin*()

  The repository never clips, never validates payloads and never
  resolves bucket ids; that is the engine's job.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  virtual std::string BackendName() const = 0;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  virtual std::unique_ptr<Transaction> BeginRead() = 0;

  // ---------------------------------------------------------------------
  // Buckets
  // ---------------------------------------------------------------------

  // Assigns record.key. AlreadyExists / ConstraintViolation on duplicate id.
  virtual Result InsertBucket(Transaction&, model::BucketRecord&) = 0;

  virtual std::optional<model::BucketRecord> GetBucket(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::BucketRecord> ListBuckets(Transaction&) = 0;

  // NotFound if no bucket has this key. Does not touch events.
  virtual Result DeleteBucket(Transaction&, int64_t bucket_key) = 0;

  // ---------------------------------------------------------------------
  // Events
  // ---------------------------------------------------------------------

  // Assigns record.id. NotFound if the bucket key does not exist.
  virtual Result InsertEvent(Transaction&, model::EventRecord&) = 0;

  // Single multi-row statement; callers bound the batch size.
  virtual Result InsertEvents(Transaction&, const std::vector<model::EventRecord>&) = 0;

  virtual std::optional<model::EventRecord> GetEvent(Transaction&, int64_t bucket_key, int64_t event_id) = 0;

  // Event with the greatest timestamp (ties: greatest id).
  virtual std::optional<model::EventRecord> GetLastEvent(Transaction&, int64_t bucket_key) = 0;

  virtual std::vector<model::EventRecord> ListEvents(Transaction&, const EventQuery& query) = 0;

  virtual uint64_t CountEvents(Transaction&, const EventQuery& query) = 0;

  // Overwrites timestamp/duration/data of (record.bucket_key, record.id).
  // NotFound if no such row.
  virtual Result UpdateEvent(Transaction&, const model::EventRecord&) = 0;

  // NotFound if no row was removed.
  virtual Result DeleteEvent(Transaction&, int64_t bucket_key, int64_t event_id) = 0;

  virtual Result DeleteBucketEvents(Transaction&, int64_t bucket_key) = 0;

  // ---------------------------------------------------------------------
  // Accounts (credentials + usage tracking)
  // ---------------------------------------------------------------------

  // Assigns record.id. ConstraintViolation if the email is taken.
  virtual Result InsertAccount(Transaction&, model::AccountRecord&) = 0;

  virtual Result DeleteAccountsByEmail(Transaction&, const std::string& email) = 0;

  virtual std::optional<model::AccountRecord> GetAccountByEmail(Transaction&, const std::string& email) = 0;

  // used_since_us set: only accounts with last_used_at >= used_since_us.
  virtual std::vector<model::AccountRecord> ListAccounts(Transaction&, std::optional<int64_t> used_since_us) = 0;

  // ---------------------------------------------------------------------
  // Reports
  // ---------------------------------------------------------------------

  virtual Result InsertReport(Transaction&, model::ReportRecord&) = 0;

  virtual Result DeleteReports(Transaction&, const std::string& email, const ReportWindow& window) = 0;

  virtual std::optional<model::ReportRecord> GetReport(Transaction&, const std::string& email, const ReportWindow& window) = 0;
};

} // namespace tempo::db
