#include "pg_repository.hpp"

#include <type_traits>
#include <unordered_map>

#include "internal/db/sql/sql_queries.hpp"

namespace tempo::db::postgres {

namespace {

constexpr auto kDialect = sql::Dialect::kPostgres;

// Fixed statements are shared with sqlite; number their placeholders once.
const std::string& Q(const char* shared_sql) {
  thread_local std::unordered_map<const char*, std::string> cache;
  auto it = cache.find(shared_sql);
  if (it == cache.end()) it = cache.emplace(shared_sql, sql::Numbered(shared_sql)).first;
  return it->second;
}

std::string Text(const pqxx::field& f) {
  return f.is_null() ? "" : f.c_str();
}

model::BucketRecord ReadBucket(const pqxx::row& row) {
  model::BucketRecord r;
  r.key        = row[0].as<int64_t>();
  r.id         = Text(row[1]);
  r.name       = Text(row[2]);
  r.type       = Text(row[3]);
  r.client     = Text(row[4]);
  r.hostname   = Text(row[5]);
  r.created_us = row[6].as<int64_t>();
  return r;
}

model::EventRecord ReadEvent(const pqxx::row& row) {
  model::EventRecord r;
  r.id           = row[0].as<int64_t>();
  r.bucket_key   = row[1].as<int64_t>();
  r.timestamp_us = row[2].as<int64_t>();
  r.duration_us  = row[3].as<int64_t>();
  r.data         = Text(row[4]);
  return r;
}

model::AccountRecord ReadAccount(const pqxx::row& row) {
  model::AccountRecord r;
  r.id            = row[0].as<int64_t>();
  r.device_id     = Text(row[1]);
  r.name          = Text(row[2]);
  r.email         = Text(row[3]);
  r.access_token  = Text(row[4]);
  r.refresh_token = Text(row[5]);
  if (!row[6].is_null()) r.last_used_at_us = row[6].as<int64_t>();
  return r;
}

model::ReportRecord ReadReport(const pqxx::row& row) {
  model::ReportRecord r;
  r.id         = row[0].as<int64_t>();
  r.email      = Text(row[1]);
  r.spent_time = row[2].as<double>();
  r.call_time  = row[3].as<double>();
  r.date_us    = row[4].as<int64_t>();
  r.wfh        = row[5].as<bool>();
  return r;
}

template <typename Fn>
std::vector<std::invoke_result_t<Fn, const pqxx::row&>> ReadAll(const pqxx::result& res, Fn read) {
  std::vector<std::invoke_result_t<Fn, const pqxx::row&>> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(read(row));
  }
  return out;
}

pqxx::params ToParams(const std::vector<int64_t>& values) {
  pqxx::params params;
  for (int64_t v : values) params.append(v);
  return params;
}

// Read paths return values, so driver errors become DbError here.
template <typename Fn>
auto Read(Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const pqxx::broken_connection& e) {
    throw DbError(ErrorCode::Unavailable, e.what());
  } catch (const pqxx::sql_error& e) {
    throw DbError(ErrorCode::InternalError, e.what());
  }
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_, TxMode::ReadWrite);
}

std::unique_ptr<db::Transaction> PgRepository::BeginRead() {
  return std::make_unique<PgTransaction>(pool_, TxMode::ReadOnly);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::foreign_key_violation*>(&e)) {
    return Result::Err(ErrorCode::NotFound, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::Busy, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::Unavailable, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Buckets
// ------------------------------------------------------------------

Result PgRepository::InsertBucket(Transaction& t, model::BucketRecord& r) {
  TX(t).RequireWrite();
  try {
    auto res = TX(t).Work().exec_params(Q(sql::INSERT_BUCKET), r.id, r.name, r.type, r.client, r.hostname, r.created_us);
    r.key    = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const pqxx::unique_violation&) {
    return Result::Err(ErrorCode::AlreadyExists, "bucket id exists: " + r.id);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::BucketRecord> PgRepository::GetBucket(Transaction& t, const std::string& id) {
  return Read([&]() -> std::optional<model::BucketRecord> {
    auto res = TX(t).Work().exec_params(Q(sql::SELECT_BUCKET), id);
    if (res.empty()) return std::nullopt;
    return ReadBucket(res[0]);
  });
}

std::vector<model::BucketRecord> PgRepository::ListBuckets(Transaction& t) {
  return Read([&] { return ReadAll(TX(t).Work().exec(sql::SELECT_BUCKETS), ReadBucket); });
}

Result PgRepository::DeleteBucket(Transaction& t, int64_t bucket_key) {
  TX(t).RequireWrite();
  try {
    auto res = TX(t).Work().exec_params(Q(sql::DELETE_BUCKET), bucket_key);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "bucket key " + std::to_string(bucket_key));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result PgRepository::InsertEvent(Transaction& t, model::EventRecord& r) {
  TX(t).RequireWrite();
  try {
    auto res = TX(t).Work().exec_params(sql::BuildInsertEvents(kDialect, 1), r.bucket_key, r.timestamp_us, r.duration_us, r.data);
    r.id     = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertEvents(Transaction& t, const std::vector<model::EventRecord>& records) {
  if (records.empty()) return Result::Ok();

  TX(t).RequireWrite();
  pqxx::params params;
  for (const auto& r : records) {
    params.append(r.bucket_key);
    params.append(r.timestamp_us);
    params.append(r.duration_us);
    params.append(r.data);
  }

  try {
    TX(t).Work().exec_params(sql::BuildInsertEvents(kDialect, records.size()), params);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::EventRecord> PgRepository::GetEvent(Transaction& t, int64_t bucket_key, int64_t event_id) {
  return Read([&]() -> std::optional<model::EventRecord> {
    auto res = TX(t).Work().exec_params(sql::BuildGetEvent(kDialect), bucket_key, event_id);
    if (res.empty()) return std::nullopt;
    return ReadEvent(res[0]);
  });
}

std::optional<model::EventRecord> PgRepository::GetLastEvent(Transaction& t, int64_t bucket_key) {
  return Read([&]() -> std::optional<model::EventRecord> {
    auto res = TX(t).Work().exec_params(sql::BuildGetLastEvent(kDialect), bucket_key);
    if (res.empty()) return std::nullopt;
    return ReadEvent(res[0]);
  });
}

std::vector<model::EventRecord> PgRepository::ListEvents(Transaction& t, const EventQuery& query) {
  auto built = sql::BuildListEvents(kDialect, query);
  return Read([&] { return ReadAll(TX(t).Work().exec_params(built.sql, ToParams(built.params)), ReadEvent); });
}

uint64_t PgRepository::CountEvents(Transaction& t, const EventQuery& query) {
  auto built = sql::BuildCountEvents(kDialect, query);
  return Read([&] { return TX(t).Work().exec_params(built.sql, ToParams(built.params))[0][0].as<uint64_t>(); });
}

Result PgRepository::UpdateEvent(Transaction& t, const model::EventRecord& r) {
  TX(t).RequireWrite();
  try {
    auto res = TX(t).Work().exec_params(sql::BuildUpdateEvent(kDialect), r.timestamp_us, r.duration_us, r.data, r.bucket_key, r.id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "event " + std::to_string(r.id));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteEvent(Transaction& t, int64_t bucket_key, int64_t event_id) {
  TX(t).RequireWrite();
  try {
    auto res = TX(t).Work().exec_params(Q(sql::DELETE_EVENT), bucket_key, event_id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "event " + std::to_string(event_id));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteBucketEvents(Transaction& t, int64_t bucket_key) {
  TX(t).RequireWrite();
  try {
    TX(t).Work().exec_params(Q(sql::DELETE_BUCKET_EVENTS), bucket_key);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Accounts
// ------------------------------------------------------------------

Result PgRepository::InsertAccount(Transaction& t, model::AccountRecord& r) {
  TX(t).RequireWrite();
  try {
    auto res = TX(t).Work().exec_params(Q(sql::INSERT_ACCOUNT), r.device_id, r.name, r.email, r.access_token, r.refresh_token,
                                        r.last_used_at_us);
    r.id     = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteAccountsByEmail(Transaction& t, const std::string& email) {
  TX(t).RequireWrite();
  try {
    TX(t).Work().exec_params(Q(sql::DELETE_ACCOUNTS_BY_EMAIL), email);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::AccountRecord> PgRepository::GetAccountByEmail(Transaction& t, const std::string& email) {
  return Read([&]() -> std::optional<model::AccountRecord> {
    auto res = TX(t).Work().exec_params(Q(sql::SELECT_ACCOUNT_BY_EMAIL), email);
    if (res.empty()) return std::nullopt;
    return ReadAccount(res[0]);
  });
}

std::vector<model::AccountRecord> PgRepository::ListAccounts(Transaction& t, std::optional<int64_t> used_since_us) {
  return Read([&] {
    if (used_since_us) return ReadAll(TX(t).Work().exec_params(Q(sql::SELECT_ACCOUNTS_USED_SINCE), *used_since_us), ReadAccount);
    return ReadAll(TX(t).Work().exec(sql::SELECT_ACCOUNTS), ReadAccount);
  });
}

// ------------------------------------------------------------------
// Reports
// ------------------------------------------------------------------

Result PgRepository::InsertReport(Transaction& t, model::ReportRecord& r) {
  TX(t).RequireWrite();
  try {
    auto res = TX(t).Work().exec_params(Q(sql::INSERT_REPORT), r.email, r.spent_time, r.call_time, r.date_us, r.wfh);
    r.id     = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteReports(Transaction& t, const std::string& email, const ReportWindow& window) {
  TX(t).RequireWrite();
  try {
    TX(t).Work().exec_params(Q(sql::DELETE_REPORTS), email, window.from_us, window.to_us);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ReportRecord> PgRepository::GetReport(Transaction& t, const std::string& email, const ReportWindow& window) {
  return Read([&]() -> std::optional<model::ReportRecord> {
    auto res = TX(t).Work().exec_params(Q(sql::SELECT_REPORT), email, window.from_us, window.to_us);
    if (res.empty()) return std::nullopt;
    return ReadReport(res[0]);
  });
}

} // namespace tempo::db::postgres
