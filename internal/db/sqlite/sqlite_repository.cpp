#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <optional>
#include <type_traits>

#include "internal/db/sql/sql_queries.hpp"

namespace tempo::db::sqlite {

using tempo::db::ErrorCode;
using tempo::db::Result;

namespace {

constexpr auto kDialect = sql::Dialect::kSqlite;

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptI64(sqlite3_stmt* st, int idx, const std::optional<int64_t>& v) {
    if (v.has_value()) {
        BindI64(st, idx, *v);
    } else {
        sqlite3_bind_null(st, idx);
    }
}

void BindParams(sqlite3_stmt* st, const std::vector<int64_t>& params) {
    int idx = 1;
    for (int64_t p : params) BindI64(st, idx++, p);
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

model::BucketRecord ReadBucket(sqlite3_stmt* st) {
    model::BucketRecord r;
    r.key        = ColI64(st, 0);
    r.id         = ColText(st, 1);
    r.name       = ColText(st, 2);
    r.type       = ColText(st, 3);
    r.client     = ColText(st, 4);
    r.hostname   = ColText(st, 5);
    r.created_us = ColI64(st, 6);
    return r;
}

model::EventRecord ReadEvent(sqlite3_stmt* st) {
    model::EventRecord r;
    r.id           = ColI64(st, 0);
    r.bucket_key   = ColI64(st, 1);
    r.timestamp_us = ColI64(st, 2);
    r.duration_us  = ColI64(st, 3);
    r.data         = ColText(st, 4);
    return r;
}

model::AccountRecord ReadAccount(sqlite3_stmt* st) {
    model::AccountRecord r;
    r.id            = ColI64(st, 0);
    r.device_id     = ColText(st, 1);
    r.name          = ColText(st, 2);
    r.email         = ColText(st, 3);
    r.access_token  = ColText(st, 4);
    r.refresh_token = ColText(st, 5);
    if (sqlite3_column_type(st, 6) != SQLITE_NULL) r.last_used_at_us = ColI64(st, 6);
    return r;
}

model::ReportRecord ReadReport(sqlite3_stmt* st) {
    model::ReportRecord r;
    r.id         = ColI64(st, 0);
    r.email      = ColText(st, 1);
    r.spent_time = sqlite3_column_double(st, 2);
    r.call_time  = sqlite3_column_double(st, 3);
    r.date_us    = ColI64(st, 4);
    r.wfh        = sqlite3_column_int(st, 5) != 0;
    return r;
}

// Steps a read statement. Throws on anything but ROW / DONE.
bool NextRow(sqlite3* db, sqlite3_stmt* st) {
    int rc = sqlite3_step(st);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw DbError(rc == SQLITE_BUSY || rc == SQLITE_LOCKED ? ErrorCode::Busy : ErrorCode::InternalError, sqlite3_errmsg(db));
}

template <typename Fn>
std::vector<std::invoke_result_t<Fn, sqlite3_stmt*>> ReadAll(sqlite3* db, sqlite3_stmt* st, Fn read) {
    std::vector<std::invoke_result_t<Fn, sqlite3_stmt*>> out;
    while (NextRow(db, st)) out.push_back(read(st));
    return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)),
      readers_(std::make_shared<SqliteReaderPool>(db_->Path(), db_->BusyTimeout())) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_, TxMode::ReadWrite);
}

std::unique_ptr<db::Transaction> SqliteRepository::BeginRead() {
    return std::make_unique<SqliteTransaction>(readers_->Acquire(), TxMode::ReadOnly);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            if (sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_FOREIGNKEY)
                return Result::Err(ErrorCode::NotFound, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Buckets
// ------------------------------------------------------------------

Result SqliteRepository::InsertBucket(Transaction& t, model::BucketRecord& r) {
    auto& tx = TX(t);
    tx.RequireWrite();
    auto* db = tx.Handle();

    auto st = tx.DB().Prepare(sql::INSERT_BUCKET);
    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.name);
    BindText(st.get(), 3, r.type);
    BindText(st.get(), 4, r.client);
    BindText(st.get(), 5, r.hostname);
    BindI64(st.get(), 6, r.created_us);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_ROW) {
        auto res = Translate(db, rc);
        if (res.code == ErrorCode::ConstraintViolation)
            return Result::Err(ErrorCode::AlreadyExists, "bucket id exists: " + r.id);
        return res;
    }
    r.key = ColI64(st.get(), 0);
    return Result::Ok();
}

std::optional<model::BucketRecord>
SqliteRepository::GetBucket(Transaction& t, const std::string& id) {
    auto& tx = TX(t);
    auto  st = tx.DB().Prepare(sql::SELECT_BUCKET);
    BindText(st.get(), 1, id);

    if (!NextRow(tx.Handle(), st.get())) return std::nullopt;
    return ReadBucket(st.get());
}

std::vector<model::BucketRecord> SqliteRepository::ListBuckets(Transaction& t) {
    auto& tx = TX(t);
    auto  st = tx.DB().Prepare(sql::SELECT_BUCKETS);
    return ReadAll(tx.Handle(), st.get(), ReadBucket);
}

Result SqliteRepository::DeleteBucket(Transaction& t, int64_t bucket_key) {
    auto& tx = TX(t);
    tx.RequireWrite();
    auto* db = tx.Handle();

    auto st = tx.DB().Prepare(sql::DELETE_BUCKET);
    BindI64(st.get(), 1, bucket_key);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "bucket key " + std::to_string(bucket_key));
    return Result::Ok();
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result SqliteRepository::InsertEvent(Transaction& t, model::EventRecord& r) {
    auto& tx = TX(t);
    tx.RequireWrite();
    auto* db = tx.Handle();

    auto st = tx.DB().Prepare(sql::BuildInsertEvents(kDialect, 1));
    BindI64(st.get(), 1, r.bucket_key);
    BindI64(st.get(), 2, r.timestamp_us);
    BindI64(st.get(), 3, r.duration_us);
    BindText(st.get(), 4, r.data);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_ROW) return Translate(db, rc);
    r.id = ColI64(st.get(), 0);
    return Result::Ok();
}

Result SqliteRepository::InsertEvents(Transaction& t, const std::vector<model::EventRecord>& records) {
    if (records.empty()) return Result::Ok();

    auto& tx = TX(t);
    tx.RequireWrite();
    auto* db = tx.Handle();

    auto st = tx.DB().Prepare(sql::BuildInsertEvents(kDialect, records.size()));
    int  idx = 1;
    for (const auto& r : records) {
        BindI64(st.get(), idx++, r.bucket_key);
        BindI64(st.get(), idx++, r.timestamp_us);
        BindI64(st.get(), idx++, r.duration_us);
        BindText(st.get(), idx++, r.data);
    }

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE && rc != SQLITE_ROW) return Translate(db, rc);
    return Result::Ok();
}

std::optional<model::EventRecord>
SqliteRepository::GetEvent(Transaction& t, int64_t bucket_key, int64_t event_id) {
    auto& tx = TX(t);
    auto  st = tx.DB().Prepare(sql::BuildGetEvent(kDialect));
    BindI64(st.get(), 1, bucket_key);
    BindI64(st.get(), 2, event_id);

    if (!NextRow(tx.Handle(), st.get())) return std::nullopt;
    return ReadEvent(st.get());
}

std::optional<model::EventRecord> SqliteRepository::GetLastEvent(Transaction& t, int64_t bucket_key) {
    auto& tx = TX(t);
    auto  st = tx.DB().Prepare(sql::BuildGetLastEvent(kDialect));
    BindI64(st.get(), 1, bucket_key);

    if (!NextRow(tx.Handle(), st.get())) return std::nullopt;
    return ReadEvent(st.get());
}

std::vector<model::EventRecord> SqliteRepository::ListEvents(Transaction& t, const EventQuery& query) {
    auto& tx    = TX(t);
    auto  built = sql::BuildListEvents(kDialect, query);
    auto  st    = tx.DB().Prepare(built.sql);
    BindParams(st.get(), built.params);
    return ReadAll(tx.Handle(), st.get(), ReadEvent);
}

uint64_t SqliteRepository::CountEvents(Transaction& t, const EventQuery& query) {
    auto& tx    = TX(t);
    auto  built = sql::BuildCountEvents(kDialect, query);
    auto  st    = tx.DB().Prepare(built.sql);
    BindParams(st.get(), built.params);

    if (!NextRow(tx.Handle(), st.get())) return 0;
    return static_cast<uint64_t>(ColI64(st.get(), 0));
}

Result SqliteRepository::UpdateEvent(Transaction& t, const model::EventRecord& r) {
    auto& tx = TX(t);
    tx.RequireWrite();
    auto* db = tx.Handle();

    auto st = tx.DB().Prepare(sql::BuildUpdateEvent(kDialect));
    BindI64(st.get(), 1, r.timestamp_us);
    BindI64(st.get(), 2, r.duration_us);
    BindText(st.get(), 3, r.data);
    BindI64(st.get(), 4, r.bucket_key);
    BindI64(st.get(), 5, r.id);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "event " + std::to_string(r.id));
    return Result::Ok();
}

Result SqliteRepository::DeleteEvent(Transaction& t, int64_t bucket_key, int64_t event_id) {
    auto& tx = TX(t);
    tx.RequireWrite();
    auto* db = tx.Handle();

    auto st = tx.DB().Prepare(sql::DELETE_EVENT);
    BindI64(st.get(), 1, bucket_key);
    BindI64(st.get(), 2, event_id);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "event " + std::to_string(event_id));
    return Result::Ok();
}

Result SqliteRepository::DeleteBucketEvents(Transaction& t, int64_t bucket_key) {
    auto& tx = TX(t);
    tx.RequireWrite();

    auto st = tx.DB().Prepare(sql::DELETE_BUCKET_EVENTS);
    BindI64(st.get(), 1, bucket_key);
    return Translate(tx.Handle(), sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Accounts
// ------------------------------------------------------------------

Result SqliteRepository::InsertAccount(Transaction& t, model::AccountRecord& r) {
    auto& tx = TX(t);
    tx.RequireWrite();
    auto* db = tx.Handle();

    auto st = tx.DB().Prepare(sql::INSERT_ACCOUNT);
    BindText(st.get(), 1, r.device_id);
    BindText(st.get(), 2, r.name);
    BindText(st.get(), 3, r.email);
    BindText(st.get(), 4, r.access_token);
    BindText(st.get(), 5, r.refresh_token);
    BindOptI64(st.get(), 6, r.last_used_at_us);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_ROW) return Translate(db, rc);
    r.id = ColI64(st.get(), 0);
    return Result::Ok();
}

Result SqliteRepository::DeleteAccountsByEmail(Transaction& t, const std::string& email) {
    auto& tx = TX(t);
    tx.RequireWrite();

    auto st = tx.DB().Prepare(sql::DELETE_ACCOUNTS_BY_EMAIL);
    BindText(st.get(), 1, email);
    return Translate(tx.Handle(), sqlite3_step(st.get()));
}

std::optional<model::AccountRecord>
SqliteRepository::GetAccountByEmail(Transaction& t, const std::string& email) {
    auto& tx = TX(t);
    auto  st = tx.DB().Prepare(sql::SELECT_ACCOUNT_BY_EMAIL);
    BindText(st.get(), 1, email);

    if (!NextRow(tx.Handle(), st.get())) return std::nullopt;
    return ReadAccount(st.get());
}

std::vector<model::AccountRecord>
SqliteRepository::ListAccounts(Transaction& t, std::optional<int64_t> used_since_us) {
    auto& tx = TX(t);
    auto  st = tx.DB().Prepare(used_since_us ? sql::SELECT_ACCOUNTS_USED_SINCE : sql::SELECT_ACCOUNTS);
    if (used_since_us) BindI64(st.get(), 1, *used_since_us);
    return ReadAll(tx.Handle(), st.get(), ReadAccount);
}

// ------------------------------------------------------------------
// Reports
// ------------------------------------------------------------------

Result SqliteRepository::InsertReport(Transaction& t, model::ReportRecord& r) {
    auto& tx = TX(t);
    tx.RequireWrite();
    auto* db = tx.Handle();

    auto st = tx.DB().Prepare(sql::INSERT_REPORT);
    BindText(st.get(), 1, r.email);
    sqlite3_bind_double(st.get(), 2, r.spent_time);
    sqlite3_bind_double(st.get(), 3, r.call_time);
    BindI64(st.get(), 4, r.date_us);
    sqlite3_bind_int(st.get(), 5, r.wfh ? 1 : 0);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_ROW) return Translate(db, rc);
    r.id = ColI64(st.get(), 0);
    return Result::Ok();
}

Result SqliteRepository::DeleteReports(Transaction& t, const std::string& email, const ReportWindow& window) {
    auto& tx = TX(t);
    tx.RequireWrite();

    auto st = tx.DB().Prepare(sql::DELETE_REPORTS);
    BindText(st.get(), 1, email);
    BindI64(st.get(), 2, window.from_us);
    BindI64(st.get(), 3, window.to_us);
    return Translate(tx.Handle(), sqlite3_step(st.get()));
}

std::optional<model::ReportRecord>
SqliteRepository::GetReport(Transaction& t, const std::string& email, const ReportWindow& window) {
    auto& tx = TX(t);
    auto  st = tx.DB().Prepare(sql::SELECT_REPORT);
    BindText(st.get(), 1, email);
    BindI64(st.get(), 2, window.from_us);
    BindI64(st.get(), 3, window.to_us);

    if (!NextRow(tx.Handle(), st.get())) return std::nullopt;
    return ReadReport(st.get());
}

} // namespace tempo::db::sqlite
