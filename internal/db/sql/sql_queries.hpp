#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "internal/db/api/types.hpp"

namespace tempo::db::sql {

/*
  SQL shared by the sqlite and postgres repositories.

  Fixed statements are written in the common subset and use `?`
  placeholders; postgres runs them through Numbered() first.

  Dynamic statements (event listing, bulk insert) are built per dialect.
*/

enum class Dialect {
  kSqlite,
  kPostgres,
};

// Rewrites `?` placeholders as $1, $2, ... (quoted literals are left alone).
std::string Numbered(const std::string& sql);

// buckets

static constexpr const char* INSERT_BUCKET =
    "INSERT INTO buckets(id,name,type,client,hostname,created_us)"
    " VALUES(?,?,?,?,?,?) RETURNING bucket_key;";

static constexpr const char* SELECT_BUCKET =
    "SELECT bucket_key,id,name,type,client,hostname,created_us"
    " FROM buckets WHERE id=?;";

static constexpr const char* SELECT_BUCKETS =
    "SELECT bucket_key,id,name,type,client,hostname,created_us"
    " FROM buckets ORDER BY bucket_key;";

static constexpr const char* DELETE_BUCKET =
    "DELETE FROM buckets WHERE bucket_key=?;";

// events

static constexpr const char* DELETE_EVENT =
    "DELETE FROM events WHERE bucket_key=? AND id=?;";

static constexpr const char* DELETE_BUCKET_EVENTS =
    "DELETE FROM events WHERE bucket_key=?;";

// accounts

static constexpr const char* INSERT_ACCOUNT =
    "INSERT INTO accounts(device_id,name,email,access_token,refresh_token,last_used_at_us)"
    " VALUES(?,?,?,?,?,?) RETURNING id;";

static constexpr const char* DELETE_ACCOUNTS_BY_EMAIL =
    "DELETE FROM accounts WHERE email=?;";

static constexpr const char* SELECT_ACCOUNT_BY_EMAIL =
    "SELECT id,device_id,name,email,access_token,refresh_token,last_used_at_us"
    " FROM accounts WHERE email=?;";

static constexpr const char* SELECT_ACCOUNTS =
    "SELECT id,device_id,name,email,access_token,refresh_token,last_used_at_us"
    " FROM accounts ORDER BY id;";

static constexpr const char* SELECT_ACCOUNTS_USED_SINCE =
    "SELECT id,device_id,name,email,access_token,refresh_token,last_used_at_us"
    " FROM accounts WHERE last_used_at_us>=? ORDER BY id;";

// reports

static constexpr const char* INSERT_REPORT =
    "INSERT INTO reports(email,spent_time,call_time,date_us,wfh)"
    " VALUES(?,?,?,?,?) RETURNING id;";

static constexpr const char* DELETE_REPORTS =
    "DELETE FROM reports WHERE email=? AND date_us>=? AND date_us<?;";

static constexpr const char* SELECT_REPORT =
    "SELECT id,email,spent_time,call_time,date_us,wfh"
    " FROM reports WHERE email=? AND date_us>=? AND date_us<?"
    " ORDER BY id DESC LIMIT 1;";

/*
  Event statements. Columns are always
    id, bucket_key, timestamp_us, duration_us, data
  and `data` comes back as text on both engines.
*/

struct BuiltQuery {
  std::string          sql;
  std::vector<int64_t> params;  // bound in order
};

std::string SelectEventColumns(Dialect dialect);

// (bucket_key, id)
std::string BuildGetEvent(Dialect dialect);

// (bucket_key); newest row first.
std::string BuildGetLastEvent(Dialect dialect);

// (timestamp_us, duration_us, data, bucket_key, id)
std::string BuildUpdateEvent(Dialect dialect);

// One VALUES tuple per row: (bucket_key, timestamp_us, duration_us, data).
// Single-row form ends with RETURNING id.
std::string BuildInsertEvents(Dialect dialect, std::size_t rows);

BuiltQuery BuildListEvents(Dialect dialect, const EventQuery& query);
BuiltQuery BuildCountEvents(Dialect dialect, const EventQuery& query);

} // namespace tempo::db::sql
