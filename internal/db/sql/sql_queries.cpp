#include "sql_queries.hpp"

namespace tempo::db::sql {

namespace {

// Placeholder writer; postgres numbers them, sqlite does not.
class Binder {
 public:
  explicit Binder(Dialect dialect) : dialect_(dialect) {
  }

  std::string Next(const char* cast = "") {
    if (dialect_ == Dialect::kSqlite) return "?";
    return "$" + std::to_string(++index_) + cast;
  }

 private:
  Dialect dialect_;
  int     index_ = 0;
};

void AppendFilters(Dialect dialect, const EventQuery& query, BuiltQuery& out) {
  Binder binder(dialect);

  out.sql += " WHERE bucket_key=" + binder.Next();
  out.params.push_back(query.bucket_key);

  // interval overlap: starts before the window ends, ends after it starts
  if (query.end_us.has_value()) {
    out.sql += " AND timestamp_us<=" + binder.Next();
    out.params.push_back(*query.end_us);
  }
  if (query.start_us.has_value()) {
    out.sql += " AND timestamp_us+duration_us>=" + binder.Next();
    out.params.push_back(*query.start_us);
  }
  if (query.min_timestamp_us.has_value()) {
    out.sql += " AND timestamp_us>=" + binder.Next();
    out.params.push_back(*query.min_timestamp_us);
  }

  if (!out.sql.starts_with("SELECT COUNT")) {
    out.sql += " ORDER BY timestamp_us DESC, id DESC";
    if (query.limit.has_value()) {
      out.sql += " LIMIT " + binder.Next();
      out.params.push_back(static_cast<int64_t>(*query.limit));
    }
  }
  out.sql += ";";
}

} // namespace

std::string Numbered(const std::string& sql) {
  std::string out;
  out.reserve(sql.size() + 16);

  int  index     = 0;
  bool in_quotes = false;
  for (char c : sql) {
    if (c == '\'') in_quotes = !in_quotes;
    if (c == '?' && !in_quotes) {
      out += "$" + std::to_string(++index);
      continue;
    }
    out += c;
  }
  return out;
}

std::string SelectEventColumns(Dialect dialect) {
  if (dialect == Dialect::kPostgres) return "SELECT id,bucket_key,timestamp_us,duration_us,data::text FROM events";
  return "SELECT id,bucket_key,timestamp_us,duration_us,data FROM events";
}

std::string BuildGetEvent(Dialect dialect) {
  Binder binder(dialect);
  std::string sql = SelectEventColumns(dialect) + " WHERE bucket_key=" + binder.Next();
  sql += " AND id=" + binder.Next() + ";";
  return sql;
}

std::string BuildGetLastEvent(Dialect dialect) {
  Binder binder(dialect);
  return SelectEventColumns(dialect) + " WHERE bucket_key=" + binder.Next() + " ORDER BY timestamp_us DESC, id DESC LIMIT 1;";
}

std::string BuildUpdateEvent(Dialect dialect) {
  Binder      binder(dialect);
  std::string sql = "UPDATE events SET timestamp_us=" + binder.Next();
  sql += ",duration_us=" + binder.Next();
  sql += ",data=" + binder.Next("::jsonb");
  sql += " WHERE bucket_key=" + binder.Next();
  sql += " AND id=" + binder.Next() + ";";
  return sql;
}

std::string BuildInsertEvents(Dialect dialect, std::size_t rows) {
  Binder      binder(dialect);
  std::string sql = "INSERT INTO events(bucket_key,timestamp_us,duration_us,data) VALUES";
  for (std::size_t i = 0; i < rows; ++i) {
    if (i > 0) sql += ",";
    sql += "(" + binder.Next();
    sql += "," + binder.Next();
    sql += "," + binder.Next();
    sql += "," + binder.Next("::jsonb") + ")";
  }
  if (rows == 1) sql += " RETURNING id";
  sql += ";";
  return sql;
}

BuiltQuery BuildListEvents(Dialect dialect, const EventQuery& query) {
  BuiltQuery out;
  out.sql = SelectEventColumns(dialect);
  AppendFilters(dialect, query, out);
  return out;
}

BuiltQuery BuildCountEvents(Dialect dialect, const EventQuery& query) {
  BuiltQuery out;
  out.sql = "SELECT COUNT(*) FROM events";
  AppendFilters(dialect, query, out);
  return out;
}

} // namespace tempo::db::sql
