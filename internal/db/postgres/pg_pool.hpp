#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace tempo::db::postgres {

/*
  PgPool

  Connection factory used by PgRepository.

  Design notes:
  -------------
  - Each transaction gets its own connection.
  - libpqxx connections are NOT thread-safe -> do not share.
  - Every dataset lives in its own schema; search_path is pinned to it
    when the connection is opened, so SQL never names the schema.
  - At most max_connections are open; Acquire() blocks for a free one.

  Lifetime:
    Repository owns shared_ptr<PgPool>
    Transaction acquires shared_ptr<pqxx::connection>
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  PgPool(std::string conninfo, std::string schema, std::size_t max_connections = 16);

  // Acquire a ready-to-use connection. Throws pqxx::broken_connection.
  std::shared_ptr<pqxx::connection> Acquire();

  const std::string& Schema() const {
    return schema_;
  }

 private:
  void                              Configure(pqxx::connection& conn) const;
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  std::string schema_;
  std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace tempo::db::postgres
