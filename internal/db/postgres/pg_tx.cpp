#include "pg_tx.hpp"

#include "internal/db/api/result.hpp"

namespace tempo::db::postgres {

namespace {

// 08xxx: connection exception. 57P0x: backend terminated or shutting down.
bool ConnectionLost(const pqxx::sql_error& e) {
  const auto& state = e.sqlstate();
  return state.rfind("08", 0) == 0 || state.rfind("57P", 0) == 0;
}

} // namespace

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool, TxMode mode) : mode_(mode) {
  try {
    conn_ = pool->Acquire();
    // BEGIN goes out here; an idle pooled connection may have died since
    if (mode_ == TxMode::ReadWrite) {
      tx_ = std::make_unique<pqxx::work>(*conn_);
    } else {
      tx_ = std::make_unique<pqxx::read_transaction>(*conn_);
    }
  } catch (const pqxx::broken_connection& e) {
    throw DbError(ErrorCode::Unavailable, std::string("postgres begin: ") + e.what());
  } catch (const pqxx::sql_error& e) {
    throw DbError(ConnectionLost(e) ? ErrorCode::Unavailable : ErrorCode::InternalError, std::string("postgres begin: ") + e.what());
  }
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try { tx_->abort(); }
    catch (...) {}
  }
  // the transaction must go before its connection returns to the pool
  tx_.reset();
}

void PgTransaction::Commit() {
  try {
    tx_->commit();
  } catch (const pqxx::in_doubt_error& e) {
    finished_ = true;
    throw DbError(ErrorCode::Unavailable, std::string("postgres commit in doubt: ") + e.what());
  } catch (const pqxx::broken_connection& e) {
    finished_ = true;
    throw DbError(ErrorCode::Unavailable, std::string("postgres commit: ") + e.what());
  } catch (const pqxx::serialization_failure& e) {
    finished_ = true;
    throw DbError(ErrorCode::SerializationFailure, e.what());
  } catch (const pqxx::sql_error& e) {
    finished_ = true;
    throw DbError(ErrorCode::InternalError, e.what());
  }
  committed_ = true;
  finished_ = true;
}

void PgTransaction::Rollback() {
  finished_ = true;
  tx_->abort();
}

void PgTransaction::RequireWrite() const {
  if (mode_ != TxMode::ReadWrite) {
    throw DbError(ErrorCode::Unsupported, "postgres: write attempted in a read-only transaction");
  }
}

}
