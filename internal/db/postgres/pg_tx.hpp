#pragma once

#include <memory>
#include <pqxx/pqxx>
#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace tempo::db::postgres {

/*
  ReadWrite -> pqxx::work
  ReadOnly  -> pqxx::read_transaction

  Throws DbError(Unavailable) if no connection can be opened or the
  pooled one is gone.
*/
class PgTransaction final : public db::Transaction {
public:
  PgTransaction(std::shared_ptr<PgPool> pool, TxMode mode);
  ~PgTransaction();

  pqxx::transaction_base& Work() { return *tx_; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }
  TxMode Mode() const override { return mode_; }

  // Throws DbError(Unsupported) on a ReadOnly transaction.
  void RequireWrite() const;

private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::transaction_base> tx_;
  TxMode mode_;
  bool committed_ = false;
  bool finished_ = false;
};

}
