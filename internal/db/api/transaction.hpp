#pragma once

namespace tempo::db {

enum class TxMode {
  ReadWrite,
  ReadOnly,
};

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - ReadOnly transactions see a consistent snapshot and reject writes

  SQLite:   BEGIN IMMEDIATE / BEGIN DEFERRED
  Postgres: pqxx::work / pqxx::read_transaction
  Memory:   snapshot copy + write set
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;

  virtual TxMode Mode() const = 0;
};

} // namespace tempo::db
