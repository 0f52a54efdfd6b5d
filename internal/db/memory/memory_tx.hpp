#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace tempo::db::memory {

/*
  Transaction = snapshot + write set

  ReadWrite holds the repository writer lock until Commit/Rollback, so
  there is never a commit conflict to detect.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  MemoryTransaction(MemoryRepository& repo, TxMode mode);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }
  TxMode Mode() const override {
    return mode_;
  }

  // Throws DbError(Unsupported) on a ReadOnly transaction.
  MemoryRepository::State& Mutable();

  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&                  repo_;
  TxMode                             mode_;
  std::unique_lock<std::timed_mutex> writer_lock_;
  MemoryRepository::State            working_;
  bool                               committed_   = false;
  bool                               rolled_back_ = false;
};

} // namespace tempo::db::memory
