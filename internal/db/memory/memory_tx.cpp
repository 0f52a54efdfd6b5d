#include "memory_tx.hpp"

#include "internal/db/api/result.hpp"

namespace tempo::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, TxMode mode)
    : repo_(repo), mode_(mode), writer_lock_(repo.writer_mutex_, std::defer_lock) {
  if (mode_ == TxMode::ReadWrite && !writer_lock_.try_lock_for(repo_.busy_timeout_)) {
    throw DbError(ErrorCode::Busy, "memory backend: timed out waiting for the writer lock");
  }

  std::scoped_lock lock(repo_.state_mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (mode_ != TxMode::ReadWrite) {
    throw DbError(ErrorCode::Unsupported, "memory backend: write attempted in a read-only transaction");
  }
  return working_;
}

void MemoryTransaction::Commit() {
  if (mode_ == TxMode::ReadWrite) {
    std::scoped_lock lock(repo_.state_mutex_);
    repo_.committed_ = std::move(working_);
  }
  committed_ = true;
  if (writer_lock_.owns_lock()) writer_lock_.unlock();
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
  if (writer_lock_.owns_lock()) writer_lock_.unlock();
}

} // namespace tempo::db::memory
