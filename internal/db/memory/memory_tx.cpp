#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace timebank::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo)
    : repo_(repo), writer_lock_(repo.writer_mutex_, std::defer_lock) {
  if (!writer_lock_.try_lock_for(repo_.lock_timeout_)) {
    throw util::ConcurrencyConflict("timed out waiting for memory store writer lock");
  }
  std::scoped_lock lock(repo_.state_mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::logic_error("memory transaction already finished");
  }
  {
    std::scoped_lock lock(repo_.state_mutex_);
    repo_.committed_ = std::move(working_);
  }
  committed_ = true;
  writer_lock_.unlock();
}

void MemoryTransaction::Rollback() {
  if (committed_ || rolled_back_) {
    return;
  }
  rolled_back_ = true;
  writer_lock_.unlock();
}

} // namespace timebank::db::memory
