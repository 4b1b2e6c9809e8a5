#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace timebank::db::memory {

/*
  Transaction = writer lock + private copy of the state
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&                  repo_;
  std::unique_lock<std::timed_mutex> writer_lock_;
  MemoryRepository::State            working_;
  bool                               committed_   = false;
  bool                               rolled_back_ = false;
};

} // namespace timebank::db::memory
