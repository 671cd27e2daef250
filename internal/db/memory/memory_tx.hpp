#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace weave::db::memory {

/*
  Transaction = exclusive lock + working copy.

  The repository lock is held from construction until Commit()/Rollback(),
  so transactions are serialized like SQLite BEGIN IMMEDIATE. Never open a
  second transaction on the same repository from a thread that holds one.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

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
  std::unique_lock<std::mutex> lock_;
  MemoryRepository&            repo_;
  MemoryRepository::State      working_;
  bool                         committed_   = false;
  bool                         rolled_back_ = false;
};

} // namespace weave::db::memory
