#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace weave::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : lock_(repo.mutex_), repo_(repo) {
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw weave::util::InvalidState("transaction already finished");
  }
  repo_.committed_ = std::move(working_);
  committed_       = true;
  lock_.unlock();
}

void MemoryTransaction::Rollback() {
  if (committed_ || rolled_back_) return;
  rolled_back_ = true;
  lock_.unlock();
}

} // namespace weave::db::memory
