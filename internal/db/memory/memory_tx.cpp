#include "memory_tx.hpp"

namespace relay::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), tx_lock_(repo.tx_mutex_) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_; // snapshot copy; chunk tables are shared
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) return;
  std::scoped_lock lock(repo_.mutex_);
  repo_.committed_ = std::move(working_);
  committed_       = true;
  tx_lock_.unlock();
}

void MemoryTransaction::Rollback() {
  if (committed_ || rolled_back_) return;
  rolled_back_ = true;
  working_     = {};
  tx_lock_.unlock();
}

} // namespace relay::db::memory
