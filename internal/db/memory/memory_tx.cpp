#include "memory_tx.hpp"

namespace fieldsync::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo)
    : repo_(repo), lock_(repo.tx_mutex_), working_(repo.committed_) {}

MemoryTransaction::~MemoryTransaction() {
  if (IsOpen()) Rollback();
}

void MemoryTransaction::Commit() {
  RequireOpen("commit");
  repo_.committed_ = std::move(working_);
  state_           = State::kCommitted;
  lock_.unlock();
}

void MemoryTransaction::Rollback() {
  RequireOpen("rollback");
  working_ = {};
  state_   = State::kRolledBack;
  lock_.unlock();
}

} // namespace fieldsync::db::memory
