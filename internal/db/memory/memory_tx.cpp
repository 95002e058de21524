#include "memory_tx.hpp"

#include "internal/db/api/errors.hpp"

namespace bridgewatch::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  if (!repo_.open_) {
    throw StoreUnavailable("memory store is closed");
  }
  working_          = repo_.committed_; // snapshot copy
  snapshot_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  Rollback();
}

void MemoryTransaction::Commit() {
  std::scoped_lock lock(repo_.mutex_);
  if (state_ != TxState::kOpen) {
    throw StoreError(ErrorCode::InternalError, std::string("commit on a transaction that is ") + ToString(state_));
  }
  state_ = TxState::kFailed;
  if (!repo_.open_) {
    throw StoreUnavailable("memory store closed before commit");
  }
  if (!wrote_) {
    working_.records.clear();
    state_ = TxState::kCommitted;
    return;
  }
  if (repo_.committed_version_ != snapshot_version_) {
    throw StoreError(ErrorCode::Conflict, "transaction conflict: state was modified by a concurrent transaction");
  }
  repo_.committed_ = std::move(working_);
  repo_.committed_version_++;
  state_ = TxState::kCommitted;
}

void MemoryTransaction::Rollback() {
  if (state_ != TxState::kOpen) return;
  state_ = TxState::kRolledBack;
  working_.records.clear();
}

} // namespace bridgewatch::db::memory
