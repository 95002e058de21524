#pragma once

#include <cstdint>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace bridgewatch::db::memory {

/*
  Works on a private copy of the committed state. Commit() installs the copy
  only if no other transaction committed since it was taken, otherwise it
  fails with ErrorCode::Conflict. A transaction that never asked for
  Mutable() commits without touching the store.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  TxState State() const override {
    return state_;
  }

  MemoryRepository::State& Mutable() {
    wrote_ = true;
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  uint64_t                snapshot_version_ = 0;
  TxState                 state_            = TxState::kOpen;
  bool                    wrote_            = false;
};

} // namespace bridgewatch::db::memory
