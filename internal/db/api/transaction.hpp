#pragma once

namespace bridgewatch::db {

enum class TxState {
  kOpen,
  kCommitted,
  kRolledBack,

  // Commit() threw; nothing from this transaction is visible
  kFailed
};

inline const char* ToString(TxState state) {
  switch (state) {
    case TxState::kOpen: return "open";
    case TxState::kCommitted: return "committed";
    case TxState::kRolledBack: return "rolled_back";
    case TxState::kFailed: return "failed";
  }
  return "unknown";
}

/*
  Unit of work against the Record Store.

  A scoring cycle's fetch and outcome writes share one transaction, so a
  batch is either fully labelled or left pending.

  - Writes are invisible to other transactions until Commit()
  - Commit() throws db::StoreError and leaves the state kFailed
  - Rollback() is a no-op once the transaction has finished
  - Destroying an open transaction rolls it back

  SQLite: BEGIN IMMEDIATE
  Postgres: pqxx::work on a pooled connection
  Memory: private copy of the committed snapshot
*/
class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual TxState State() const = 0;

  bool IsOpen() const { return State() == TxState::kOpen; }
};

} // namespace bridgewatch::db
