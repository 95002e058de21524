#pragma once

#include <cstdint>
#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace bridgewatch::db::sqlite {

/*
  SQLite transaction wrapper.

  Uses BEGIN IMMEDIATE:
    - takes the write lock up front, so the fetch and the outcome
      writes of a scoring cycle never race a concurrent inserter

  Bound to the SqliteDB generation it began on. After a Reconnect() every
  call fails with db::StoreUnavailable and nothing is sent to the new handle.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const;

  void Commit() override;
  void Rollback() override;
  TxState State() const override { return state_; }

private:
  bool Live() const;
  void RollbackQuietly();

  std::shared_ptr<SqliteDB> db_;
  uint64_t generation_ = 0;
  TxState state_ = TxState::kOpen;
};

} // namespace bridgewatch::db::sqlite
