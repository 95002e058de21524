#include "sqlite_tx.hpp"

#include "internal/db/api/errors.hpp"
#include "internal/observability/logging.hpp"

namespace bridgewatch::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
  generation_ = db_->Generation();
}

SqliteTransaction::~SqliteTransaction() {
  if (state_ == TxState::kOpen) RollbackQuietly();
}

bool SqliteTransaction::Live() const {
  return db_->Generation() == generation_ && db_->IsHealthy();
}

void SqliteTransaction::RollbackQuietly() {
  if (!Live()) return;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const StoreError& e) {
    BRIDGEWATCH_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
  }
}

sqlite3* SqliteTransaction::Handle() const {
  if (db_->Generation() != generation_) {
    throw StoreUnavailable("sqlite connection was reopened during the transaction");
  }
  if (state_ != TxState::kOpen) {
    throw StoreError(ErrorCode::InternalError, std::string("sqlite transaction is ") + ToString(state_));
  }
  return db_->Handle();
}

void SqliteTransaction::Commit() {
  // validates generation and state before anything reaches the handle
  Handle();
  try {
    db_->Exec("COMMIT;");
  } catch (const StoreError&) {
    // a failed COMMIT can leave the transaction active; end it
    state_ = TxState::kFailed;
    RollbackQuietly();
    throw;
  }
  state_ = TxState::kCommitted;
}

void SqliteTransaction::Rollback() {
  if (state_ != TxState::kOpen) return;
  state_ = TxState::kRolledBack;
  if (!Live()) return;
  db_->Exec("ROLLBACK;");
}

} // namespace bridgewatch::db::sqlite
