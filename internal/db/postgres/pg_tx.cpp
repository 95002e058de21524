#include "pg_tx.hpp"

#include "internal/db/api/errors.hpp"
#include "internal/observability/logging.hpp"

namespace bridgewatch::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) {
  conn_ = pool->Acquire();
  try {
    tx_ = std::make_unique<pqxx::work>(*conn_);
  } catch (const pqxx::broken_connection& e) {
    throw StoreUnavailable(std::string("postgres begin: ") + e.what());
  } catch (const pqxx::failure& e) {
    throw StoreError(ErrorCode::InternalError, std::string("postgres begin: ") + e.what());
  }
}

PgTransaction::~PgTransaction() {
  if (state_ != TxState::kOpen) return;
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    BRIDGEWATCH_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
  }
}

pqxx::work& PgTransaction::Work() {
  if (state_ != TxState::kOpen) {
    throw StoreError(ErrorCode::InternalError, std::string("postgres transaction is ") + ToString(state_));
  }
  return *tx_;
}

void PgTransaction::Commit() {
  if (state_ != TxState::kOpen) {
    throw StoreError(ErrorCode::InternalError, std::string("commit on a transaction that is ") + ToString(state_));
  }
  state_ = TxState::kFailed;
  try {
    tx_->commit();
  } catch (const pqxx::broken_connection& e) {
    throw StoreUnavailable(std::string("postgres commit: ") + e.what());
  } catch (const pqxx::in_doubt_error& e) {
    throw StoreError(ErrorCode::IOError, std::string("postgres commit outcome unknown: ") + e.what());
  } catch (const pqxx::serialization_failure& e) {
    throw StoreError(ErrorCode::SerializationFailure, e.what());
  } catch (const pqxx::sql_error& e) {
    throw StoreError(ErrorCode::InternalError, e.what());
  }
  state_ = TxState::kCommitted;
}

void PgTransaction::Rollback() {
  if (state_ != TxState::kOpen) return;
  state_ = TxState::kRolledBack;
  try {
    tx_->abort();
  } catch (const pqxx::broken_connection& e) {
    throw StoreUnavailable(std::string("postgres rollback: ") + e.what());
  }
}

} // namespace bridgewatch::db::postgres
