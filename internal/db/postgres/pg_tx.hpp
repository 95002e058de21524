#pragma once

#include <memory>
#include <pqxx/pqxx>
#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace bridgewatch::db::postgres {

/*
  One pqxx::work on a connection held from the pool for the transaction's
  lifetime. The connection goes back to the pool when this is destroyed.
*/
class PgTransaction final : public db::Transaction {
public:
  explicit PgTransaction(std::shared_ptr<PgPool> pool);
  ~PgTransaction();

  pqxx::work& Work();

  void Commit() override;
  void Rollback() override;
  TxState State() const override { return state_; }

private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work> tx_;
  TxState state_ = TxState::kOpen;
};

} // namespace bridgewatch::db::postgres
