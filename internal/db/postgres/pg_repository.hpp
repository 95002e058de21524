#pragma once

#include "internal/db/api/repository.hpp"
#include "internal/db/sql/telemetry_sql.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace bridgewatch::db::postgres {

class PgRepository final : public db::Repository {
public:
  PgRepository(std::shared_ptr<PgPool> pool, bridgewatch::model::FeatureSchema schema);

  // Statements PgPool must prepare on every connection it opens.
  static std::vector<PreparedStatement> Statements(const sql::TelemetryStatements& sql);

  std::unique_ptr<Transaction> Begin() override;
  Connection& ConnectionHandle() override { return *pool_; }
  const bridgewatch::model::FeatureSchema& Schema() const override { return schema_; }

  Result InsertRecord(Transaction&, model::TelemetryRecord&) override;
  std::optional<model::TelemetryRecord> GetRecord(Transaction&, int64_t id) override;
  std::vector<model::TelemetryRecord> ListRecords(Transaction&) override;
  std::vector<model::TelemetryRecord> FetchPending(Transaction&, std::size_t limit) override;
  Result ApplyOutcomes(Transaction&, const std::vector<model::OutcomeUpdate>&) override;
  Result Truncate(Transaction&) override;

  uint64_t CountTotal(Transaction&) override;
  uint64_t CountPending(Transaction&) override;
  uint64_t CountAnomalies(Transaction&) override;

  static Result Translate(const std::exception& e);

private:
  std::shared_ptr<PgPool> pool_;
  bridgewatch::model::FeatureSchema schema_;
  sql::TelemetryStatements sql_;

  static PgTransaction& TX(Transaction& t);

  model::TelemetryRecord ReadRecord(const pqxx::row& row) const;
  std::vector<model::TelemetryRecord> ReadRecords(const pqxx::result& res) const;
};

} // namespace bridgewatch::db::postgres
