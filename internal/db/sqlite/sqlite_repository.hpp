#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/db/sql/telemetry_sql.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace bridgewatch::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  SqliteRepository(std::shared_ptr<SqliteDB> db, bridgewatch::model::FeatureSchema schema);

  std::unique_ptr<Transaction> Begin() override;
  Connection& ConnectionHandle() override { return *db_; }
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

private:
  std::shared_ptr<SqliteDB> db_;
  bridgewatch::model::FeatureSchema schema_;
  sql::TelemetryStatements sql_;

  static SqliteTransaction& TX(Transaction& t);

  model::TelemetryRecord ReadRecord(sqlite3_stmt* st) const;
  std::vector<model::TelemetryRecord> Query(Transaction& t, const std::string& sql, std::optional<int64_t> param);
  uint64_t Count(Transaction& t, const std::string& sql);
};

} // namespace bridgewatch::db::sqlite
