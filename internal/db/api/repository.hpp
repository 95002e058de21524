#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/connection.hpp"
#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/telemetry_record.hpp"
#include "internal/model/feature_schema.hpp"

namespace bridgewatch::db {

/*
  Record Store abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes happen inside a Transaction
  - Reads inside a transaction see its writes
  - Ids are assigned in strictly increasing order
  - An outcome is written at most once: ApplyOutcomes only touches rows
    whose outcome is still absent

  Writes return Result. Reads and Begin() throw db::StoreError, or
  db::StoreUnavailable when the connection is gone.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions / connection
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  virtual Connection& ConnectionHandle() = 0;

  virtual const bridgewatch::model::FeatureSchema& Schema() const = 0;

  // ---------------------------------------------------------------------
  // Records
  // ---------------------------------------------------------------------

  // Stores features and observed_at_ms as a pending row and writes the
  // assigned id back into record.id. Any outcome on the input is not stored.
  virtual Result InsertRecord(Transaction&, model::TelemetryRecord& record) = 0;

  virtual std::optional<model::TelemetryRecord> GetRecord(Transaction&, int64_t id) = 0;

  // Full snapshot ordered by id.
  virtual std::vector<model::TelemetryRecord> ListRecords(Transaction&) = 0;

  // Up to limit pending records ordered by ascending id.
  virtual std::vector<model::TelemetryRecord> FetchPending(Transaction&, std::size_t limit) = 0;

  // Every update must hit exactly one pending row, otherwise ErrorCode::Conflict
  // is returned and the caller must roll back.
  virtual Result ApplyOutcomes(Transaction&, const std::vector<model::OutcomeUpdate>& updates) = 0;

  // Removes every record and restarts id assignment.
  virtual Result Truncate(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Counters
  // ---------------------------------------------------------------------

  virtual uint64_t CountTotal(Transaction&) = 0;

  virtual uint64_t CountPending(Transaction&) = 0;

  virtual uint64_t CountAnomalies(Transaction&) = 0;
};

} // namespace bridgewatch::db
