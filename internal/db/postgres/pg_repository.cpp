#include "pg_repository.hpp"

#include "internal/db/api/errors.hpp"

namespace bridgewatch::db::postgres {

namespace {

constexpr const char* kInsertRecord   = "insert_record";
constexpr const char* kSelectById     = "select_record";
constexpr const char* kSelectPending  = "select_pending";
constexpr const char* kUpdateOutcome  = "update_outcome";

// Runs a read and rethrows driver failures as db::StoreError.
template <typename Fn>
auto Guarded(const char* what, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const pqxx::sql_error& e) {
    Throw(PgRepository::Translate(e), what);
  } catch (const pqxx::failure& e) {
    Throw(PgRepository::Translate(e), what);
  }
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool, bridgewatch::model::FeatureSchema schema)
    : pool_(std::move(pool)), schema_(std::move(schema)), sql_(schema_, sql::Dialect::kPostgres) {
}

std::vector<PreparedStatement> PgRepository::Statements(const sql::TelemetryStatements& sql) {
  return {
      {kInsertRecord, sql.Insert()},
      {kSelectById, sql.SelectById()},
      {kSelectPending, sql.SelectPending()},
      {kUpdateOutcome, sql.UpdateOutcome()},
  };
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::Unavailable, e.what());
  }
  if (dynamic_cast<const pqxx::in_doubt_error*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::Busy, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (const auto* store = dynamic_cast<const StoreError*>(&e)) {
    return Result::Err(store->Code(), e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

model::TelemetryRecord PgRepository::ReadRecord(const pqxx::row& row) const {
  model::TelemetryRecord r;
  r.id             = row[sql::TelemetryStatements::kIdColumn].as<int64_t>();
  r.observed_at_ms = row[sql::TelemetryStatements::kObservedAtColumn].as<int64_t>();

  r.features.reserve(schema_.Width());
  for (std::size_t i = 0; i < schema_.Width(); ++i) {
    const auto field = row[sql::TelemetryStatements::kFirstChannelColumn + static_cast<int>(i)];
    r.features.push_back(field.is_null() ? std::nullopt : std::optional<double>(field.as<double>()));
  }
  r.texts.reserve(schema_.TextWidth());
  for (std::size_t i = 0; i < schema_.TextWidth(); ++i) {
    const auto field = row[sql_.FirstTextColumn() + static_cast<int>(i)];
    r.texts.push_back(field.is_null() ? std::nullopt : std::optional<std::string>(field.as<std::string>()));
  }

  if (!row[sql_.IsAnomalyColumn()].is_null()) {
    model::Outcome outcome;
    outcome.is_anomaly    = row[sql_.IsAnomalyColumn()].as<bool>();
    outcome.anomaly_score = row[sql_.ScoreColumn()].is_null() ? 0.0 : row[sql_.ScoreColumn()].as<double>();
    r.outcome             = outcome;
  }
  return r;
}

std::vector<model::TelemetryRecord> PgRepository::ReadRecords(const pqxx::result& res) const {
  std::vector<model::TelemetryRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadRecord(row));
  }
  return out;
}

Result PgRepository::InsertRecord(Transaction& t, model::TelemetryRecord& r) {
  if (r.features.size() != schema_.Width()) {
    return Result::Err(ErrorCode::InvalidArgument, "record has " + std::to_string(r.features.size()) + " features, table " + schema_.Table() +
                                                       " has " + std::to_string(schema_.Width()) + " channels");
  }
  if (!r.texts.empty() && r.texts.size() != schema_.TextWidth()) {
    return Result::Err(ErrorCode::InvalidArgument, "record has " + std::to_string(r.texts.size()) + " text values, table " + schema_.Table() +
                                                       " has " + std::to_string(schema_.TextWidth()) + " text columns");
  }

  try {
    pqxx::params params;
    params.append(r.observed_at_ms);
    for (const auto& value : r.features) {
      params.append(value);
    }
    for (std::size_t i = 0; i < schema_.TextWidth(); ++i) {
      params.append(r.texts.empty() ? std::optional<std::string>() : r.texts[i]);
    }
    auto res = TX(t).Work().exec_prepared(kInsertRecord, params);
    r.id     = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::TelemetryRecord> PgRepository::GetRecord(Transaction& t, int64_t id) {
  return Guarded("postgres get record", [&]() -> std::optional<model::TelemetryRecord> {
    auto res = TX(t).Work().exec_prepared(kSelectById, id);
    if (res.empty()) return std::nullopt;
    return ReadRecord(res[0]);
  });
}

std::vector<model::TelemetryRecord> PgRepository::ListRecords(Transaction& t) {
  return Guarded("postgres list records", [&] { return ReadRecords(TX(t).Work().exec(sql_.SelectAll())); });
}

std::vector<model::TelemetryRecord> PgRepository::FetchPending(Transaction& t, std::size_t limit) {
  return Guarded("postgres fetch pending",
                 [&] { return ReadRecords(TX(t).Work().exec_prepared(kSelectPending, static_cast<int64_t>(limit))); });
}

Result PgRepository::ApplyOutcomes(Transaction& t, const std::vector<model::OutcomeUpdate>& updates) {
  try {
    auto& work = TX(t).Work();
    for (const auto& u : updates) {
      auto res = work.exec_prepared(kUpdateOutcome, u.is_anomaly, u.anomaly_score, u.id);
      if (res.affected_rows() != 1) {
        return Result::Err(ErrorCode::Conflict, "record " + std::to_string(u.id) + " is not pending");
      }
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::Truncate(Transaction& t) {
  try {
    for (const auto& sql : sql_.Truncate()) {
      TX(t).Work().exec(sql);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

uint64_t PgRepository::CountTotal(Transaction& t) {
  return Guarded("postgres count", [&] { return TX(t).Work().exec(sql_.CountTotal())[0][0].as<uint64_t>(); });
}

uint64_t PgRepository::CountPending(Transaction& t) {
  return Guarded("postgres count", [&] { return TX(t).Work().exec(sql_.CountPending())[0][0].as<uint64_t>(); });
}

uint64_t PgRepository::CountAnomalies(Transaction& t) {
  return Guarded("postgres count", [&] { return TX(t).Work().exec(sql_.CountAnomalies())[0][0].as<uint64_t>(); });
}

} // namespace bridgewatch::db::postgres
