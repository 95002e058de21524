#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/api/errors.hpp"

namespace bridgewatch::db::sqlite {

using bridgewatch::db::ErrorCode;
using bridgewatch::db::Result;

namespace {

struct StatementDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

Statement PrepareOn(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  int           rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr);
  if (rc != SQLITE_OK) {
    sqlite3_finalize(st);
    Throw(SqliteDB::Translate(db, rc), "sqlite prepare");
  }
  return Statement(st);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptionalDouble(sqlite3_stmt* st, int idx, const std::optional<double>& v) {
  if (v) {
    sqlite3_bind_double(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindOptionalText(sqlite3_stmt* st, int idx, const std::optional<std::string>& v) {
  if (v) {
    sqlite3_bind_text(st, idx, v->c_str(), static_cast<int>(v->size()), SQLITE_TRANSIENT);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

std::optional<std::string> ColOptionalText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(st, col));
  return std::string(text, static_cast<std::size_t>(sqlite3_column_bytes(st, col)));
}

std::optional<double> ColOptionalDouble(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return sqlite3_column_double(st, col);
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db, bridgewatch::model::FeatureSchema schema)
    : db_(std::move(db)), schema_(std::move(schema)), sql_(schema_, sql::Dialect::kSqlite) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

model::TelemetryRecord SqliteRepository::ReadRecord(sqlite3_stmt* st) const {
  model::TelemetryRecord r;
  r.id             = sqlite3_column_int64(st, sql::TelemetryStatements::kIdColumn);
  r.observed_at_ms = sqlite3_column_int64(st, sql::TelemetryStatements::kObservedAtColumn);

  r.features.reserve(schema_.Width());
  for (std::size_t i = 0; i < schema_.Width(); ++i) {
    r.features.push_back(ColOptionalDouble(st, sql::TelemetryStatements::kFirstChannelColumn + static_cast<int>(i)));
  }
  r.texts.reserve(schema_.TextWidth());
  for (std::size_t i = 0; i < schema_.TextWidth(); ++i) {
    r.texts.push_back(ColOptionalText(st, sql_.FirstTextColumn() + static_cast<int>(i)));
  }

  if (sqlite3_column_type(st, sql_.IsAnomalyColumn()) != SQLITE_NULL) {
    model::Outcome outcome;
    outcome.is_anomaly    = sqlite3_column_int(st, sql_.IsAnomalyColumn()) != 0;
    outcome.anomaly_score = sqlite3_column_double(st, sql_.ScoreColumn());
    r.outcome             = outcome;
  }
  return r;
}

std::vector<model::TelemetryRecord> SqliteRepository::Query(Transaction& t, const std::string& sql, std::optional<int64_t> param) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOn(db, sql);
  if (param) BindI64(st.get(), 1, *param);

  std::vector<model::TelemetryRecord> out;
  int                                 rc = SQLITE_ROW;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadRecord(st.get()));
  }
  if (rc != SQLITE_DONE) {
    Throw(SqliteDB::Translate(db, rc), "sqlite query");
  }
  return out;
}

uint64_t SqliteRepository::Count(Transaction& t, const std::string& sql) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOn(db, sql);
  int   rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW) {
    Throw(SqliteDB::Translate(db, rc), "sqlite count");
  }
  return static_cast<uint64_t>(sqlite3_column_int64(st.get(), 0));
}

// ------------------------------------------------------------------
// Records
// ------------------------------------------------------------------

Result SqliteRepository::InsertRecord(Transaction& t, model::TelemetryRecord& r) {
  if (r.features.size() != schema_.Width()) {
    return Result::Err(ErrorCode::InvalidArgument, "record has " + std::to_string(r.features.size()) + " features, table " + schema_.Table() +
                                                       " has " + std::to_string(schema_.Width()) + " channels");
  }
  if (!r.texts.empty() && r.texts.size() != schema_.TextWidth()) {
    return Result::Err(ErrorCode::InvalidArgument, "record has " + std::to_string(r.texts.size()) + " text values, table " + schema_.Table() +
                                                       " has " + std::to_string(schema_.TextWidth()) + " text columns");
  }

  try {
    auto* db = TX(t).Handle();
    auto  st = PrepareOn(db, sql_.Insert());

    BindI64(st.get(), 1, r.observed_at_ms);
    for (std::size_t i = 0; i < r.features.size(); ++i) {
      BindOptionalDouble(st.get(), static_cast<int>(i) + 2, r.features[i]);
    }
    // unbound text parameters stay NULL
    const int first_text = static_cast<int>(schema_.Width()) + 2;
    for (std::size_t i = 0; i < r.texts.size(); ++i) {
      BindOptionalText(st.get(), first_text + static_cast<int>(i), r.texts[i]);
    }

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return SqliteDB::Translate(db, rc);

    r.id = sqlite3_last_insert_rowid(db);
    return Result::Ok();
  } catch (const StoreError& e) {
    return Result::Err(e.Code(), e.what());
  }
}

std::optional<model::TelemetryRecord> SqliteRepository::GetRecord(Transaction& t, int64_t id) {
  auto rows = Query(t, sql_.SelectById(), id);
  if (rows.empty()) return std::nullopt;
  return std::move(rows.front());
}

std::vector<model::TelemetryRecord> SqliteRepository::ListRecords(Transaction& t) {
  return Query(t, sql_.SelectAll(), std::nullopt);
}

std::vector<model::TelemetryRecord> SqliteRepository::FetchPending(Transaction& t, std::size_t limit) {
  return Query(t, sql_.SelectPending(), static_cast<int64_t>(limit));
}

Result SqliteRepository::ApplyOutcomes(Transaction& t, const std::vector<model::OutcomeUpdate>& updates) {
  try {
    auto* db = TX(t).Handle();
    auto  st = PrepareOn(db, sql_.UpdateOutcome());

    for (const auto& u : updates) {
      sqlite3_reset(st.get());
      sqlite3_clear_bindings(st.get());
      sqlite3_bind_int(st.get(), 1, u.is_anomaly ? 1 : 0);
      sqlite3_bind_double(st.get(), 2, u.anomaly_score);
      BindI64(st.get(), 3, u.id);

      int rc = sqlite3_step(st.get());
      if (rc != SQLITE_DONE) return SqliteDB::Translate(db, rc);

      if (sqlite3_changes(db) != 1) {
        return Result::Err(ErrorCode::Conflict, "record " + std::to_string(u.id) + " is not pending");
      }
    }
    return Result::Ok();
  } catch (const StoreError& e) {
    return Result::Err(e.Code(), e.what());
  }
}

Result SqliteRepository::Truncate(Transaction& t) {
  try {
    auto* db = TX(t).Handle();
    for (const auto& sql : sql_.Truncate()) {
      auto st = PrepareOn(db, sql);
      int  rc = sqlite3_step(st.get());
      if (rc != SQLITE_DONE) return SqliteDB::Translate(db, rc);
    }
    return Result::Ok();
  } catch (const StoreError& e) {
    return Result::Err(e.Code(), e.what());
  }
}

// ------------------------------------------------------------------
// Counters
// ------------------------------------------------------------------

uint64_t SqliteRepository::CountTotal(Transaction& t) {
  return Count(t, sql_.CountTotal());
}

uint64_t SqliteRepository::CountPending(Transaction& t) {
  return Count(t, sql_.CountPending());
}

uint64_t SqliteRepository::CountAnomalies(Transaction& t) {
  return Count(t, sql_.CountAnomalies());
}

} // namespace bridgewatch::db::sqlite
