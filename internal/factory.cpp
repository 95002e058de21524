#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/errors.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/telemetry_sql.hpp"
#include "internal/observability/logging.hpp"
#if BRIDGEWATCH_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if BRIDGEWATCH_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace bridgewatch::factory {

namespace {

[[noreturn]] void ThrowSchemaMismatch(const bridgewatch::model::FeatureSchema& schema, const char* detail) {
  throw db::StoreError(db::ErrorCode::InvalidArgument,
                       "existing table " + schema.Table() + " does not have every configured column: " + std::string(detail));
}

#if BRIDGEWATCH_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db, const bridgewatch::model::FeatureSchema& schema,
                           const db::sql::TelemetryStatements& sql) {
  for (const auto& statement : sql.Bootstrap()) {
    sqlite_db->Exec(statement);
  }

  // CREATE TABLE IF NOT EXISTS leaves an older table untouched
  try {
    sqlite_db->Exec(sql.VerifyColumns());
  } catch (const db::StoreError& e) {
    if (db::IsConnectivityError(e.Code())) throw;
    ThrowSchemaMismatch(schema, e.what());
  }
}
#endif

#if BRIDGEWATCH_DB_POSTGRES
void BootstrapPostgresSchema(const std::string& connection_uri, const bridgewatch::model::FeatureSchema& schema,
                             const db::sql::TelemetryStatements& sql) {
  try {
    pqxx::connection conn(connection_uri);
    pqxx::work       tx(conn);
    for (const auto& statement : sql.Bootstrap()) {
      tx.exec(statement);
    }
    tx.commit();

    pqxx::nontransaction check(conn);
    check.exec(sql.VerifyColumns());
  } catch (const pqxx::broken_connection& e) {
    throw db::StoreUnavailable(std::string("postgres bootstrap: ") + e.what());
  } catch (const pqxx::undefined_column& e) {
    ThrowSchemaMismatch(schema, e.what());
  } catch (const pqxx::sql_error& e) {
    throw db::StoreError(db::ErrorCode::InternalError, std::string("postgres bootstrap: ") + e.what());
  }
}
#endif

} // namespace

bridgewatch::model::FeatureSchema BuildSchema(const bridgewatch::runtime::config::RuntimeConfig& config) {
  const auto&              database = config.database();
  std::vector<std::string> channels(database.channels().begin(), database.channels().end());
  std::vector<std::string> text_columns(database.text_columns().begin(), database.text_columns().end());
  return bridgewatch::model::FeatureSchema(database.table(), std::move(channels), std::move(text_columns));
}

std::shared_ptr<db::Repository> BuildRepository(const bridgewatch::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  auto        schema   = BuildSchema(config);

  if (database.has_sqlite()) {
#if BRIDGEWATCH_DB_SQLITE
    db::sql::TelemetryStatements sql(schema, db::sql::Dialect::kSqlite);
    auto                         sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    BootstrapSqliteSchema(sqlite_db, schema, sql);
    BRIDGEWATCH_LOG_INFO("Record store ready", {observability::StringField("backend", "sqlite"), observability::StringField("path", database.sqlite().path()),
                                                observability::StringField("table", schema.Table())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db), std::move(schema));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if BRIDGEWATCH_DB_POSTGRES
    db::sql::TelemetryStatements sql(schema, db::sql::Dialect::kPostgres);
    BootstrapPostgresSchema(database.postgres().connection_uri(), schema, sql);
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), database.postgres().max_connections(),
                                                       db::postgres::PgRepository::Statements(sql));
    BRIDGEWATCH_LOG_INFO("Record store ready", {observability::StringField("backend", "postgres"), observability::StringField("table", schema.Table())});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool), std::move(schema));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  BRIDGEWATCH_LOG_WARN("Using in-memory record store; data is lost on exit", {observability::StringField("table", schema.Table())});
  return std::make_shared<db::memory::MemoryRepository>(std::move(schema));
}

} // namespace bridgewatch::factory
