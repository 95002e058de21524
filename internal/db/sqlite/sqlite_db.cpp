#include "sqlite_db.hpp"

#include "internal/db/api/errors.hpp"

namespace bridgewatch::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    Throw(SqliteDB::Translate(db, rc), what);
  }
}

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  Open();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Open() {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw StoreUnavailable("sqlite open " + path_ + ": " + msg);
  }

  ++generation_;
  Configure();
}

sqlite3* SqliteDB::Handle() const {
  if (!db_) {
    throw StoreUnavailable("sqlite database " + path_ + " is closed");
  }
  return db_;
}

void SqliteDB::Exec(const std::string& sql) {
  auto* db  = Handle();
  char* err = nullptr;
  int   rc  = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    auto result    = Translate(db, rc);
    result.message = msg;
    Throw(result, "sqlite exec");
  }
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  auto*         db   = Handle();
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
  ThrowIf(rc, db, "sqlite prepare");
  return stmt;
}

void SqliteDB::Configure() {
  // IMPORTANT: WAL lets the replay process insert while the scorer reads
  Exec("PRAGMA journal_mode=WAL;");

  Exec("PRAGMA synchronous=NORMAL;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

bool SqliteDB::IsHealthy() {
  if (!db_) return false;
  return sqlite3_exec(db_, "SELECT 1;", nullptr, nullptr, nullptr) == SQLITE_OK;
}

void SqliteDB::Reconnect() {
  Close();
  Open();
}

void SqliteDB::Close() {
  if (db_) {
    sqlite3_close_v2(db_);
    db_ = nullptr;
  }
}

Result SqliteDB::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  const char* msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, msg);
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, msg);
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, msg);
    case SQLITE_CANTOPEN:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Unavailable, msg);
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, msg);
    case SQLITE_MISUSE:
    case SQLITE_RANGE:
      return Result::Err(ErrorCode::InvalidArgument, msg);
    default:
      return Result::Err(ErrorCode::InternalError, msg);
  }
}

} // namespace bridgewatch::db::sqlite
