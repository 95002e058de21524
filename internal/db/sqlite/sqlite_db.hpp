#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <string>

#include "internal/db/api/connection.hpp"
#include "internal/db/api/result.hpp"

namespace bridgewatch::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  Doubles as the repository's Connection: Reconnect() closes the handle and
  opens the file again. Generation() changes on every reopen so transactions
  begun on an older handle know it is gone.
*/
class SqliteDB final : public db::Connection {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  // throws db::StoreUnavailable when closed
  sqlite3* Handle() const;

  uint64_t Generation() const {
    return generation_;
  }

  // Execute a SQL string (used for pragmas/bootstrap/transaction control)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

  bool IsHealthy() override;
  void Reconnect() override;
  void Close() override;

  static Result Translate(sqlite3* db, int rc);

 private:
  void Open();

  sqlite3*    db_ = nullptr;
  std::string path_;
  uint64_t    generation_ = 0;
};

} // namespace bridgewatch::db::sqlite
