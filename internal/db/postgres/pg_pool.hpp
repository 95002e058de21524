#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

#include "internal/db/api/connection.hpp"

namespace bridgewatch::db::postgres {

struct PreparedStatement {
  std::string name;
  std::string sql;
};

/*
  PgPool

  Connection pool used by PgRepository.

  Design notes:
  -------------
  - Each transaction gets its own connection.
  - libpqxx connections are NOT thread-safe, do not share.
  - Prepared statements are installed per connection.
  - Reconnect() bumps the pool generation: idle connections are dropped and
    connections handed out before the bump are destroyed when released
    instead of going back to the idle list.

  Lifetime:
    Repository owns shared_ptr<PgPool>
    Transaction acquires shared_ptr<pqxx::connection>
*/

class PgPool final : public db::Connection, public std::enable_shared_from_this<PgPool> {
 public:
  PgPool(std::string conninfo, std::size_t max_connections, std::vector<PreparedStatement> statements);

  // Acquire a ready-to-use connection. Throws db::StoreUnavailable when the
  // pool is closed, the server cannot be reached or refuses to prepare the
  // statements. No driver exception escapes.
  std::shared_ptr<pqxx::connection> Acquire();

  bool IsHealthy() override;
  void Reconnect() override;
  void Close() override;

 private:
  void                              ReleaseSlot();
  void                              PrepareStatements(pqxx::connection& conn) const;
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn, uint64_t generation);
  void                              Release(pqxx::connection* conn, uint64_t generation);
  void                              DropIdle(std::unique_lock<std::mutex>& lock);

  std::string                    conninfo_;
  std::size_t                    max_connections_;
  std::vector<PreparedStatement> statements_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
  uint64_t                                       generation_       = 0;
  bool                                           closed_           = false;
};

} // namespace bridgewatch::db::postgres
