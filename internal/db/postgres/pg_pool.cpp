#include "pg_pool.hpp"

#include "internal/db/api/errors.hpp"

namespace bridgewatch::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections, std::vector<PreparedStatement> statements)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections),
      statements_(std::move(statements)) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    std::unique_lock lock(mutex_);

    if (closed_) {
      throw StoreUnavailable("postgres pool is closed");
    }

    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      return Wrap(conn.release(), generation_);
    }

    if (live_connections_ < max_connections_) {
      ++live_connections_;
      const auto generation = generation_;
      lock.unlock();

      std::unique_ptr<pqxx::connection> conn;
      try {
        conn = std::make_unique<pqxx::connection>(conninfo_);
        PrepareStatements(*conn);
      } catch (const pqxx::broken_connection& e) {
        ReleaseSlot();
        throw StoreUnavailable(std::string("postgres connect: ") + e.what());
      } catch (const pqxx::sql_error& e) {
        // a server that is starting up or shutting down refuses PREPARE
        ReleaseSlot();
        throw StoreUnavailable(std::string("postgres prepare: ") + e.what());
      } catch (const pqxx::failure& e) {
        ReleaseSlot();
        throw StoreUnavailable(std::string("postgres connect: ") + e.what());
      } catch (const std::exception&) {
        ReleaseSlot();
        throw;
      }
      return Wrap(conn.release(), generation);
    }

    cv_.wait(lock, [this] {
      return closed_ || !idle_.empty() || live_connections_ < max_connections_;
    });
  }
}

void PgPool::ReleaseSlot() {
  {
    std::lock_guard lock(mutex_);
    --live_connections_;
  }
  cv_.notify_one();
}

void PgPool::PrepareStatements(pqxx::connection& conn) const {
  for (const auto& statement : statements_) {
    conn.prepare(statement.name, statement.sql);
  }
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn, uint64_t generation) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self, generation](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn, generation);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn, uint64_t generation) {
  std::unique_ptr<pqxx::connection> owned(conn);
  {
    std::lock_guard lock(mutex_);
    if (generation == generation_ && !closed_ && owned->is_open()) {
      idle_.push_back(std::move(owned));
    } else {
      --live_connections_;
    }
  }
  cv_.notify_one();
}

void PgPool::DropIdle(std::unique_lock<std::mutex>& lock) {
  std::vector<std::unique_ptr<pqxx::connection>> dropped;
  dropped.swap(idle_);
  live_connections_ -= dropped.size();
  ++generation_;
  lock.unlock();
  dropped.clear();
  cv_.notify_all();
}

bool PgPool::IsHealthy() {
  try {
    auto                  conn = Acquire();
    pqxx::nontransaction  tx(*conn);
    tx.exec("SELECT 1;");
    return true;
  } catch (const pqxx::failure&) {
    return false;
  } catch (const StoreError&) {
    return false;
  }
}

void PgPool::Reconnect() {
  {
    std::unique_lock lock(mutex_);
    closed_ = false;
    DropIdle(lock);
  }

  auto conn = Acquire();
  try {
    pqxx::nontransaction tx(*conn);
    tx.exec("SELECT 1;");
  } catch (const pqxx::failure& e) {
    throw StoreUnavailable(std::string("postgres reconnect: ") + e.what());
  }
}

void PgPool::Close() {
  std::unique_lock lock(mutex_);
  closed_ = true;
  DropIdle(lock);
}

} // namespace bridgewatch::db::postgres
