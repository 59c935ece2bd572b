#include "pg_pool.hpp"

namespace jobstore::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections, std::uint64_t statement_timeout_ms)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections),
      statement_timeout_ms_(statement_timeout_ms) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  for (;;) {
    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      if (conn->is_open()) {
        return Wrap(conn.release());
      }
      // dropped by the server; let it go and open a fresh one
      --live_connections_;
      continue;
    }

    if (live_connections_ < max_connections_) {
      ++live_connections_;
      lock.unlock();

      try {
        auto conn = std::make_unique<pqxx::connection>(conninfo_);
        ConfigureSession(*conn);
        return Wrap(conn.release());
      } catch (...) {
        std::lock_guard rollback_lock(mutex_);
        --live_connections_;
        cv_.notify_one();
        throw;
      }
    }

    cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });
  }
}

void PgPool::ConfigureSession(pqxx::connection& conn) const {
  if (statement_timeout_ms_ == 0) {
    return;
  }
  pqxx::nontransaction ntx(conn);
  ntx.exec("SET statement_timeout = " + std::to_string(statement_timeout_ms_));
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace jobstore::db::postgres
