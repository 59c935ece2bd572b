#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace jobstore::db::postgres {

/*
  PgPool

  Connection pool used by PgDocumentStore.

  - Each store call gets its own connection for its duration.
  - libpqxx connections are NOT thread-safe → never shared.
  - Session settings are applied once per physical connection.
  - Acquire() blocks while max_connections are checked out.

  Lifetime:
    Store owns shared_ptr<PgPool>
    Call acquires shared_ptr<pqxx::connection>, returned to the pool on release
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16, std::uint64_t statement_timeout_ms = 0);

  std::shared_ptr<pqxx::connection> Acquire();

 private:
  void                              ConfigureSession(pqxx::connection& conn) const;
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string   conninfo_;
  std::size_t   max_connections_;
  std::uint64_t statement_timeout_ms_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace jobstore::db::postgres
