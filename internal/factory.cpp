#include "factory.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "internal/db/memory/memory_document_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/resilience/resilient_document_store.hpp"
#if JOBSTORE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_document_store.hpp"
#endif
#if JOBSTORE_DB_POSTGRES
#include "internal/db/postgres/pg_document_store.hpp"
#include "internal/db/postgres/pg_pool.hpp"
#endif

namespace jobstore::factory {

std::shared_ptr<db::DocumentStore> BuildDocumentStore(const jobstore::runtime::config::RuntimeConfig& config,
                                                      const config::StorageOptions& options) {
  const auto& database = config.database();

  if (database.has_sqlite()) {
#if JOBSTORE_DB_SQLITE
    const auto& path = database.sqlite().path().empty() ? options.database_name + ".db" : database.sqlite().path();
    JOBSTORE_LOG_INFO("opening sqlite document store", {observability::StringField("path", path)});
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(path, static_cast<int>(options.request_timeout.count()));
    return std::make_shared<db::sqlite::SqliteDocumentStore>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if JOBSTORE_DB_POSTGRES
    const auto& postgres        = database.postgres();
    const auto  max_connections = postgres.max_connections() == 0 ? 16u : postgres.max_connections();
    JOBSTORE_LOG_INFO("opening postgres document store", {observability::IntField("max_connections", max_connections)});
    auto pool = std::make_shared<db::postgres::PgPool>(postgres.connection_uri(), max_connections,
                                                       static_cast<std::uint64_t>(options.request_timeout.count()));
    return std::make_shared<db::postgres::PgDocumentStore>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  JOBSTORE_LOG_WARN("using in-process memory document store; nothing is shared or persisted");
  return std::make_shared<db::memory::MemoryDocumentStore>();
}

Storage BuildStorage(const jobstore::runtime::config::RuntimeConfig& config, std::string server_id) {
  Storage storage;
  storage.options = config::StorageOptions::FromConfig(config);
  storage.options.Validate();

  storage.backend = BuildDocumentStore(config, storage.options);
  storage.breaker = std::make_shared<resilience::CircuitBreaker>(storage.options.circuit_breaker);
  // every worker thread plus heartbeat and housekeeping may be inside a store call
  const std::size_t call_threads =
      std::max<std::size_t>(resilience::ResilientDocumentStore::kDefaultCallThreads, std::size_t{config.worker().worker_count()} + 4);
  storage.store = std::make_shared<resilience::ResilientDocumentStore>(storage.backend, storage.breaker, storage.options.retry, call_threads);

  storage.connection = std::make_unique<connection::StorageConnection>(storage.store, storage.options, std::move(server_id));
  return storage;
}

} // namespace jobstore::factory
