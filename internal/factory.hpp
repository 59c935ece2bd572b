#pragma once

#include <memory>
#include <string>

#include "config/config.pb.h"
#include "internal/config/storage_options.hpp"
#include "internal/connection/storage_connection.hpp"
#include "internal/db/api/document_store.hpp"
#include "internal/resilience/circuit_breaker.hpp"

namespace jobstore::factory {

/*
  Storage

  Owns the long-lived storage objects of one process:

    backend     concrete document store picked by config.database
    breaker     shared by every call through `store`
    store       backend wrapped with retries, timeouts and the breaker
    connection  the facade the worker and jobctl talk to
*/
struct Storage {
  config::StorageOptions                        options;
  std::shared_ptr<db::DocumentStore>            backend;
  std::shared_ptr<resilience::CircuitBreaker>   breaker;
  std::shared_ptr<db::DocumentStore>            store;
  std::unique_ptr<connection::StorageConnection> connection;
};

/*
  BuildDocumentStore

  The only place that knows concrete backend types. Throws
  std::runtime_error when the configured backend was not compiled in.
*/
std::shared_ptr<db::DocumentStore> BuildDocumentStore(const jobstore::runtime::config::RuntimeConfig& config,
                                                      const config::StorageOptions& options);

// Composition root shared by jobstore-worker and jobctl.
Storage BuildStorage(const jobstore::runtime::config::RuntimeConfig& config, std::string server_id = {});

} // namespace jobstore::factory
