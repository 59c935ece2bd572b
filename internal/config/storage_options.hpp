#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "config/config.pb.h"
#include "internal/db/collection_resolver.hpp"
#include "internal/resilience/circuit_breaker.hpp"
#include "internal/resilience/resilient_document_store.hpp"

namespace jobstore::config {

/*
  StorageOptions

  Typed view of the storage-related sections of RuntimeConfig with every
  default applied. Unset (zero) config values fall back to the defaults
  below.
*/
struct StorageOptions {
  std::string             database_name = "jobstore";
  db::CollectionLayout    layout        = db::CollectionLayout::Dedicated;
  db::CollectionNames     collections;
  int32_t                 query_page_size = 100;

  // expiration
  std::chrono::milliseconds default_job_expiration{std::chrono::hours(24 * 7)};
  std::chrono::milliseconds job_ttl{std::chrono::hours(24 * 30)};
  std::chrono::milliseconds server_ttl{std::chrono::minutes(10)};
  std::chrono::milliseconds lock_ttl{std::chrono::minutes(5)};
  std::chrono::milliseconds counter_ttl{std::chrono::hours(24 * 7)};

  // timeouts
  std::chrono::milliseconds server_timeout{std::chrono::minutes(5)};
  std::chrono::milliseconds lock_timeout{std::chrono::minutes(1)};
  std::chrono::milliseconds request_timeout{std::chrono::seconds(30)};

  resilience::RetryPolicy           retry;
  uint32_t                          conflict_retry_limit = 5;
  resilience::CircuitBreakerOptions circuit_breaker;

  bool                      lock_renew_enabled = false;
  std::chrono::milliseconds lock_renew_interval{0};

  static StorageOptions FromConfig(const jobstore::runtime::config::RuntimeConfig& config);

  // Throws std::invalid_argument.
  void Validate() const;
};

} // namespace jobstore::config
