#include "storage_options.hpp"

#include <stdexcept>

namespace jobstore::config {

namespace rc = jobstore::runtime::config;

namespace {

void Override(std::string& target, const std::string& value) {
  if (!value.empty()) {
    target = value;
  }
}

void Override(std::chrono::milliseconds& target, uint64_t value_ms) {
  if (value_ms > 0) {
    target = std::chrono::milliseconds(static_cast<int64_t>(value_ms));
  }
}

void RequireName(const std::string& value, const char* name) {
  if (value.empty()) {
    throw std::invalid_argument(std::string(name) + " must not be empty");
  }
}

void RequirePositive(std::chrono::milliseconds value, const char* name) {
  if (value <= std::chrono::milliseconds::zero()) {
    throw std::invalid_argument(std::string(name) + " must be positive");
  }
}

} // namespace

StorageOptions StorageOptions::FromConfig(const rc::RuntimeConfig& config) {
  StorageOptions options;

  const auto& storage = config.storage();
  Override(options.database_name, storage.database_name());
  if (storage.layout() == rc::COLLECTION_LAYOUT_CONSOLIDATED) {
    options.layout = db::CollectionLayout::Consolidated;
  }
  if (storage.query_page_size() > 0) {
    options.query_page_size = static_cast<int32_t>(storage.query_page_size());
  }

  const auto& names = storage.collections();
  Override(options.collections.jobs, names.jobs());
  Override(options.collections.servers, names.servers());
  Override(options.collections.locks, names.locks());
  Override(options.collections.queues, names.queues());
  Override(options.collections.sets, names.sets());
  Override(options.collections.hashes, names.hashes());
  Override(options.collections.lists, names.lists());
  Override(options.collections.counters, names.counters());
  Override(options.collections.metadata, names.metadata());
  Override(options.collections.collections, names.collections());

  const auto& expiration = config.expiration();
  Override(options.default_job_expiration, expiration.default_job_expiration_ms());
  Override(options.job_ttl, expiration.job_ttl_ms());
  Override(options.server_ttl, expiration.server_ttl_ms());
  Override(options.lock_ttl, expiration.lock_ttl_ms());
  Override(options.counter_ttl, expiration.counter_ttl_ms());

  const auto& timeouts = config.timeouts();
  Override(options.server_timeout, timeouts.server_timeout_ms());
  Override(options.lock_timeout, timeouts.lock_timeout_ms());
  Override(options.request_timeout, timeouts.request_timeout_ms());

  const auto& retry = config.retry();
  if (retry.has_max_attempts()) {
    options.retry.max_attempts = retry.max_attempts();
  }
  Override(options.retry.delay, retry.delay_ms());
  if (retry.conflict_retry_limit() > 0) {
    options.conflict_retry_limit = retry.conflict_retry_limit();
  }

  const auto& breaker = config.circuit_breaker();
  if (breaker.has_enabled()) {
    options.circuit_breaker.enabled = breaker.enabled();
  }
  if (breaker.failure_threshold() > 0) {
    options.circuit_breaker.failure_threshold = breaker.failure_threshold();
  }
  if (breaker.success_threshold() > 0) {
    options.circuit_breaker.success_threshold = breaker.success_threshold();
  }
  Override(options.circuit_breaker.open_timeout, breaker.open_timeout_ms());
  Override(options.circuit_breaker.operation_timeout, breaker.operation_timeout_ms());

  options.lock_renew_enabled = config.locks().renew_enabled();
  Override(options.lock_renew_interval, config.locks().renew_interval_ms());

  return options;
}

void StorageOptions::Validate() const {
  RequireName(database_name, "storage.database_name");

  RequireName(collections.jobs, "storage.collections.jobs");
  if (layout == db::CollectionLayout::Dedicated) {
    RequireName(collections.servers, "storage.collections.servers");
    RequireName(collections.locks, "storage.collections.locks");
    RequireName(collections.queues, "storage.collections.queues");
    RequireName(collections.sets, "storage.collections.sets");
    RequireName(collections.hashes, "storage.collections.hashes");
    RequireName(collections.lists, "storage.collections.lists");
    RequireName(collections.counters, "storage.collections.counters");
  } else {
    RequireName(collections.metadata, "storage.collections.metadata");
    RequireName(collections.collections, "storage.collections.collections");
  }

  if (query_page_size <= 0) {
    throw std::invalid_argument("storage.query_page_size must be positive");
  }

  RequirePositive(default_job_expiration, "expiration.default_job_expiration");
  RequirePositive(job_ttl, "expiration.job_ttl");
  RequirePositive(server_ttl, "expiration.server_ttl");
  RequirePositive(lock_ttl, "expiration.lock_ttl");
  RequirePositive(counter_ttl, "expiration.counter_ttl");

  RequirePositive(server_timeout, "timeouts.server_timeout");
  RequirePositive(lock_timeout, "timeouts.lock_timeout");
  RequirePositive(request_timeout, "timeouts.request_timeout");

  if (retry.delay < std::chrono::milliseconds::zero()) {
    throw std::invalid_argument("retry.delay must not be negative");
  }

  circuit_breaker.Validate();
}

} // namespace jobstore::config
