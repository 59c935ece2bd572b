#include "internal/config/storage_options.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/config/config_loader.hpp"

namespace {

using jobstore::config::ConfigLoader;
using jobstore::config::StorageOptions;

bool Rejects(const StorageOptions& options) {
  try {
    options.Validate();
  } catch (const std::invalid_argument&) {
    return true;
  }
  return false;
}

void TestEmptyConfigGivesDefaults() {
  const auto options = StorageOptions::FromConfig(jobstore::runtime::config::RuntimeConfig{});
  options.Validate();

  assert(options.database_name == "jobstore");
  assert(options.layout == jobstore::db::CollectionLayout::Dedicated);
  assert(options.collections.jobs == "jobs");
  assert(options.query_page_size == 100);
  assert(options.default_job_expiration == std::chrono::hours(24 * 7));
  assert(options.server_timeout == std::chrono::minutes(5));
  assert(options.retry.max_attempts == 5);
  assert(options.circuit_breaker.enabled);
  assert(!options.lock_renew_enabled);
}

void TestConfiguredValuesOverrideDefaults() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(storage:
  database_name: hangfire
  layout: COLLECTION_LAYOUT_CONSOLIDATED
  collections:
    metadata: meta
expiration:
  lock_ttl_ms: 30000
timeouts:
  request_timeout_ms: 2500
retry:
  max_attempts: 0
  delay_ms: 10
  conflict_retry_limit: 9
circuit_breaker:
  enabled: false
  open_timeout_ms: 1000
locks:
  renew_enabled: true
  renew_interval_ms: 5000
)");

  const auto options = StorageOptions::FromConfig(config);
  options.Validate();

  assert(options.database_name == "hangfire");
  assert(options.layout == jobstore::db::CollectionLayout::Consolidated);
  assert(options.collections.metadata == "meta");
  assert(options.collections.collections == "collections");
  assert(options.lock_ttl == std::chrono::seconds(30));
  assert(options.request_timeout == std::chrono::milliseconds(2500));

  // unset values keep their defaults
  assert(options.job_ttl == std::chrono::hours(24 * 30));

  assert(options.retry.max_attempts == 0);
  assert(options.retry.delay == std::chrono::milliseconds(10));
  assert(options.conflict_retry_limit == 9);
  assert(!options.circuit_breaker.enabled);
  assert(options.circuit_breaker.open_timeout == std::chrono::seconds(1));
  assert(options.lock_renew_enabled);
  assert(options.lock_renew_interval == std::chrono::seconds(5));
}

void TestValidateRejectsBrokenOptions() {
  StorageOptions options;
  options.database_name.clear();
  assert(Rejects(options));

  options = {};
  options.collections.locks.clear();
  assert(Rejects(options));

  // consolidated layout does not use the per-kind names
  options.layout = jobstore::db::CollectionLayout::Consolidated;
  assert(!Rejects(options));
  options.collections.metadata.clear();
  assert(Rejects(options));

  options = {};
  options.query_page_size = -1;
  assert(Rejects(options));

  options = {};
  options.lock_ttl = std::chrono::milliseconds(0);
  assert(Rejects(options));

  options = {};
  options.retry.delay = std::chrono::milliseconds(-1);
  assert(Rejects(options));

  options = {};
  options.circuit_breaker.failure_threshold = 0;
  assert(Rejects(options));
}

} // namespace

int main() {
  TestEmptyConfigGivesDefaults();
  TestConfiguredValuesOverrideDefaults();
  TestValidateRejectsBrokenOptions();

  std::cout << "jobstore_unit_storage_options: pass\n";
  return 0;
}
