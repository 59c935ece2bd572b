#pragma once

#include <chrono>
#include <cstdint>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "internal/db/api/document_store.hpp"
#include "internal/resilience/call_pool.hpp"
#include "internal/resilience/circuit_breaker.hpp"

namespace jobstore::resilience {

struct RetryPolicy {
  // Retries after the first attempt; 0 disables retrying.
  uint32_t                  max_attempts = 5;
  std::chrono::milliseconds delay{100};
};

/*
  ResilientDocumentStore

  Decorates a DocumentStore with, per call:

    - a timeout (options.operation_timeout); calls run on a fixed CallPool
      and a timed-out call keeps running there
    - bounded retries with doubling delay for transient outcomes and timeouts
    - Create and Replace with if_match are never reissued while a timed-out
      attempt is outstanding; later attempts wait on that same call, and
      Timeout is thrown if it never answers
    - one circuit breaker verdict for the whole retried call

  NotFound, AlreadyExists and Conflict are answers, not failures: they are
  returned as-is and count as breaker successes.

  The breaker may be shared between stores.
*/
class ResilientDocumentStore final : public db::DocumentStore {
 public:
  static constexpr std::size_t kDefaultCallThreads = 16;

  ResilientDocumentStore(std::shared_ptr<db::DocumentStore> inner, std::shared_ptr<CircuitBreaker> breaker, RetryPolicy retry = {},
                         std::size_t call_threads = kDefaultCallThreads);

  std::optional<db::Document> Get(const std::string& collection, const std::string& id, const std::string& partition_key) override;

  db::Result Create(const std::string& collection, db::Document& doc) override;
  db::Result Upsert(const std::string& collection, db::Document& doc) override;
  db::Result Replace(const std::string& collection, db::Document& doc, const std::optional<std::string>& if_match) override;
  db::Result Delete(const std::string& collection, const std::string& id, const std::string& partition_key,
                    const std::optional<std::string>& if_match) override;

  db::QueryPage Query(const std::string& collection, const db::DocumentQuery& query, const db::QueryOptions& options) override;
  int64_t       Count(const std::string& collection, const db::DocumentQuery& query, const std::optional<std::string>& partition_key) override;

  std::size_t PurgeExpired() override;

  CircuitBreaker& Breaker() {
    return *breaker_;
  }

 private:
  // transient_result, when set, marks returned values worth retrying.
  template <typename T>
  T Run(const std::string& operation, std::function<T()> call, bool (*transient_result)(const T&), bool reissue_after_timeout);

  template <typename T>
  std::future<T> Dispatch(const std::function<T()>& call);

  void Backoff(uint32_t attempt) const;

  std::shared_ptr<db::DocumentStore> inner_;
  std::shared_ptr<CircuitBreaker>    breaker_;
  RetryPolicy                        retry_;
  std::unique_ptr<CallPool>          pool_; // last: joined before the rest is torn down
};

} // namespace jobstore::resilience
