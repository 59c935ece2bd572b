#include "resilient_document_store.hpp"

#include <algorithm>
#include <future>
#include <optional>
#include <thread>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace jobstore::resilience {

namespace {

using WriteOutcome = std::pair<db::Result, db::Document>;

bool IsTransientWrite(const WriteOutcome& outcome) {
  return db::IsTransient(outcome.first.code);
}

bool IsTransientResult(const db::Result& result) {
  return db::IsTransient(result.code);
}

} // namespace

ResilientDocumentStore::ResilientDocumentStore(std::shared_ptr<db::DocumentStore> inner, std::shared_ptr<CircuitBreaker> breaker, RetryPolicy retry,
                                               std::size_t call_threads)
    : inner_(std::move(inner)), breaker_(std::move(breaker)), retry_(retry), pool_(std::make_unique<CallPool>(std::max<std::size_t>(call_threads, 1))) {
  if (!inner_) {
    throw std::invalid_argument("resilient store requires an inner store");
  }
  if (!breaker_) {
    throw std::invalid_argument("resilient store requires a circuit breaker");
  }
}

void ResilientDocumentStore::Backoff(uint32_t attempt) const {
  auto delay = retry_.delay;
  for (uint32_t i = 0; i < attempt && i < 16; ++i) {
    delay *= 2;
  }
  std::this_thread::sleep_for(delay);
}

template <typename T>
std::future<T> ResilientDocumentStore::Dispatch(const std::function<T()>& call) {
  auto promise = std::make_shared<std::promise<T>>();
  auto future  = promise->get_future();

  pool_->Submit([promise, call]() {
    try {
      promise->set_value(call());
    } catch (...) {
      promise->set_exception(std::current_exception());
    }
  });
  return future;
}

template <typename T>
T ResilientDocumentStore::Run(const std::string& operation, std::function<T()> call, bool (*transient_result)(const T&), bool reissue_after_timeout) {
  observability::SpanScope span("jobstore.store." + operation);
  const auto               started = std::chrono::steady_clock::now();

  auto finish = [&](bool success, std::string_view error) {
    const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();

    auto& metrics = observability::Metrics::Instance();
    metrics.RecordStoreCall(operation, success);
    metrics.ObserveStoreLatencyMs(operation, elapsed);

    if (!success) {
      span.RecordException(error);
    }
    if (!breaker_->Enabled()) {
      return;
    }
    if (success) {
      breaker_->RecordSuccess(operation);
    } else {
      breaker_->RecordFailure(operation, error);
    }
  };

  if (breaker_->Enabled()) {
    breaker_->BeforeCall(operation);
  }

  const auto timeout = breaker_->Options().operation_timeout;

  // The attempt still in flight after a timeout. A conditional write keeps
  // waiting on it: issuing a second one could race the first into
  // reporting AlreadyExists or Conflict against its own commit.
  std::optional<std::future<T>> pending;

  for (uint32_t attempt = 0;; ++attempt) {
    const bool  last_attempt = attempt >= retry_.max_attempts;
    std::string error;

    try {
      if (!pending) {
        pending = Dispatch<T>(call);
      }
      if (pending->wait_for(timeout) == std::future_status::timeout) {
        throw util::Timeout("store operation '" + operation + "' timed out after " + std::to_string(timeout.count()) + "ms");
      }
      auto done = std::move(*pending);
      pending.reset();

      T result = done.get();
      if (!transient_result || !transient_result(result)) {
        finish(true, {});
        return result;
      }
      error = "transient store result";
      if (last_attempt) {
        finish(false, error);
        return result;
      }
    } catch (const util::Timeout& e) {
      if (reissue_after_timeout) {
        pending.reset();
      }
      if (last_attempt) {
        finish(false, e.what());
        throw;
      }
      error = e.what();
    } catch (const util::StoreError& e) {
      if (!db::IsTransient(e.code())) {
        // the store answered; the request itself was bad
        finish(true, {});
        throw;
      }
      if (last_attempt) {
        finish(false, e.what());
        throw;
      }
      error = e.what();
    }

    JOBSTORE_LOG_WARN("retrying store operation", {observability::StringField("operation", operation),
                                                   observability::IntField("attempt", attempt + 1), observability::StringField("error", error)});
    Backoff(attempt);
  }
}

std::optional<db::Document> ResilientDocumentStore::Get(const std::string& collection, const std::string& id, const std::string& partition_key) {
  auto inner = inner_;
  return Run<std::optional<db::Document>>(
      "get/" + collection, [inner, collection, id, partition_key]() { return inner->Get(collection, id, partition_key); }, nullptr, true);
}

db::Result ResilientDocumentStore::Create(const std::string& collection, db::Document& doc) {
  auto inner   = inner_;
  auto outcome = Run<WriteOutcome>(
      "create/" + collection,
      [inner, collection, copy = doc]() mutable {
        auto result = inner->Create(collection, copy);
        return WriteOutcome{std::move(result), std::move(copy)};
      },
      &IsTransientWrite, false);

  if (outcome.first) {
    doc = std::move(outcome.second);
  }
  return outcome.first;
}

db::Result ResilientDocumentStore::Upsert(const std::string& collection, db::Document& doc) {
  auto inner   = inner_;
  auto outcome = Run<WriteOutcome>(
      "upsert/" + collection,
      [inner, collection, copy = doc]() mutable {
        auto result = inner->Upsert(collection, copy);
        return WriteOutcome{std::move(result), std::move(copy)};
      },
      &IsTransientWrite, true);

  if (outcome.first) {
    doc = std::move(outcome.second);
  }
  return outcome.first;
}

db::Result ResilientDocumentStore::Replace(const std::string& collection, db::Document& doc, const std::optional<std::string>& if_match) {
  auto inner   = inner_;
  auto outcome = Run<WriteOutcome>(
      "replace/" + collection,
      [inner, collection, if_match, copy = doc]() mutable {
        auto result = inner->Replace(collection, copy, if_match);
        return WriteOutcome{std::move(result), std::move(copy)};
      },
      &IsTransientWrite, !if_match.has_value());

  if (outcome.first) {
    doc = std::move(outcome.second);
  }
  return outcome.first;
}

db::Result ResilientDocumentStore::Delete(const std::string& collection, const std::string& id, const std::string& partition_key,
                                          const std::optional<std::string>& if_match) {
  auto inner = inner_;
  return Run<db::Result>(
      "delete/" + collection, [inner, collection, id, partition_key, if_match]() { return inner->Delete(collection, id, partition_key, if_match); },
      &IsTransientResult, true);
}

db::QueryPage ResilientDocumentStore::Query(const std::string& collection, const db::DocumentQuery& query, const db::QueryOptions& options) {
  auto inner = inner_;
  return Run<db::QueryPage>(
      "query/" + collection, [inner, collection, query, options]() { return inner->Query(collection, query, options); }, nullptr, true);
}

int64_t ResilientDocumentStore::Count(const std::string& collection, const db::DocumentQuery& query, const std::optional<std::string>& partition_key) {
  auto inner = inner_;
  return Run<int64_t>(
      "count/" + collection, [inner, collection, query, partition_key]() { return inner->Count(collection, query, partition_key); }, nullptr, true);
}

std::size_t ResilientDocumentStore::PurgeExpired() {
  auto inner = inner_;
  return Run<std::size_t>(
      "purge_expired", [inner]() { return inner->PurgeExpired(); }, nullptr, true);
}

} // namespace jobstore::resilience
