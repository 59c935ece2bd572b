#include "internal/queue/job_fetcher.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "internal/db/memory/memory_document_store.hpp"
#include "internal/resilience/resilient_document_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using jobstore::db::CollectionLayout;
using jobstore::db::CollectionNames;
using jobstore::db::CollectionResolver;
using jobstore::jobs::Invocation;
using jobstore::jobs::JobManager;
using jobstore::queue::JobFetcher;
using jobstore::util::CancellationSource;
using jobstore::util::CancellationToken;
namespace states = jobstore::jobs::states;

Invocation Noop() {
  Invocation invocation;
  invocation.type   = "Tasks";
  invocation.method = "Noop";
  return invocation;
}

// Memory store whose next Replace commits only after a delay.
class SlowReplaceStore final : public jobstore::db::DocumentStore {
 public:
  std::chrono::milliseconds slow_next_replace{0};
  std::atomic<int>          replaces{0};

  std::optional<jobstore::db::Document> Get(const std::string& collection, const std::string& id, const std::string& partition_key) override {
    return inner_.Get(collection, id, partition_key);
  }
  jobstore::db::Result Create(const std::string& collection, jobstore::db::Document& doc) override {
    return inner_.Create(collection, doc);
  }
  jobstore::db::Result Upsert(const std::string& collection, jobstore::db::Document& doc) override {
    return inner_.Upsert(collection, doc);
  }
  jobstore::db::Result Replace(const std::string& collection, jobstore::db::Document& doc, const std::optional<std::string>& if_match) override {
    ++replaces;
    const auto delay = std::exchange(slow_next_replace, std::chrono::milliseconds(0));
    std::this_thread::sleep_for(delay);
    return inner_.Replace(collection, doc, if_match);
  }
  jobstore::db::Result Delete(const std::string& collection, const std::string& id, const std::string& partition_key,
                              const std::optional<std::string>& if_match) override {
    return inner_.Delete(collection, id, partition_key, if_match);
  }
  jobstore::db::QueryPage Query(const std::string& collection, const jobstore::db::DocumentQuery& query,
                                const jobstore::db::QueryOptions& options) override {
    return inner_.Query(collection, query, options);
  }
  int64_t Count(const std::string& collection, const jobstore::db::DocumentQuery& query, const std::optional<std::string>& partition_key) override {
    return inner_.Count(collection, query, partition_key);
  }
  std::size_t PurgeExpired() override {
    return inner_.PurgeExpired();
  }

 private:
  jobstore::db::memory::MemoryDocumentStore inner_;
};

struct Fixture {
  std::shared_ptr<jobstore::db::memory::MemoryDocumentStore> store = std::make_shared<jobstore::db::memory::MemoryDocumentStore>();
  JobManager jobs{store, CollectionResolver(CollectionLayout::Dedicated, CollectionNames{})};

  std::string Enqueue(const std::string& queue, int64_t created_offset_ms = 0) {
    const auto created = jobstore::util::Now() + std::chrono::milliseconds(created_offset_ms);
    const auto id      = jobs.CreateExpiredJob(Noop(), queue, {}, std::chrono::hours(1), created);
    assert(jobs.AddToQueue(id, queue));
    return id;
  }

  std::string State(const std::string& id) {
    return jobs.Load(id)->body.state();
  }
};

void TestFetchesOldestJobAndAcknowledgeKeepsItProcessing() {
  Fixture f;
  const auto newer = f.Enqueue("default", 10);
  const auto older = f.Enqueue("default", 0);

  JobFetcher fetcher(f.jobs);
  auto       fetched = fetcher.FetchNext({"default"}, CancellationToken::None());
  assert(fetched);
  assert(fetched->JobId() == older);
  assert(fetched->Queue() == "default");
  assert(f.State(older) == states::kProcessing);

  fetched->Acknowledge();
  assert(fetched->IsResolved());
  fetched.reset();
  assert(f.State(older) == states::kProcessing);

  auto next = fetcher.FetchNext({"default"}, CancellationToken::None());
  assert(next && next->JobId() == newer);
  next->Acknowledge();

  assert(!fetcher.FetchNext({"default"}, CancellationToken::None()));
}

void TestQueuesAreTriedInPreferenceOrder() {
  Fixture f;
  f.Enqueue("low");
  const auto critical = f.Enqueue("critical", 50);

  JobFetcher fetcher(f.jobs);
  auto       fetched = fetcher.FetchNext({"critical", "low"}, CancellationToken::None());
  assert(fetched && fetched->JobId() == critical);
  fetched->Acknowledge();

  assert(!fetcher.FetchNext({"other"}, CancellationToken::None()));
}

void TestUnresolvedHandleRequeuesOnDestruction() {
  Fixture    f;
  const auto id = f.Enqueue("default");

  JobFetcher fetcher(f.jobs);
  {
    auto fetched = fetcher.FetchNext({"default"}, CancellationToken::None());
    assert(fetched && fetched->JobId() == id);
  }

  auto record = f.jobs.Load(id);
  assert(record->body.state() == states::kEnqueued);
  const auto& last = record->body.state_history(record->body.state_history_size() - 1);
  assert(last.reason() == "Requeued");

  auto again = fetcher.FetchNext({"default"}, CancellationToken::None());
  assert(again && again->JobId() == id);
  again->Acknowledge();
}

void TestRequeueThenAcknowledgeIsIgnored() {
  Fixture    f;
  const auto id = f.Enqueue("default");

  JobFetcher fetcher(f.jobs);
  auto       fetched = fetcher.FetchNext({"default"}, CancellationToken::None());
  fetched->Requeue();
  fetched->Acknowledge();
  fetched->Requeue();
  assert(f.State(id) == states::kEnqueued);
}

void TestCancelledTokenStopsTheFetch() {
  Fixture f;
  f.Enqueue("default");

  CancellationSource source;
  source.Cancel();

  JobFetcher fetcher(f.jobs);
  bool       cancelled = false;
  try {
    (void)fetcher.FetchNext({"default"}, source.Token());
  } catch (const jobstore::util::OperationCancelled&) {
    cancelled = true;
  }
  assert(cancelled);
}

void TestEmptyQueueListIsRejected() {
  Fixture    f;
  JobFetcher fetcher(f.jobs);

  bool threw = false;
  try {
    (void)fetcher.FetchNext({}, CancellationToken::None());
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestRacingFetchersClaimEachJobExactlyOnce() {
  Fixture f;
  constexpr int kJobs    = 40;
  constexpr int kWorkers = 6;
  for (int i = 0; i < kJobs; ++i) {
    f.Enqueue("default", i);
  }

  std::mutex                 mutex;
  std::multiset<std::string> claimed;
  std::vector<std::thread>   workers;

  for (int w = 0; w < kWorkers; ++w) {
    workers.emplace_back([&] {
      JobFetcher fetcher(f.jobs, jobstore::queue::FetcherOptions{5});
      while (auto fetched = fetcher.FetchNext({"default"}, CancellationToken::None())) {
        fetched->Acknowledge();
        std::lock_guard<std::mutex> lock(mutex);
        claimed.insert(fetched->JobId());
      }
    });
  }
  for (auto& worker : workers) worker.join();

  // offset paging can skip candidates that others claimed mid-scan; pick up leftovers alone
  JobFetcher drain(f.jobs);
  while (auto fetched = drain.FetchNext({"default"}, CancellationToken::None())) {
    fetched->Acknowledge();
    claimed.insert(fetched->JobId());
  }

  assert(claimed.size() == static_cast<std::size_t>(kJobs));
  for (const auto& id : claimed) {
    assert(claimed.count(id) == 1);
    assert(f.State(id) == states::kProcessing);
  }
}

void TestClaimThatOutlivesTheStoreTimeoutStillHandsOutTheJob() {
  auto slow = std::make_shared<SlowReplaceStore>();

  jobstore::resilience::CircuitBreakerOptions breaker_options;
  breaker_options.operation_timeout = std::chrono::milliseconds(100);
  jobstore::resilience::RetryPolicy retry;
  retry.max_attempts = 5;
  retry.delay        = std::chrono::milliseconds(1);
  auto store         = std::make_shared<jobstore::resilience::ResilientDocumentStore>(
      slow, std::make_shared<jobstore::resilience::CircuitBreaker>(breaker_options), retry);

  JobManager jobs(store, CollectionResolver(CollectionLayout::Dedicated, CollectionNames{}));
  const auto id = jobs.CreateExpiredJob(Noop(), "default", {}, std::chrono::hours(1));
  assert(jobs.AddToQueue(id, "default"));

  const int before        = slow->replaces;
  slow->slow_next_replace = std::chrono::milliseconds(250);

  JobFetcher fetcher(jobs);
  auto       fetched = fetcher.FetchNext({"default"}, CancellationToken::None());
  assert(fetched);
  assert(fetched->JobId() == id);
  assert(slow->replaces == before + 1);
  assert(jobs.Load(id)->body.state() == states::kProcessing);

  fetched->Requeue();
  assert(jobs.Load(id)->body.state() == states::kEnqueued);
  auto again = fetcher.FetchNext({"default"}, CancellationToken::None());
  assert(again && again->JobId() == id);
  again->Acknowledge();
}

} // namespace

int main() {
  TestFetchesOldestJobAndAcknowledgeKeepsItProcessing();
  TestQueuesAreTriedInPreferenceOrder();
  TestUnresolvedHandleRequeuesOnDestruction();
  TestRequeueThenAcknowledgeIsIgnored();
  TestCancelledTokenStopsTheFetch();
  TestEmptyQueueListIsRejected();
  TestRacingFetchersClaimEachJobExactlyOnce();
  TestClaimThatOutlivesTheStoreTimeoutStillHandsOutTheJob();

  std::cout << "jobstore_unit_job_fetcher: pass\n";
  return 0;
}
