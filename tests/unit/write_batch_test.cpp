#include "internal/batch/write_batch.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/connection/storage_connection.hpp"
#include "internal/db/codec/document_codec.hpp"
#include "internal/db/memory/memory_document_store.hpp"
#include "internal/jobs/job_state.hpp"
#include "internal/util/errors.hpp"
#include "jobstore/documents/v1/documents.pb.h"

namespace {

using jobstore::connection::StorageConnection;
using jobstore::db::DocumentKind;
namespace states = jobstore::jobs::states;

struct Fixture {
  std::shared_ptr<jobstore::db::memory::MemoryDocumentStore> store = std::make_shared<jobstore::db::memory::MemoryDocumentStore>();
  StorageConnection                                          connection{store, jobstore::config::StorageOptions{}};
};

jobstore::jobs::Invocation Noop() {
  jobstore::jobs::Invocation invocation;
  invocation.type   = "Tasks";
  invocation.method = "Noop";
  return invocation;
}

void TestIncrementsInOneBatchAccumulate() {
  Fixture f;
  auto    batch = f.connection.CreateWriteBatch();
  for (int i = 0; i < 10; ++i) {
    batch->IncrementCounter("stats:succeeded");
  }
  batch->DecrementCounter("stats:succeeded");
  assert(batch->Size() == 11);
  batch->Commit();
  assert(batch->Size() == 0);

  assert(f.connection.GetCounter("stats:succeeded") == 9);
}

void TestConcurrentBatchesConvergeOnCounter() {
  Fixture       f;
  constexpr int kThreads = 8;
  constexpr int kPerThread = 25;

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < kPerThread; ++i) {
        auto batch = f.connection.CreateWriteBatch();
        batch->IncrementCounter("hits");
        batch->Commit();
      }
    });
  }
  for (auto& thread : threads) thread.join();

  assert(f.connection.GetCounter("hits") == kThreads * kPerThread);
}

void TestDecrementOfMissingCounterIsNoOp() {
  Fixture f;
  auto    batch = f.connection.CreateWriteBatch();
  batch->DecrementCounter("never-set");
  batch->Commit();
  assert(f.connection.GetCounter("never-set") == 0);

  const auto location = f.connection.Resolver().Resolve(DocumentKind::Counter);
  assert(!f.store->Get(location.collection, "counter:never-set", location.partition_key).has_value());
}

void TestCounterExpiryIsApplied() {
  Fixture f;
  auto    batch = f.connection.CreateWriteBatch();
  batch->IncrementCounter("stats:succeeded:2024-01-01", std::chrono::hours(1));
  batch->Commit();

  const auto location = f.connection.Resolver().Resolve(DocumentKind::Counter);
  auto       doc      = f.store->Get(location.collection, "counter:stats:succeeded:2024-01-01", location.partition_key);
  assert(doc && doc->expire_at_ms.has_value());
}

void TestFirstFailureStopsTheBatch() {
  Fixture f;
  auto    batch = f.connection.CreateWriteBatch();
  batch->IncrementCounter("before");
  batch->InsertToList("log", "first");
  batch->InsertToList("log", "first-again");
  batch->IncrementCounter("after");

  // occupy the slot the second insert will use
  const auto          location = f.connection.Resolver().Resolve(DocumentKind::List, "log");
  jobstore::db::Document squatter;
  squatter.id            = "list:log:1";
  squatter.partition_key = location.partition_key;
  squatter.document_type = "list";
  assert(f.store->Create(location.collection, squatter));

  bool threw = false;
  try {
    batch->Commit();
  } catch (const jobstore::util::AlreadyExists&) {
    threw = true;
  }
  assert(threw);
  assert(f.connection.GetCounter("before") == 1);
  assert(f.connection.GetCounter("after") == 0);
}

void TestJobOperationsAndQueueDocument() {
  Fixture    f;
  const auto id = f.connection.CreateExpiredJob(Noop(), "emails", {}, std::chrono::hours(1));

  auto batch = f.connection.CreateWriteBatch();
  batch->AddToQueue("emails", id);
  batch->PersistJob(id);
  batch->Commit();

  auto data = f.connection.GetJobData(id);
  assert(data->state == states::kEnqueued);
  assert(!f.connection.Jobs().Load(id)->document.expire_at_ms.has_value());

  const auto queues = f.connection.Resolver().Resolve(DocumentKind::Queue);
  auto       queue  = f.store->Get(queues.collection, "queue:emails", queues.partition_key);
  assert(queue.has_value());
  const auto body = jobstore::db::codec::Unpack<jobstore::documents::v1::QueueBody>(*queue);
  assert(body.queue_name() == "emails");
  assert(body.length() == 1);

  batch = f.connection.CreateWriteBatch();
  batch->SetJobState(id, {std::string(states::kSucceeded), "Completed", {{"Latency", "12"}}});
  batch->AddJobState(id, {std::string(states::kDeleted), "Cleanup", {}});
  batch->ExpireJob(id, std::chrono::minutes(10));
  batch->Commit();

  auto state = f.connection.GetStateData(id);
  assert(state->name == states::kDeleted);
  assert(state->data.at("Latency") == "12");
  assert(f.connection.Jobs().Load(id)->document.expire_at_ms.has_value());
}

void TestListsKeepInsertionOrderAndTrimByPosition() {
  Fixture f;
  auto    batch = f.connection.CreateWriteBatch();
  for (const auto* value : {"a", "b", "c", "b", "d"}) {
    batch->InsertToList("history", value);
  }
  batch->Commit();

  assert((f.connection.GetAllItemsFromList("history") == std::vector<std::string>{"a", "b", "c", "b", "d"}));

  batch = f.connection.CreateWriteBatch();
  batch->RemoveFromList("history", "b");
  batch->Commit();
  assert((f.connection.GetAllItemsFromList("history") == std::vector<std::string>{"a", "c", "d"}));

  batch = f.connection.CreateWriteBatch();
  batch->InsertToList("history", "e");
  batch->TrimList("history", 1, 2);
  batch->Commit();
  assert((f.connection.GetAllItemsFromList("history") == std::vector<std::string>{"c", "d"}));
  assert(f.connection.GetListCount("history") == 2);
}

void TestSetsUpsertByValue() {
  Fixture f;
  auto    batch = f.connection.CreateWriteBatch();
  batch->AddToSet("schedule", "job-3", 30);
  batch->AddToSet("schedule", "job-1", 10);
  batch->AddToSet("schedule", "job-2", 20);
  batch->AddToSet("schedule", "job-1", 40);
  batch->RemoveFromSet("schedule", "");
  batch->Commit();

  assert((f.connection.GetAllItemsFromSet("schedule") == std::vector<std::string>{"job-2", "job-3", "job-1"}));

  batch = f.connection.CreateWriteBatch();
  batch->RemoveFromSet("schedule", "job-3");
  batch->Commit();
  assert(f.connection.GetSetCount("schedule") == 2);
}

void TestExpireAndPersistWholePartitions() {
  Fixture f;
  auto    batch = f.connection.CreateWriteBatch();
  batch->AddToSet("s", "v1");
  batch->AddToSet("s", "v2");
  batch->InsertToList("l", "x");
  batch->SetRangeInHash("h", {{"f1", "1"}, {"f2", "2"}});
  batch->ExpireSet("s", std::chrono::minutes(5));
  batch->ExpireList("l", std::chrono::minutes(5));
  batch->ExpireHash("h", std::chrono::minutes(5));
  batch->Commit();

  const auto set_ttl = f.connection.GetSetTtl("s");
  assert(set_ttl && *set_ttl <= std::chrono::minutes(5) && *set_ttl > std::chrono::minutes(4));
  assert(f.connection.GetListTtl("l").has_value());
  assert(f.connection.GetHashTtl("h").has_value());

  batch = f.connection.CreateWriteBatch();
  batch->PersistSet("s");
  batch->PersistList("l");
  batch->PersistHash("h");
  batch->Commit();

  assert(!f.connection.GetSetTtl("s").has_value());
  assert(!f.connection.GetListTtl("l").has_value());
  assert(!f.connection.GetHashTtl("h").has_value());
}

void TestHashesReplaceFieldsAndRemoveWholeKey() {
  Fixture f;
  auto    batch = f.connection.CreateWriteBatch();
  batch->SetRangeInHash("recurring-job:nightly", {{"Cron", "0 0 * * *"}, {"Queue", "default"}});
  batch->SetRangeInHash("recurring-job:nightly", {{"Queue", "critical"}});
  batch->Commit();

  const auto entries = f.connection.GetAllEntriesFromHash("recurring-job:nightly");
  assert(entries.size() == 2);
  assert(entries.at("Queue") == "critical");

  batch = f.connection.CreateWriteBatch();
  batch->RemoveHash("recurring-job:nightly");
  batch->Commit();
  assert(f.connection.GetHashCount("recurring-job:nightly") == 0);
}

void TestEmptyKeysAreRejectedAtRegistration() {
  Fixture f;
  auto    batch = f.connection.CreateWriteBatch();

  bool threw = false;
  try {
    batch->IncrementCounter("");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
  assert(batch->Size() == 0);
}

} // namespace

int main() {
  TestIncrementsInOneBatchAccumulate();
  TestConcurrentBatchesConvergeOnCounter();
  TestDecrementOfMissingCounterIsNoOp();
  TestCounterExpiryIsApplied();
  TestFirstFailureStopsTheBatch();
  TestJobOperationsAndQueueDocument();
  TestListsKeepInsertionOrderAndTrimByPosition();
  TestSetsUpsertByValue();
  TestExpireAndPersistWholePartitions();
  TestHashesReplaceFieldsAndRemoveWholeKey();
  TestEmptyKeysAreRejectedAtRegistration();

  std::cout << "jobstore_unit_write_batch: pass\n";
  return 0;
}
