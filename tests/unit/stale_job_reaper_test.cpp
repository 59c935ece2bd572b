#include "internal/jobs/stale_job_reaper.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/connection/storage_connection.hpp"
#include "internal/db/memory/memory_document_store.hpp"

namespace {

using jobstore::connection::StorageConnection;
using jobstore::jobs::StaleJobReaper;
using jobstore::util::TimePoint;
namespace states = jobstore::jobs::states;

struct FakeClock {
  std::shared_ptr<TimePoint> now = std::make_shared<TimePoint>(jobstore::util::FromUnixMillis(1'700'000'000'000));

  jobstore::util::ClockFn Fn() const {
    auto shared = now;
    return [shared] { return *shared; };
  }

  void Advance(std::chrono::milliseconds by) {
    *now += by;
  }
};

struct Fixture {
  FakeClock                                                  clock;
  std::shared_ptr<jobstore::db::memory::MemoryDocumentStore> store = std::make_shared<jobstore::db::memory::MemoryDocumentStore>(clock.Fn());
  StorageConnection connection{store, jobstore::config::StorageOptions{}, "reaper", clock.Fn()};

  std::string Processing(const std::string& queue) {
    jobstore::jobs::Invocation invocation;
    invocation.type   = "Import";
    invocation.method = "Run";

    const auto id    = connection.CreateExpiredJob(invocation, queue, {}, std::chrono::hours(1));
    auto       batch = connection.CreateWriteBatch();
    batch->AddToQueue(queue, id);
    batch->SetJobState(id, {std::string(states::kProcessing), "Fetched", {}});
    batch->Commit();
    return id;
  }

  std::string State(const std::string& id) {
    return connection.GetJobData(id)->state;
  }
};

void TestOnlyStaleProcessingJobsAreRequeued() {
  Fixture f;
  const auto stale    = f.Processing("default");
  const auto finished = f.Processing("default");
  {
    auto batch = f.connection.CreateWriteBatch();
    batch->SetJobState(finished, {std::string(states::kSucceeded), "Completed", {}});
    batch->Commit();
  }

  f.clock.Advance(std::chrono::minutes(20));
  const auto fresh = f.Processing("critical");

  StaleJobReaper reaper(f.connection.Jobs(), f.connection.Locks(), std::chrono::seconds(30));
  assert(reaper.RequeueStaleJobs(std::chrono::minutes(10)) == 1);

  assert(f.State(stale) == states::kEnqueued);
  assert(f.State(fresh) == states::kProcessing);
  assert(f.State(finished) == states::kSucceeded);

  const auto state = f.connection.GetStateData(stale);
  assert(state->reason == "Requeued stale job");
  assert(state->data.at("Queue") == "default");

  // the requeued job is fetchable again
  auto fetched = f.connection.FetchNextJob({"default"}, jobstore::util::CancellationToken::None());
  assert(fetched && fetched->JobId() == stale);
  fetched->Acknowledge();

  assert(reaper.RequeueStaleJobs(std::chrono::minutes(10)) == 0);
}

void TestPassIsSkippedWhileAnotherServerHoldsTheLock() {
  Fixture f;
  const auto stale = f.Processing("default");
  f.clock.Advance(std::chrono::hours(1) - std::chrono::minutes(1));

  jobstore::lock::LockProvider other(f.store, f.connection.Resolver(), jobstore::lock::LockOptions{"other-server"}, f.clock.Fn());
  auto                         held = other.Acquire(StaleJobReaper::kLockResource, std::chrono::seconds(30));

  StaleJobReaper reaper(f.connection.Jobs(), f.connection.Locks(), std::chrono::seconds(30));
  assert(reaper.RequeueStaleJobs(std::chrono::minutes(10)) == 0);
  assert(f.State(stale) == states::kProcessing);

  held->Release();
  assert(reaper.RequeueStaleJobs(std::chrono::minutes(10)) == 1);
  assert(f.State(stale) == states::kEnqueued);
}

} // namespace

int main() {
  TestOnlyStaleProcessingJobsAreRequeued();
  TestPassIsSkippedWhileAnotherServerHoldsTheLock();

  std::cout << "jobstore_unit_stale_job_reaper: pass\n";
  return 0;
}
