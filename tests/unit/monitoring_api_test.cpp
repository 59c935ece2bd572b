#include "internal/monitoring/monitoring_api.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/memory/memory_document_store.hpp"
#include "internal/jobs/job_state.hpp"

namespace {

using jobstore::connection::StorageConnection;
using jobstore::monitoring::MonitoringApi;
using jobstore::util::TimePoint;
namespace states = jobstore::jobs::states;

// 2023-11-14T22:13:20Z
constexpr int64_t kStartMs = 1'700'000'000'000;

struct FakeClock {
  std::shared_ptr<TimePoint> now = std::make_shared<TimePoint>(jobstore::util::FromUnixMillis(kStartMs));

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
  StorageConnection connection{store, jobstore::config::StorageOptions{}, "monitor", clock.Fn()};
  MonitoringApi     monitoring{connection};

  std::string Create(const std::string& queue, const std::string& method) {
    jobstore::jobs::Invocation invocation;
    invocation.type            = "Mailer";
    invocation.method          = method;
    invocation.parameter_types = {"System.String"};
    invocation.arguments       = {"\"hello\""};

    clock.Advance(std::chrono::seconds(1));
    return connection.CreateExpiredJob(invocation, queue, {{"CurrentCulture", "en-US"}}, std::chrono::hours(1));
  }

  std::string Enqueue(const std::string& queue, const std::string& method) {
    const auto id    = Create(queue, method);
    auto       batch = connection.CreateWriteBatch();
    batch->AddToQueue(queue, id);
    batch->Commit();
    return id;
  }

  void Move(const std::string& id, std::string_view state, const std::string& reason) {
    clock.Advance(std::chrono::seconds(1));
    auto batch = connection.CreateWriteBatch();
    batch->SetJobState(id, {std::string(state), reason, {}});
    batch->Commit();
  }
};

std::vector<std::string> Ids(const std::vector<jobstore::monitoring::JobSummary>& jobs) {
  std::vector<std::string> ids;
  for (const auto& job : jobs) {
    ids.push_back(job.job_id);
  }
  return ids;
}

struct Population {
  std::string d1, d2, d3, p1, c1, s1, s2, f1, sc1;
};

Population Populate(Fixture& f) {
  Population p;
  p.d1 = f.Enqueue("default", "Send");
  p.d2 = f.Enqueue("default", "Send");
  p.d3 = f.Enqueue("default", "Send");
  p.p1 = f.Enqueue("default", "Send");
  f.Move(p.p1, states::kProcessing, "Fetched");
  p.c1 = f.Enqueue("critical", "Page");

  p.s1 = f.Create("default", "Archive");
  f.Move(p.s1, states::kSucceeded, "Completed");
  p.s2 = f.Create("default", "Archive");
  f.Move(p.s2, states::kSucceeded, "Completed");
  p.f1 = f.Create("default", "Archive");
  f.Move(p.f1, states::kFailed, "Exception");
  p.sc1 = f.Create("default", "Remind");
  f.Move(p.sc1, states::kScheduled, "Delayed");

  f.connection.AnnounceServer("worker-1", {2, {"critical", "default"}});
  return p;
}

void TestStatisticsCountByState() {
  Fixture f;
  Populate(f);

  const auto stats = f.monitoring.GetStatistics();
  assert(stats.enqueued == 4);
  assert(stats.processing == 1);
  assert(stats.succeeded == 2);
  assert(stats.failed == 1);
  assert(stats.scheduled == 1);
  assert(stats.deleted == 0);
  assert(stats.servers == 1);
  assert(stats.queues == 2);

  assert(f.monitoring.EnqueuedCount("default") == 3);
  assert(f.monitoring.EnqueuedCount("critical") == 1);
  assert(f.monitoring.FetchedCount("default") == 1);
  assert(f.monitoring.ProcessingCount() == 1);
  assert(f.monitoring.SucceededListCount() == 2);
  assert(f.monitoring.FailedCount() == 1);
  assert(f.monitoring.ScheduledCount() == 1);
  assert(f.monitoring.DeletedListCount() == 0);
}

void TestPagedListsFollowTheirOrdering() {
  Fixture f;
  const auto p = Populate(f);

  assert((Ids(f.monitoring.EnqueuedJobs("default", 0, 2)) == std::vector<std::string>{p.d1, p.d2}));
  assert((Ids(f.monitoring.EnqueuedJobs("default", 2, 2)) == std::vector<std::string>{p.d3}));
  assert(f.monitoring.EnqueuedJobs("default", 5, 2).empty());
  assert((Ids(f.monitoring.FetchedJobs("default", 0, 10)) == std::vector<std::string>{p.p1}));
  assert(f.monitoring.FetchedJobs("critical", 0, 10).empty());
  assert((Ids(f.monitoring.ProcessingJobs(0, 10)) == std::vector<std::string>{p.p1}));
  assert((Ids(f.monitoring.ScheduledJobs(0, 10)) == std::vector<std::string>{p.sc1}));
  assert((Ids(f.monitoring.FailedJobs(0, 10)) == std::vector<std::string>{p.f1}));

  // newest finished first
  const auto succeeded = f.monitoring.SucceededJobs(0, 10);
  assert((Ids(succeeded) == std::vector<std::string>{p.s2, p.s1}));
  assert(succeeded.front().reason == "Completed");
  assert(succeeded.front().invocation.method == "Archive");
  assert(succeeded.front().queue == "default");

  bool threw = false;
  try {
    (void)f.monitoring.SucceededJobs(-1, 10);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestQueuesAndServers() {
  Fixture f;
  const auto p = Populate(f);

  const auto queues = f.monitoring.Queues();
  assert(queues.size() == 2);
  assert(queues[0].name == "critical");
  assert(queues[0].length == 1);
  assert((Ids(queues[0].first_jobs) == std::vector<std::string>{p.c1}));
  assert(queues[1].name == "default");
  assert(queues[1].length == 3);
  assert(queues[1].fetched == 1);
  assert(queues[1].first_jobs.size() == 3);

  const auto servers = f.monitoring.Servers();
  assert(servers.size() == 1);
  assert(servers[0].server_id == "worker-1");
  assert(servers[0].worker_count == 2);
  assert(servers[0].queues.size() == 2);
  assert(servers[0].last_heartbeat == *f.clock.now);
}

void TestJobDetailsListHistoryNewestFirst() {
  Fixture f;
  const auto p = Populate(f);

  const auto details = f.monitoring.GetJobDetails(p.p1);
  assert(details.has_value());
  assert(details->queue == "default");
  assert(details->invocation.type == "Mailer");
  assert(details->parameters.at("CurrentCulture") == "en-US");
  assert(details->expire_at.has_value());
  assert(details->history.size() == 2);
  assert(details->history[0].state == states::kProcessing);
  assert(details->history[0].reason == "Fetched");
  assert(details->history[1].state == states::kEnqueued);
  assert(details->history[1].data.at("Queue") == "default");
  assert(details->history[0].created_at > details->history[1].created_at);

  assert(!f.monitoring.GetJobDetails("missing").has_value());
}

void TestOutcomeCounterKeys() {
  const auto at = jobstore::util::FromUnixMillis(kStartMs);
  assert(jobstore::monitoring::OutcomeCounterKey("succeeded") == "stats:succeeded");
  assert(jobstore::monitoring::DailyOutcomeCounterKey("failed", at) == "stats:failed:2023-11-14");
  assert(jobstore::monitoring::HourlyOutcomeCounterKey("failed", at) == "stats:failed:2023-11-14-22");
}

void TestTimeSeriesReadOutcomeCounters() {
  Fixture f;

  auto batch = f.connection.CreateWriteBatch();
  jobstore::monitoring::AddOutcomeCounters(*batch, states::kSucceeded, *f.clock.now, std::chrono::hours(24 * 7));
  jobstore::monitoring::AddOutcomeCounters(*batch, states::kSucceeded, *f.clock.now, std::chrono::hours(24 * 7));
  jobstore::monitoring::AddOutcomeCounters(*batch, states::kFailed, *f.clock.now - std::chrono::hours(1), std::chrono::hours(24 * 7));
  batch->Commit();

  assert(f.connection.GetCounter("stats:succeeded") == 2);

  const auto today  = jobstore::util::StartOfUtcDay(*f.clock.now);
  const auto daily  = f.monitoring.SucceededByDatesCount();
  assert(daily.size() == 7);
  assert(daily.at(today) == 2);
  assert(daily.at(today - std::chrono::hours(24)) == 0);
  assert(f.monitoring.FailedByDatesCount().at(today) == 1);

  const auto this_hour = jobstore::util::StartOfUtcHour(*f.clock.now);
  const auto hourly    = f.monitoring.HourlySucceededJobs();
  assert(hourly.size() == 24);
  assert(hourly.at(this_hour) == 2);

  const auto failed_hourly = f.monitoring.HourlyFailedJobs();
  assert(failed_hourly.at(this_hour) == 0);
  assert(failed_hourly.at(this_hour - std::chrono::hours(1)) == 1);
}

} // namespace

int main() {
  TestStatisticsCountByState();
  TestPagedListsFollowTheirOrdering();
  TestQueuesAndServers();
  TestJobDetailsListHistoryNewestFirst();
  TestOutcomeCounterKeys();
  TestTimeSeriesReadOutcomeCounters();

  std::cout << "jobstore_unit_monitoring_api: pass\n";
  return 0;
}
