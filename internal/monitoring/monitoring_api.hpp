#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/batch/write_batch.hpp"
#include "internal/connection/storage_connection.hpp"
#include "internal/jobs/invocation.hpp"
#include "internal/util/time.hpp"

namespace jobstore::monitoring {

struct Statistics {
  int64_t enqueued   = 0;
  int64_t scheduled  = 0;
  int64_t processing = 0;
  int64_t succeeded  = 0;
  int64_t failed     = 0;
  int64_t deleted    = 0;
  int64_t servers    = 0;
  int64_t queues     = 0;
};

struct JobSummary {
  std::string                        job_id;
  std::string                        queue;
  std::string                        state;
  std::string                        reason;
  jobs::Invocation                   invocation;
  std::map<std::string, std::string> state_data;
  util::TimePoint                    created_at;
  util::TimePoint                    updated_at;
};

struct ServerInfo {
  std::string              server_id;
  std::string              name;
  int32_t                  worker_count = 0;
  std::vector<std::string> queues;
  util::TimePoint          started_at;
  util::TimePoint          last_heartbeat;
};

struct QueueInfo {
  std::string             name;
  int64_t                 length  = 0;
  int64_t                 fetched = 0;
  std::vector<JobSummary> first_jobs;
};

struct HistoryEntry {
  std::string                        state;
  std::string                        reason;
  util::TimePoint                    created_at;
  std::map<std::string, std::string> data;
};

struct JobDetails {
  std::string                        job_id;
  std::string                        queue;
  util::TimePoint                    created_at;
  std::optional<util::TimePoint>     expire_at;
  jobs::Invocation                   invocation;
  std::vector<HistoryEntry>          history; // newest first
  std::map<std::string, std::string> parameters;
};

// Bucket start -> count; every bucket in the window is present.
using TimeSeries = std::map<util::TimePoint, int64_t>;

// Counter keys written per finished job and read back by the time series.
std::string OutcomeCounterKey(std::string_view outcome);
std::string DailyOutcomeCounterKey(std::string_view outcome, util::TimePoint at);
std::string HourlyOutcomeCounterKey(std::string_view outcome, util::TimePoint at);

// Queues the three outcome counters ("succeeded" / "failed") on the batch.
void AddOutcomeCounters(batch::WriteBatch& batch, std::string_view outcome, util::TimePoint at, std::chrono::milliseconds ttl);

/*
  MonitoringApi

  Read-only projection over the job documents for dashboards and jobctl.
  Paged lists take a zero-based offset and a page size. Counts run as
  store-side COUNT queries; time series read the outcome counters.
*/
class MonitoringApi {
 public:
  static constexpr std::size_t kQueuePreviewSize = 5;

  explicit MonitoringApi(connection::StorageConnection& connection);

  Statistics GetStatistics();

  std::vector<JobSummary> EnqueuedJobs(const std::string& queue, int32_t from, int32_t count);
  std::vector<JobSummary> FetchedJobs(const std::string& queue, int32_t from, int32_t count);
  std::vector<JobSummary> ProcessingJobs(int32_t from, int32_t count);
  std::vector<JobSummary> ScheduledJobs(int32_t from, int32_t count);
  std::vector<JobSummary> SucceededJobs(int32_t from, int32_t count);
  std::vector<JobSummary> FailedJobs(int32_t from, int32_t count);
  std::vector<JobSummary> DeletedJobs(int32_t from, int32_t count);

  std::vector<ServerInfo> Servers();
  std::vector<QueueInfo>  Queues();

  std::optional<JobDetails> GetJobDetails(const std::string& job_id);

  int64_t EnqueuedCount(const std::string& queue);
  int64_t FetchedCount(const std::string& queue);
  int64_t ScheduledCount();
  int64_t ProcessingCount();
  int64_t SucceededListCount();
  int64_t FailedCount();
  int64_t DeletedListCount();

  TimeSeries SucceededByDatesCount();
  TimeSeries FailedByDatesCount();
  TimeSeries HourlySucceededJobs();
  TimeSeries HourlyFailedJobs();

 private:
  std::vector<JobSummary> JobPage(std::optional<std::string> queue, std::string_view state, const char* order_field, bool descending,
                                  int32_t from, int32_t count);
  int64_t                 CountJobs(std::optional<std::string> queue, std::string_view state);

  TimeSeries DailySeries(std::string_view outcome, int days);
  TimeSeries HourlySeries(std::string_view outcome, int hours);

  connection::StorageConnection& connection_;
};

} // namespace jobstore::monitoring
