#include "monitoring_api.hpp"

#include <algorithm>
#include <cstdio>
#include <stdexcept>

#include "internal/db/api/cursor.hpp"
#include "internal/db/codec/document_codec.hpp"
#include "internal/jobs/job_state.hpp"
#include "jobstore/documents/v1/documents.pb.h"

namespace jobstore::monitoring {

namespace v1 = jobstore::documents::v1;

namespace {

constexpr int kDailyBuckets  = 7;
constexpr int kHourlyBuckets = 24;

util::TimePoint FromMillis(double ms) {
  return util::FromUnixMillis(static_cast<int64_t>(ms));
}

std::map<std::string, std::string> ToMap(const google::protobuf::Map<std::string, std::string>& in) {
  return std::map<std::string, std::string>(in.begin(), in.end());
}

JobSummary Summarize(const v1::JobBody& body) {
  JobSummary summary;
  summary.job_id     = body.job_id();
  summary.queue      = body.queue_name();
  summary.state      = body.state();
  summary.invocation = jobs::FromProto(body.invocation_data());
  summary.state_data = ToMap(body.state_data());
  summary.created_at = FromMillis(body.created_at());
  summary.updated_at = FromMillis(body.updated_at());
  if (body.state_history_size() > 0) {
    summary.reason = body.state_history(body.state_history_size() - 1).reason();
  }
  return summary;
}

} // namespace

std::string OutcomeCounterKey(std::string_view outcome) {
  return "stats:" + std::string(outcome);
}

std::string DailyOutcomeCounterKey(std::string_view outcome, util::TimePoint at) {
  return OutcomeCounterKey(outcome) + ":" + util::ToDateKey(at);
}

std::string HourlyOutcomeCounterKey(std::string_view outcome, util::TimePoint at) {
  const auto hour = std::chrono::duration_cast<std::chrono::hours>(at - util::StartOfUtcDay(at)).count();
  char       buf[4];
  std::snprintf(buf, sizeof(buf), "%02d", static_cast<int>(hour));
  return DailyOutcomeCounterKey(outcome, at) + "-" + buf;
}

void AddOutcomeCounters(batch::WriteBatch& batch, std::string_view outcome, util::TimePoint at, std::chrono::milliseconds ttl) {
  batch.IncrementCounter(OutcomeCounterKey(outcome));
  batch.IncrementCounter(DailyOutcomeCounterKey(outcome, at), ttl);
  batch.IncrementCounter(HourlyOutcomeCounterKey(outcome, at), std::min<std::chrono::milliseconds>(ttl, std::chrono::hours(kHourlyBuckets)));
}

MonitoringApi::MonitoringApi(connection::StorageConnection& connection) : connection_(connection) {
}

Statistics MonitoringApi::GetStatistics() {
  Statistics stats;
  stats.enqueued   = CountJobs(std::nullopt, jobs::states::kEnqueued);
  stats.scheduled  = CountJobs(std::nullopt, jobs::states::kScheduled);
  stats.processing = CountJobs(std::nullopt, jobs::states::kProcessing);
  stats.succeeded  = CountJobs(std::nullopt, jobs::states::kSucceeded);
  stats.failed     = CountJobs(std::nullopt, jobs::states::kFailed);
  stats.deleted    = CountJobs(std::nullopt, jobs::states::kDeleted);

  const auto& resolver = connection_.Resolver();
  auto&       store    = connection_.Store();

  const auto servers = resolver.Resolve(db::DocumentKind::Server);
  stats.servers      = store.Count(servers.collection, db::DocumentQuery{}.OfType(std::string(db::DocumentTypeName(db::DocumentKind::Server))),
                                   servers.partition_key);

  const auto queues = resolver.Resolve(db::DocumentKind::Queue);
  stats.queues      = store.Count(queues.collection, db::DocumentQuery{}.OfType(std::string(db::DocumentTypeName(db::DocumentKind::Queue))),
                                  queues.partition_key);
  return stats;
}

std::vector<JobSummary> MonitoringApi::JobPage(std::optional<std::string> queue, std::string_view state, const char* order_field,
                                               bool descending, int32_t from, int32_t count) {
  if (from < 0 || count <= 0) {
    throw std::invalid_argument("job page needs from >= 0 and count > 0");
  }

  const auto& resolver = connection_.Resolver();

  db::DocumentQuery query;
  query.OfType(std::string(db::DocumentTypeName(db::DocumentKind::Job))).Where("state", std::string(state)).OrderedBy(order_field, descending);

  db::QueryOptions options;
  options.continuation = db::EncodeContinuation(from);
  options.page_size    = count;
  if (queue) {
    query.Where("queueName", *queue);
    options.partition_key = db::CollectionResolver::PartitionKeyFor(db::DocumentKind::Job, *queue);
  }

  auto page = connection_.Store().Query(resolver.CollectionFor(db::DocumentKind::Job), query, options);

  std::vector<JobSummary> jobs;
  jobs.reserve(page.documents.size());
  for (const auto& doc : page.documents) {
    jobs.push_back(Summarize(db::codec::Unpack<v1::JobBody>(doc)));
  }
  return jobs;
}

int64_t MonitoringApi::CountJobs(std::optional<std::string> queue, std::string_view state) {
  db::DocumentQuery query;
  query.OfType(std::string(db::DocumentTypeName(db::DocumentKind::Job))).Where("state", std::string(state));

  std::optional<std::string> partition_key;
  if (queue) {
    query.Where("queueName", *queue);
    partition_key = db::CollectionResolver::PartitionKeyFor(db::DocumentKind::Job, *queue);
  }
  return connection_.Store().Count(connection_.Resolver().CollectionFor(db::DocumentKind::Job), query, partition_key);
}

std::vector<JobSummary> MonitoringApi::EnqueuedJobs(const std::string& queue, int32_t from, int32_t count) {
  return JobPage(queue, jobs::states::kEnqueued, "createdAt", false, from, count);
}

std::vector<JobSummary> MonitoringApi::FetchedJobs(const std::string& queue, int32_t from, int32_t count) {
  return JobPage(queue, jobs::states::kProcessing, "updatedAt", false, from, count);
}

std::vector<JobSummary> MonitoringApi::ProcessingJobs(int32_t from, int32_t count) {
  return JobPage(std::nullopt, jobs::states::kProcessing, "updatedAt", false, from, count);
}

std::vector<JobSummary> MonitoringApi::ScheduledJobs(int32_t from, int32_t count) {
  return JobPage(std::nullopt, jobs::states::kScheduled, "createdAt", false, from, count);
}

std::vector<JobSummary> MonitoringApi::SucceededJobs(int32_t from, int32_t count) {
  return JobPage(std::nullopt, jobs::states::kSucceeded, "updatedAt", true, from, count);
}

std::vector<JobSummary> MonitoringApi::FailedJobs(int32_t from, int32_t count) {
  return JobPage(std::nullopt, jobs::states::kFailed, "updatedAt", true, from, count);
}

std::vector<JobSummary> MonitoringApi::DeletedJobs(int32_t from, int32_t count) {
  return JobPage(std::nullopt, jobs::states::kDeleted, "updatedAt", true, from, count);
}

std::vector<ServerInfo> MonitoringApi::Servers() {
  const auto location = connection_.Resolver().Resolve(db::DocumentKind::Server);

  db::DocumentQuery query;
  query.OfType(std::string(db::DocumentTypeName(db::DocumentKind::Server))).OrderedBy("startedAt");

  db::QueryOptions options;
  options.partition_key = location.partition_key;
  options.page_size     = connection_.Options().query_page_size;

  std::vector<ServerInfo> servers;
  db::DocumentCursor      cursor(connection_.Store(), location.collection, std::move(query), std::move(options));
  while (auto doc = cursor.Next()) {
    const auto body = db::codec::Unpack<v1::ServerBody>(*doc);

    ServerInfo info;
    info.server_id      = body.server_id();
    info.name           = body.data().name();
    info.worker_count   = body.data().worker_count();
    info.started_at     = FromMillis(body.started_at());
    info.last_heartbeat = FromMillis(body.last_heartbeat());
    info.queues.assign(body.data().queues().begin(), body.data().queues().end());
    servers.push_back(std::move(info));
  }
  return servers;
}

std::vector<QueueInfo> MonitoringApi::Queues() {
  const auto location = connection_.Resolver().Resolve(db::DocumentKind::Queue);

  db::DocumentQuery query;
  query.OfType(std::string(db::DocumentTypeName(db::DocumentKind::Queue))).OrderedBy("queueName");

  db::QueryOptions options;
  options.partition_key = location.partition_key;
  options.page_size     = connection_.Options().query_page_size;

  std::vector<QueueInfo> queues;
  db::DocumentCursor     cursor(connection_.Store(), location.collection, std::move(query), std::move(options));
  while (auto doc = cursor.Next()) {
    QueueInfo info;
    info.name       = db::codec::Unpack<v1::QueueBody>(*doc).queue_name();
    info.length     = EnqueuedCount(info.name);
    info.fetched    = FetchedCount(info.name);
    info.first_jobs = EnqueuedJobs(info.name, 0, static_cast<int32_t>(kQueuePreviewSize));
    queues.push_back(std::move(info));
  }
  return queues;
}

std::optional<JobDetails> MonitoringApi::GetJobDetails(const std::string& job_id) {
  auto record = connection_.Jobs().Load(job_id);
  if (!record) {
    return std::nullopt;
  }

  const auto& body = record->body;

  JobDetails details;
  details.job_id     = body.job_id();
  details.queue      = body.queue_name();
  details.created_at = FromMillis(body.created_at());
  details.invocation = jobs::FromProto(body.invocation_data());
  details.parameters = ToMap(body.parameters());
  if (record->document.expire_at_ms) {
    details.expire_at = util::FromUnixMillis(*record->document.expire_at_ms);
  }

  for (auto it = body.state_history().rbegin(); it != body.state_history().rend(); ++it) {
    details.history.push_back(HistoryEntry{it->state(), it->reason(), FromMillis(it->created_at()), ToMap(it->data())});
  }
  return details;
}

int64_t MonitoringApi::EnqueuedCount(const std::string& queue) {
  return CountJobs(queue, jobs::states::kEnqueued);
}

int64_t MonitoringApi::FetchedCount(const std::string& queue) {
  return CountJobs(queue, jobs::states::kProcessing);
}

int64_t MonitoringApi::ScheduledCount() {
  return CountJobs(std::nullopt, jobs::states::kScheduled);
}

int64_t MonitoringApi::ProcessingCount() {
  return CountJobs(std::nullopt, jobs::states::kProcessing);
}

int64_t MonitoringApi::SucceededListCount() {
  return CountJobs(std::nullopt, jobs::states::kSucceeded);
}

int64_t MonitoringApi::FailedCount() {
  return CountJobs(std::nullopt, jobs::states::kFailed);
}

int64_t MonitoringApi::DeletedListCount() {
  return CountJobs(std::nullopt, jobs::states::kDeleted);
}

TimeSeries MonitoringApi::DailySeries(std::string_view outcome, int days) {
  TimeSeries series;
  const auto today = util::StartOfUtcDay(connection_.Jobs().Now());
  for (int i = 0; i < days; ++i) {
    const auto day = today - std::chrono::hours(24 * i);
    series[day]    = connection_.GetCounter(DailyOutcomeCounterKey(outcome, day));
  }
  return series;
}

TimeSeries MonitoringApi::HourlySeries(std::string_view outcome, int hours) {
  TimeSeries series;
  const auto current = util::StartOfUtcHour(connection_.Jobs().Now());
  for (int i = 0; i < hours; ++i) {
    const auto hour = current - std::chrono::hours(i);
    series[hour]    = connection_.GetCounter(HourlyOutcomeCounterKey(outcome, hour));
  }
  return series;
}

TimeSeries MonitoringApi::SucceededByDatesCount() {
  return DailySeries(jobs::states::kSucceeded, kDailyBuckets);
}

TimeSeries MonitoringApi::FailedByDatesCount() {
  return DailySeries(jobs::states::kFailed, kDailyBuckets);
}

TimeSeries MonitoringApi::HourlySucceededJobs() {
  return HourlySeries(jobs::states::kSucceeded, kHourlyBuckets);
}

TimeSeries MonitoringApi::HourlyFailedJobs() {
  return HourlySeries(jobs::states::kFailed, kHourlyBuckets);
}

} // namespace jobstore::monitoring
