#include "job_fetcher.hpp"

#include <stdexcept>

#include "internal/db/api/cursor.hpp"
#include "internal/jobs/job_state.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace jobstore::queue {

JobFetcher::JobFetcher(jobs::JobManager& jobs, FetcherOptions options) : jobs_(jobs), options_(options) {
  if (options_.page_size <= 0) {
    throw std::invalid_argument("fetcher page size must be positive");
  }
}

std::unique_ptr<FetchedJob> JobFetcher::FetchNext(const std::vector<std::string>& queues, const util::CancellationToken& cancellation) {
  if (queues.empty()) {
    throw std::invalid_argument("at least one queue is required");
  }

  observability::SpanScope span("jobstore.queue.fetch_next");
  for (const auto& queue : queues) {
    if (queue.empty()) {
      throw std::invalid_argument("queue name must not be empty");
    }
    if (auto fetched = TryQueue(queue, cancellation)) {
      span.SetAttribute("job_id", fetched->JobId());
      return fetched;
    }
  }
  return nullptr;
}

std::unique_ptr<FetchedJob> JobFetcher::TryQueue(const std::string& queue, const util::CancellationToken& cancellation) {
  const auto location = jobs_.Resolver().Resolve(db::DocumentKind::Job, queue);

  db::DocumentQuery query;
  query.OfType(std::string(db::DocumentTypeName(db::DocumentKind::Job)))
      .Where("queueName", queue)
      .Where("state", std::string(jobs::states::kEnqueued))
      .OrderedBy("createdAt");

  db::QueryOptions options;
  options.partition_key = location.partition_key;
  options.page_size     = options_.page_size;

  cancellation.ThrowIfCancelled("fetch from queue " + queue);
  db::DocumentCursor cursor(jobs_.Store(), location.collection, std::move(query), std::move(options));

  while (auto doc = cursor.Next()) {
    cancellation.ThrowIfCancelled("fetch from queue " + queue);

    auto       record = jobs_.Decode(std::move(*doc), location.collection);
    const auto etag   = record.document.etag;
    const auto now    = jobs_.Now();

    jobs::JobManager::AppendHistory(record.body, {std::string(jobs::states::kProcessing), "Fetched", {}}, now);
    record.body.set_updated_at(static_cast<double>(util::ToUnixMillis(now)));

    auto result = jobs_.Save(record, etag);
    if (result.code == db::ErrorCode::Conflict || result.code == db::ErrorCode::NotFound) {
      // another fetcher won this one
      continue;
    }
    util::ThrowIfDbError(result, "claim job " + record.body.job_id());

    observability::Metrics::Instance().RecordJobTransition(jobs::states::kProcessing);
    auto fetched = std::make_unique<FetchedJob>(jobs_, std::move(record));

    // discarding the result after a cancel hands the job back via auto-requeue
    cancellation.ThrowIfCancelled("fetch from queue " + queue);

    JOBSTORE_LOG_INFO("job fetched", {observability::StringField("job_id", fetched->JobId()), observability::StringField("queue", queue)});
    return fetched;
  }
  return nullptr;
}

} // namespace jobstore::queue
