#include "stale_job_reaper.hpp"

#include <string>
#include <vector>

#include "internal/db/api/cursor.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace jobstore::jobs {

StaleJobReaper::StaleJobReaper(JobManager& jobs, lock::LockProvider& locks, std::chrono::milliseconds lock_timeout)
    : jobs_(jobs), locks_(locks), lock_timeout_(lock_timeout) {
}

std::size_t StaleJobReaper::RequeueStaleJobs(std::chrono::milliseconds older_than) {
  std::unique_ptr<lock::DistributedLock> guard;
  try {
    guard = locks_.Acquire(kLockResource, lock_timeout_);
  } catch (const util::LockUnavailable&) {
    JOBSTORE_LOG_INFO("stale job pass skipped, another server holds the lock");
    return 0;
  }

  const double cutoff_ms  = static_cast<double>(util::ToUnixMillis(jobs_.Now() - older_than));
  const auto   collection = jobs_.Resolver().CollectionFor(db::DocumentKind::Job);

  db::DocumentQuery query;
  query.OfType(std::string(db::DocumentTypeName(db::DocumentKind::Job)))
      .Where("state", std::string(states::kProcessing))
      .Where("updatedAt", db::CompareOp::Lt, cutoff_ms)
      .OrderedBy("updatedAt");

  // collect ids first; requeueing changes the result set under the cursor
  std::vector<std::string> candidates;
  db::DocumentCursor       cursor(jobs_.Store(), collection, std::move(query), db::QueryOptions{});
  while (auto doc = cursor.Next()) {
    candidates.push_back(jobs_.Decode(std::move(*doc), collection).body.job_id());
  }

  std::size_t requeued = 0;
  for (const auto& job_id : candidates) {
    bool changed = false;
    jobs_.Transition(job_id, [&](JobRecord& record) {
      changed = false;
      if (record.body.state() != states::kProcessing || record.body.updated_at() >= cutoff_ms) {
        return false;
      }
      const auto now  = jobs_.Now();
      const auto data = JobManager::EnqueuedStateData(record.body.queue_name(), now);

      record.body.clear_state_data();
      for (const auto& [key, value] : data) {
        (*record.body.mutable_state_data())[key] = value;
      }
      JobManager::AppendHistory(record.body, {std::string(states::kEnqueued), "Requeued stale job", data}, now);
      changed = true;
      return true;
    });

    if (changed) {
      ++requeued;
      JOBSTORE_LOG_WARN("requeued stale job", {observability::StringField("job_id", job_id)});
    }
  }

  if (requeued > 0) {
    JOBSTORE_LOG_INFO("stale job pass finished", {observability::IntField("requeued", static_cast<int64_t>(requeued))});
  }
  return requeued;
}

} // namespace jobstore::jobs
