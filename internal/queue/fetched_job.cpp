#include "fetched_job.hpp"

#include "internal/jobs/job_state.hpp"
#include "internal/observability/logging.hpp"

namespace jobstore::queue {

FetchedJob::FetchedJob(jobs::JobManager& jobs, jobs::JobRecord record) : jobs_(jobs), record_(std::move(record)) {
}

FetchedJob::~FetchedJob() {
  if (IsResolved()) {
    return;
  }

  try {
    Requeue();
  } catch (const std::exception& e) {
    JOBSTORE_LOG_ERROR("auto-requeue of fetched job failed",
                       {observability::StringField("job_id", JobId()), observability::StringField("error", e.what())});
  }
}

void FetchedJob::Acknowledge() {
  if (IsResolved()) {
    return;
  }
  acknowledged_ = true;

  // the claim already left the job processing; only a job that was put back
  // in between needs claiming again
  jobs_.Transition(JobId(), [this](jobs::JobRecord& record) {
    if (record.body.state() != jobs::states::kEnqueued) {
      return false;
    }
    jobs::JobManager::AppendHistory(record.body, {std::string(jobs::states::kProcessing), "Acknowledged", {}}, jobs_.Now());
    return true;
  }, Queue());
}

void FetchedJob::Requeue() {
  if (IsResolved()) {
    return;
  }
  requeued_ = true;

  const bool found = jobs_.Transition(JobId(), [this](jobs::JobRecord& record) {
    const auto now  = jobs_.Now();
    const auto data = jobs::JobManager::EnqueuedStateData(record.body.queue_name(), now);

    record.body.clear_state_data();
    for (const auto& [key, value] : data) {
      (*record.body.mutable_state_data())[key] = value;
    }
    jobs::JobManager::AppendHistory(record.body, {std::string(jobs::states::kEnqueued), "Requeued", data}, now);
    return true;
  }, Queue());

  if (!found) {
    JOBSTORE_LOG_WARN("requeue skipped, job no longer exists", {observability::StringField("job_id", JobId())});
    return;
  }
  JOBSTORE_LOG_INFO("job requeued", {observability::StringField("job_id", JobId()), observability::StringField("queue", Queue())});
}

} // namespace jobstore::queue
