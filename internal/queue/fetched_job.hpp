#pragma once

#include <string>

#include "internal/jobs/job_manager.hpp"

namespace jobstore::queue {

/*
  FetchedJob

  Handle for a claimed job. Exactly one outcome is applied:

    Acknowledge()  job stays processing, owned by the caller
    Requeue()      job goes back to enqueued
    destructor     requeues when neither was called

  Both calls are idempotent and the first one wins. The destructor never
  throws; a failed auto-requeue is logged and the job stays processing
  until the stale job reaper picks it up.
*/
class FetchedJob {
 public:
  FetchedJob(jobs::JobManager& jobs, jobs::JobRecord record);
  ~FetchedJob();

  FetchedJob(const FetchedJob&)            = delete;
  FetchedJob& operator=(const FetchedJob&) = delete;

  const std::string& JobId() const {
    return record_.body.job_id();
  }

  const std::string& Queue() const {
    return record_.body.queue_name();
  }

  // Snapshot taken at claim time.
  const jobs::JobRecord& Record() const {
    return record_;
  }

  void Acknowledge();
  void Requeue();

  bool IsResolved() const {
    return acknowledged_ || requeued_;
  }

 private:
  jobs::JobManager& jobs_;
  jobs::JobRecord   record_;
  bool              acknowledged_ = false;
  bool              requeued_     = false;
};

} // namespace jobstore::queue
