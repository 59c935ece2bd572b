#pragma once

#include <chrono>
#include <cstddef>

#include "internal/jobs/job_manager.hpp"
#include "internal/lock/distributed_lock.hpp"

namespace jobstore::jobs {

/*
  Requeues jobs left in processing by workers that died without running
  their fetched-job handle's cleanup.

  Runs under the cluster lock "jobstore:stale-job-reaper"; when another
  server holds it the pass is skipped. A job counts as stale when its
  updatedAt is older than the cutoff, so the timeout must exceed the
  longest legitimate job run.
*/
class StaleJobReaper {
 public:
  static constexpr const char* kLockResource = "jobstore:stale-job-reaper";

  StaleJobReaper(JobManager& jobs, lock::LockProvider& locks, std::chrono::milliseconds lock_timeout);

  // Number of jobs requeued.
  std::size_t RequeueStaleJobs(std::chrono::milliseconds older_than);

 private:
  JobManager&               jobs_;
  lock::LockProvider&       locks_;
  std::chrono::milliseconds lock_timeout_;
};

} // namespace jobstore::jobs
