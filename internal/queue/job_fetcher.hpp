#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/jobs/job_manager.hpp"
#include "internal/queue/fetched_job.hpp"
#include "internal/util/cancellation.hpp"

namespace jobstore::queue {

struct FetcherOptions {
  int32_t page_size = 100;
};

/*
  JobFetcher

  One pass over the queues in preference order. For each queue the oldest
  enqueued jobs (by createdAt) are tried in order; a job is claimed with a
  conditional replace on its etag, so among racing fetchers exactly one
  wins and the others move on to the next candidate.

  Returns nullptr when nothing is claimable; polling and backoff are left
  to the caller. The token is checked around every store call; a job
  claimed just before cancellation is handed back through its handle's
  auto-requeue.
*/
class JobFetcher {
 public:
  JobFetcher(jobs::JobManager& jobs, FetcherOptions options = {});

  std::unique_ptr<FetchedJob> FetchNext(const std::vector<std::string>& queues, const util::CancellationToken& cancellation);

 private:
  std::unique_ptr<FetchedJob> TryQueue(const std::string& queue, const util::CancellationToken& cancellation);

  jobs::JobManager& jobs_;
  FetcherOptions    options_;
};

} // namespace jobstore::queue
