#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/batch/write_batch.hpp"
#include "internal/config/storage_options.hpp"
#include "internal/db/api/document_store.hpp"
#include "internal/jobs/job_manager.hpp"
#include "internal/lock/distributed_lock.hpp"
#include "internal/queue/job_fetcher.hpp"
#include "internal/util/cancellation.hpp"
#include "internal/util/time.hpp"

namespace jobstore::connection {

struct ServerContext {
  int32_t                  worker_count = 0;
  std::vector<std::string> queues;
};

/*
  StorageConnection

  Everything a job-processing framework calls into: job creation and
  fetching, job data and parameters, write batches, distributed locks,
  server registration and the set / list / hash / counter readers.

  Lists are read in insertion order (ascending index); range reads take
  inclusive positions in that order. Missing keys read as empty.
*/
class StorageConnection {
 public:
  StorageConnection(std::shared_ptr<db::DocumentStore> store, config::StorageOptions options, std::string server_id = {},
                    util::ClockFn clock = util::Now);

  // ---- jobs ----
  std::string CreateExpiredJob(const jobs::Invocation& invocation, const std::string& queue, const std::map<std::string, std::string>& parameters,
                               std::chrono::milliseconds expire_in, std::optional<util::TimePoint> created_at = std::nullopt);

  std::unique_ptr<queue::FetchedJob> FetchNextJob(const std::vector<std::string>& queues, const util::CancellationToken& cancellation);

  std::optional<jobs::JobData>   GetJobData(const std::string& job_id);
  std::optional<jobs::StateData> GetStateData(const std::string& job_id);

  std::optional<std::string> GetJobParameter(const std::string& job_id, const std::string& name);
  void                       SetJobParameter(const std::string& job_id, const std::string& name, const std::string& value);

  std::unique_ptr<batch::WriteBatch> CreateWriteBatch();

  // Throws util::LockUnavailable. A non-positive timeout uses timeouts.lock_timeout.
  std::unique_ptr<lock::DistributedLock> AcquireDistributedLock(const std::string& resource, std::chrono::milliseconds timeout);

  // ---- servers ----
  void AnnounceServer(const std::string& server_id, const ServerContext& context);

  // Throws util::NotFound when the server document is gone.
  void        Heartbeat(const std::string& server_id);
  void        RemoveServer(const std::string& server_id);
  std::size_t RemoveTimedOutServers(std::chrono::milliseconds timeout);

  // ---- sets (ordered by score) ----
  std::vector<std::string>                 GetAllItemsFromSet(const std::string& key);
  std::optional<std::string>               GetFirstByLowestScoreFromSet(const std::string& key, double from_score, double to_score);
  std::vector<std::string>                 GetRangeFromSet(const std::string& key, int32_t start, int32_t end);
  int64_t                                  GetSetCount(const std::string& key);
  std::optional<std::chrono::milliseconds> GetSetTtl(const std::string& key);

  // ---- lists ----
  std::vector<std::string>                 GetAllItemsFromList(const std::string& key);
  std::vector<std::string>                 GetRangeFromList(const std::string& key, int32_t start, int32_t end);
  int64_t                                  GetListCount(const std::string& key);
  std::optional<std::chrono::milliseconds> GetListTtl(const std::string& key);

  // ---- hashes ----
  std::map<std::string, std::string>       GetAllEntriesFromHash(const std::string& key);
  std::optional<std::string>               GetValueFromHash(const std::string& key, const std::string& field);
  int64_t                                  GetHashCount(const std::string& key);
  std::optional<std::chrono::milliseconds> GetHashTtl(const std::string& key);
  void                                     SetRangeInHash(const std::string& key, const std::vector<std::pair<std::string, std::string>>& entries);

  // ---- counters ----
  int64_t GetCounter(const std::string& key);

  jobs::JobManager& Jobs() {
    return jobs_;
  }

  lock::LockProvider& Locks() {
    return locks_;
  }

  db::DocumentStore& Store() {
    return *store_;
  }

  const db::CollectionResolver& Resolver() const {
    return resolver_;
  }

  const config::StorageOptions& Options() const {
    return options_;
  }

 private:
  std::vector<db::Document> PartitionItems(db::DocumentKind kind, const std::string& key, db::DocumentQuery query);
  std::vector<db::Document> PartitionRange(db::DocumentKind kind, const std::string& key, const std::string& order_field, int32_t start, int32_t end);
  int64_t                   PartitionCount(db::DocumentKind kind, const std::string& key);
  std::optional<std::chrono::milliseconds> PartitionTtl(db::DocumentKind kind, const std::string& key);

  std::shared_ptr<db::DocumentStore> store_;
  config::StorageOptions             options_;
  db::CollectionResolver             resolver_;
  util::ClockFn                      clock_;

  jobs::JobManager   jobs_;
  lock::LockProvider locks_;
  queue::JobFetcher  fetcher_;
};

} // namespace jobstore::connection
