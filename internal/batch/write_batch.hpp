#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/api/document_store.hpp"
#include "internal/db/collection_resolver.hpp"
#include "internal/jobs/job_manager.hpp"
#include "internal/util/time.hpp"

namespace jobstore::batch {

/*
  WriteBatch

  An ordered batch of independent writes. Calls only record the write;
  Commit() runs them one after another in registration order. The first
  failure stops the batch and propagates; writes that already ran stay
  applied. There is no rollback and no isolation.

  Counters are updated with an etag compare-and-swap loop, so concurrent
  batches incrementing the same key converge. List indices come from the
  per-key sequence counter "list-seq:{key}".
*/
class WriteBatch {
 public:
  WriteBatch(std::shared_ptr<db::DocumentStore> store, db::CollectionResolver resolver, jobs::JobManager& jobs, util::ClockFn clock = util::Now);
  ~WriteBatch();

  WriteBatch(const WriteBatch&)            = delete;
  WriteBatch& operator=(const WriteBatch&) = delete;

  // jobs
  void SetJobState(const std::string& job_id, jobs::StateChange state);
  void AddJobState(const std::string& job_id, jobs::StateChange state);
  void AddToQueue(const std::string& queue, const std::string& job_id);
  void ExpireJob(const std::string& job_id, std::chrono::milliseconds expire_in);
  void PersistJob(const std::string& job_id);

  // counters
  void IncrementCounter(const std::string& key, std::optional<std::chrono::milliseconds> expire_in = std::nullopt);
  void DecrementCounter(const std::string& key, std::optional<std::chrono::milliseconds> expire_in = std::nullopt);

  // sets; score defaults to the current unix time in seconds
  void AddToSet(const std::string& key, const std::string& value, std::optional<double> score = std::nullopt);
  void RemoveFromSet(const std::string& key, const std::string& value);
  void ExpireSet(const std::string& key, std::chrono::milliseconds expire_in);
  void PersistSet(const std::string& key);

  // lists
  void InsertToList(const std::string& key, const std::string& value);
  void RemoveFromList(const std::string& key, const std::string& value);
  // Keeps the items at positions [keep_from, keep_to] in insertion order.
  void TrimList(const std::string& key, int32_t keep_from, int32_t keep_to);
  void ExpireList(const std::string& key, std::chrono::milliseconds expire_in);
  void PersistList(const std::string& key);

  // hashes
  void SetRangeInHash(const std::string& key, const std::vector<std::pair<std::string, std::string>>& entries);
  void RemoveHash(const std::string& key);
  void ExpireHash(const std::string& key, std::chrono::milliseconds expire_in);
  void PersistHash(const std::string& key);

  void Commit();

  std::size_t Size() const {
    return operations_.size();
  }

  // Shared with StorageConnection for direct, unbatched counter access.
  // Returns the new value; a missing counter is only created when create_missing.
  static int64_t AdjustCounter(db::DocumentStore& store, const db::CollectionResolver& resolver, const std::string& key, int64_t delta,
                               std::optional<std::chrono::milliseconds> expire_in, bool create_missing, util::TimePoint now);

 private:
  void Add(std::function<void()> operation);

  std::vector<db::Document> PartitionDocuments(db::DocumentKind kind, const std::string& key, db::DocumentQuery query);
  void                      SetPartitionExpiry(db::DocumentKind kind, const std::string& key, std::optional<int64_t> expire_at_ms);
  void                      RefreshQueue(const std::string& queue);

  std::shared_ptr<db::DocumentStore> store_;
  db::CollectionResolver             resolver_;
  jobs::JobManager&                  jobs_;
  util::ClockFn                      clock_;

  std::vector<std::function<void()>> operations_;
};

} // namespace jobstore::batch
