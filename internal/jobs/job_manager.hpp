#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/document_store.hpp"
#include "internal/db/collection_resolver.hpp"
#include "internal/jobs/invocation.hpp"
#include "internal/jobs/job_state.hpp"
#include "internal/util/time.hpp"
#include "jobstore/documents/v1/documents.pb.h"

namespace jobstore::jobs {

struct JobManagerOptions {
  // Re-read and reapply attempts after an etag conflict.
  uint32_t conflict_retry_limit = 5;
};

// A job document together with its decoded body.
struct JobRecord {
  std::string                        collection;
  db::Document                       document;
  jobstore::documents::v1::JobBody   body;
};

struct JobData {
  Invocation      invocation;
  std::string     state;
  std::string     queue;
  util::TimePoint created_at;
};

struct StateData {
  std::string                        name;
  std::string                        reason;
  std::map<std::string, std::string> data;
};

/*
  JobManager

  Owns job documents and their state machine:

    created -> enqueued -> processing -> succeeded | failed | scheduled -> deleted

  Every transition is load -> mutate -> conditional replace (etag). On a
  conflict the job is re-read and the mutation reapplied, at most
  conflict_retry_limit times. A job that vanished makes the transition a
  no-op returning false. Final states are not guarded.

  Lookup by id goes through the reverse index document written at creation
  and falls back to a cross-partition query on jobId.
*/
class JobManager {
 public:
  // Returns false to leave the job untouched.
  using Mutator = std::function<bool(JobRecord&)>;

  JobManager(std::shared_ptr<db::DocumentStore> store, db::CollectionResolver resolver, JobManagerOptions options = {},
             util::ClockFn clock = util::Now);

  std::string CreateExpiredJob(const Invocation& invocation, const std::string& queue, const std::map<std::string, std::string>& parameters,
                               std::chrono::milliseconds expire_in, std::optional<util::TimePoint> created_at = std::nullopt);

  // queue_hint, when set, reads that queue's copy first; a holder that knows
  // where it claimed the job never acts on a copy an interrupted move left.
  std::optional<JobRecord> Load(const std::string& job_id, const std::string& queue_hint = {});

  // Throws util::ConcurrencyConflict when retries run out.
  bool Transition(const std::string& job_id, const Mutator& mutate, const std::string& queue_hint = {});

  // Moves the job into the state and replaces its state data.
  bool SetState(const std::string& job_id, const StateChange& state);

  // Appends a history entry and moves the state name; state data is kept.
  bool AddState(const std::string& job_id, const StateChange& state);

  // Moves the job into the queue's partition and marks it enqueued.
  bool AddToQueue(const std::string& job_id, const std::string& queue);

  bool Expire(const std::string& job_id, std::chrono::milliseconds expire_in);
  bool Persist(const std::string& job_id);

  std::optional<JobData>   GetJobData(const std::string& job_id);
  std::optional<StateData> GetStateData(const std::string& job_id);

  // nullopt when the job or the parameter is missing
  std::optional<std::string> GetParameter(const std::string& job_id, const std::string& name);
  bool                       SetParameter(const std::string& job_id, const std::string& name, const std::string& value);

  // Single conditional write of an already loaded record; used by the fetch claim.
  db::Result Save(JobRecord& record, const std::string& if_match);

  // Helpers shared with the queue and batch layers.
  static void AppendHistory(jobstore::documents::v1::JobBody& body, const StateChange& state, util::TimePoint at);
  static std::map<std::string, std::string> EnqueuedStateData(const std::string& queue, util::TimePoint at);

  JobRecord Decode(db::Document doc, std::string collection) const;

  const db::CollectionResolver& Resolver() const {
    return resolver_;
  }

  db::DocumentStore& Store() {
    return *store_;
  }

  util::TimePoint Now() const {
    return clock_();
  }

 private:
  std::optional<JobRecord> LoadViaIndex(const std::string& job_id);
  std::optional<JobRecord> LoadViaQuery(const std::string& job_id);

  void WriteIndex(const std::string& job_id, const std::string& queue, std::optional<int64_t> expire_at_ms);

  // Where a job lived before a move.
  struct MoveOrigin {
    std::string            partition;
    std::string            etag;
    std::string            queue;
    std::optional<int64_t> expire_at_ms;
  };

  // Create in the new partition, repoint the index, delete the old copy.
  db::Result Move(JobRecord& record, const MoveOrigin& origin);

  std::shared_ptr<db::DocumentStore> store_;
  db::CollectionResolver             resolver_;
  JobManagerOptions                  options_;
  util::ClockFn                      clock_;
};

} // namespace jobstore::jobs
