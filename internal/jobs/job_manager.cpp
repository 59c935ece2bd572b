#include "job_manager.hpp"

#include "internal/db/codec/document_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace jobstore::jobs {

namespace v1 = jobstore::documents::v1;

namespace {

constexpr const char* kDefaultQueue = "default";

std::string JobDocumentId(const std::string& job_id) {
  return "job:" + job_id;
}

double Millis(util::TimePoint tp) {
  return static_cast<double>(util::ToUnixMillis(tp));
}

} // namespace

JobManager::JobManager(std::shared_ptr<db::DocumentStore> store, db::CollectionResolver resolver, JobManagerOptions options, util::ClockFn clock)
    : store_(std::move(store)), resolver_(std::move(resolver)), options_(options), clock_(std::move(clock)) {
  if (!store_) {
    throw std::invalid_argument("job manager requires a document store");
  }
  if (!clock_) {
    clock_ = util::Now;
  }
}

std::string JobManager::CreateExpiredJob(const Invocation& invocation, const std::string& queue, const std::map<std::string, std::string>& parameters,
                                         std::chrono::milliseconds expire_in, std::optional<util::TimePoint> created_at) {
  ValidateInvocation(invocation);

  const auto now        = clock_();
  const auto queue_name = queue.empty() ? std::string(kDefaultQueue) : queue;
  const auto job_id     = util::ToCompactString(util::GenerateUUID());
  const auto location   = resolver_.Resolve(db::DocumentKind::Job, queue_name);

  v1::JobBody body;
  body.set_job_id(job_id);
  body.set_queue_name(queue_name);
  body.set_state(std::string(states::kCreated));
  *body.mutable_invocation_data() = ToProto(invocation);
  for (const auto& [name, value] : parameters) {
    (*body.mutable_parameters())[name] = value;
  }
  body.set_created_at(Millis(created_at.value_or(now)));
  body.set_updated_at(Millis(now));

  db::Document doc;
  doc.id            = JobDocumentId(job_id);
  doc.partition_key = location.partition_key;
  doc.document_type = std::string(db::DocumentTypeName(db::DocumentKind::Job));
  doc.expire_at_ms  = util::ToUnixMillis(now) + expire_in.count();
  db::codec::Pack(body, &doc);

  util::ThrowIfDbError(store_->Create(location.collection, doc), "create job " + job_id);
  WriteIndex(job_id, queue_name, doc.expire_at_ms);

  observability::Metrics::Instance().RecordJobTransition(states::kCreated);
  JOBSTORE_LOG_INFO("job created", {observability::StringField("job_id", job_id), observability::StringField("queue", queue_name),
                                    observability::StringField("invocation", Signature(invocation))});
  return job_id;
}

JobRecord JobManager::Decode(db::Document doc, std::string collection) const {
  JobRecord record;
  record.collection = std::move(collection);
  record.body       = db::codec::Unpack<v1::JobBody>(doc);
  record.document   = std::move(doc);
  return record;
}

std::optional<JobRecord> JobManager::LoadViaIndex(const std::string& job_id) {
  const auto index_location = resolver_.Resolve(db::DocumentKind::JobIndex);
  auto       index          = store_->Get(index_location.collection, job_id, index_location.partition_key);
  if (!index) {
    return std::nullopt;
  }

  const auto entry      = db::codec::Unpack<v1::JobIndexBody>(*index);
  const auto collection = resolver_.CollectionFor(db::DocumentKind::Job);
  auto       doc        = store_->Get(collection, JobDocumentId(job_id), entry.partition_key());
  if (!doc) {
    return std::nullopt;
  }
  return Decode(std::move(*doc), collection);
}

std::optional<JobRecord> JobManager::LoadViaQuery(const std::string& job_id) {
  const auto collection = resolver_.CollectionFor(db::DocumentKind::Job);

  db::DocumentQuery query;
  query.OfType(std::string(db::DocumentTypeName(db::DocumentKind::Job))).Where("jobId", job_id).Limit(1);

  db::QueryOptions options;
  options.page_size = 1;

  auto page = store_->Query(collection, query, options);
  if (page.documents.empty()) {
    return std::nullopt;
  }
  return Decode(std::move(page.documents.front()), collection);
}

std::optional<JobRecord> JobManager::Load(const std::string& job_id, const std::string& queue_hint) {
  if (job_id.empty()) {
    return std::nullopt;
  }
  if (!queue_hint.empty()) {
    const auto collection = resolver_.CollectionFor(db::DocumentKind::Job);
    auto       doc = store_->Get(collection, JobDocumentId(job_id), db::CollectionResolver::PartitionKeyFor(db::DocumentKind::Job, queue_hint));
    if (doc) {
      return Decode(std::move(*doc), collection);
    }
  }
  if (auto record = LoadViaIndex(job_id)) {
    return record;
  }
  // index missing or stale (interrupted move, pre-index document)
  return LoadViaQuery(job_id);
}

void JobManager::WriteIndex(const std::string& job_id, const std::string& queue, std::optional<int64_t> expire_at_ms) {
  const auto location = resolver_.Resolve(db::DocumentKind::JobIndex);

  v1::JobIndexBody body;
  body.set_job_id(job_id);
  body.set_partition_key(db::CollectionResolver::PartitionKeyFor(db::DocumentKind::Job, queue));
  body.set_queue_name(queue);

  db::Document doc;
  doc.id            = job_id;
  doc.partition_key = location.partition_key;
  doc.document_type = std::string(db::DocumentTypeName(db::DocumentKind::JobIndex));
  doc.expire_at_ms  = expire_at_ms;
  db::codec::Pack(body, &doc);

  util::ThrowIfDbError(store_->Upsert(location.collection, doc), "index job " + job_id);
}

db::Result JobManager::Save(JobRecord& record, const std::string& if_match) {
  db::codec::Pack(record.body, &record.document);
  return store_->Replace(record.collection, record.document, if_match);
}

db::Result JobManager::Move(JobRecord& record, const MoveOrigin& origin) {
  const auto& job_id = record.body.job_id();

  db::codec::Pack(record.body, &record.document);
  auto created = store_->Create(record.collection, record.document);
  if (created.code == db::ErrorCode::AlreadyExists) {
    // leftover copy from an interrupted move
    created = store_->Upsert(record.collection, record.document);
  }
  util::ThrowIfDbError(created, "move job " + job_id);

  // the index follows the new copy before the old one goes away
  WriteIndex(job_id, record.body.queue_name(), record.document.expire_at_ms);

  auto removed = store_->Delete(record.collection, record.document.id, origin.partition, origin.etag);
  if (removed.code == db::ErrorCode::Conflict) {
    // the old copy changed after it was read; drop the new one and retry from scratch
    util::ThrowIfDbError(store_->Delete(record.collection, record.document.id, record.document.partition_key), "undo move of job " + job_id);
    WriteIndex(job_id, origin.queue, origin.expire_at_ms);
    return removed;
  }
  util::ThrowIfDbError(removed, "remove old copy of job " + job_id);
  return db::Result::Ok();
}

bool JobManager::Transition(const std::string& job_id, const Mutator& mutate, const std::string& queue_hint) {
  for (uint32_t attempt = 0;; ++attempt) {
    auto record = Load(job_id, queue_hint);
    if (!record) {
      return false;
    }

    const MoveOrigin  origin{record->document.partition_key, record->document.etag, record->body.queue_name(), record->document.expire_at_ms};
    const std::string old_state  = record->body.state();
    const auto        old_expire = record->document.expire_at_ms;

    if (!mutate(*record)) {
      return true;
    }
    record->body.set_updated_at(Millis(clock_()));

    const auto partition = db::CollectionResolver::PartitionKeyFor(db::DocumentKind::Job, record->body.queue_name());

    db::Result result;
    if (partition != origin.partition) {
      record->document.partition_key = partition;
      result                         = Move(*record, origin);
    } else {
      result = Save(*record, origin.etag);
      if (result && record->document.expire_at_ms != old_expire) {
        WriteIndex(job_id, record->body.queue_name(), record->document.expire_at_ms);
      }
    }

    if (result) {
      if (record->body.state() != old_state) {
        observability::Metrics::Instance().RecordJobTransition(record->body.state());
      }
      return true;
    }

    // Conflict: someone else wrote first. NotFound: deleted or moved in between.
    if (result.code != db::ErrorCode::Conflict && result.code != db::ErrorCode::NotFound) {
      util::ThrowIfDbError(result, "update job " + job_id);
    }
    if (attempt >= options_.conflict_retry_limit) {
      throw util::ConcurrencyConflict("job " + job_id + " changed concurrently " + std::to_string(attempt + 1) + " times");
    }

    JOBSTORE_LOG_WARN("job write conflict, retrying",
                      {observability::StringField("job_id", job_id), observability::IntField("attempt", attempt + 1)});
  }
}

void JobManager::AppendHistory(v1::JobBody& body, const StateChange& state, util::TimePoint at) {
  auto* entry = body.add_state_history();
  entry->set_state(state.name);
  entry->set_reason(state.reason);
  entry->set_created_at(Millis(at));
  for (const auto& [key, value] : state.data) {
    (*entry->mutable_data())[key] = value;
  }
  body.set_state(state.name);
}

std::map<std::string, std::string> JobManager::EnqueuedStateData(const std::string& queue, util::TimePoint at) {
  return {{"Queue", queue}, {"EnqueuedAt", util::ToIso8601(at)}};
}

bool JobManager::SetState(const std::string& job_id, const StateChange& state) {
  return Transition(job_id, [&](JobRecord& record) {
    record.body.clear_state_data();
    for (const auto& [key, value] : state.data) {
      (*record.body.mutable_state_data())[key] = value;
    }
    AppendHistory(record.body, state, clock_());
    return true;
  });
}

bool JobManager::AddState(const std::string& job_id, const StateChange& state) {
  return Transition(job_id, [&](JobRecord& record) {
    AppendHistory(record.body, state, clock_());
    return true;
  });
}

bool JobManager::AddToQueue(const std::string& job_id, const std::string& queue) {
  if (queue.empty()) {
    throw std::invalid_argument("queue name must not be empty");
  }

  return Transition(job_id, [&](JobRecord& record) {
    const auto now  = clock_();
    const auto data = EnqueuedStateData(queue, now);

    record.body.set_queue_name(queue);
    record.body.clear_state_data();
    for (const auto& [key, value] : data) {
      (*record.body.mutable_state_data())[key] = value;
    }
    AppendHistory(record.body, StateChange{std::string(states::kEnqueued), "Enqueued", data}, now);
    return true;
  });
}

bool JobManager::Expire(const std::string& job_id, std::chrono::milliseconds expire_in) {
  return Transition(job_id, [&](JobRecord& record) {
    record.document.expire_at_ms = util::ToUnixMillis(clock_()) + expire_in.count();
    return true;
  });
}

bool JobManager::Persist(const std::string& job_id) {
  return Transition(job_id, [](JobRecord& record) {
    if (!record.document.expire_at_ms) {
      return false;
    }
    record.document.expire_at_ms.reset();
    return true;
  });
}

std::optional<JobData> JobManager::GetJobData(const std::string& job_id) {
  auto record = Load(job_id);
  if (!record) {
    return std::nullopt;
  }

  JobData data;
  data.invocation = FromProto(record->body.invocation_data());
  data.state      = record->body.state();
  data.queue      = record->body.queue_name();
  data.created_at = util::FromUnixMillis(static_cast<int64_t>(record->body.created_at()));
  return data;
}

std::optional<StateData> JobManager::GetStateData(const std::string& job_id) {
  auto record = Load(job_id);
  if (!record || record->body.state().empty()) {
    return std::nullopt;
  }

  StateData data;
  data.name = record->body.state();
  if (record->body.state_history_size() > 0) {
    data.reason = record->body.state_history(record->body.state_history_size() - 1).reason();
  }
  data.data.insert(record->body.state_data().begin(), record->body.state_data().end());
  return data;
}

std::optional<std::string> JobManager::GetParameter(const std::string& job_id, const std::string& name) {
  auto record = Load(job_id);
  if (!record) {
    return std::nullopt;
  }

  const auto& parameters = record->body.parameters();
  auto        it         = parameters.find(name);
  if (it == parameters.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool JobManager::SetParameter(const std::string& job_id, const std::string& name, const std::string& value) {
  if (name.empty()) {
    throw std::invalid_argument("parameter name must not be empty");
  }
  return Transition(job_id, [&](JobRecord& record) {
    (*record.body.mutable_parameters())[name] = value;
    return true;
  });
}

} // namespace jobstore::jobs
