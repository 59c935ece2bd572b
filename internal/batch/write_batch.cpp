#include "write_batch.hpp"

#include <stdexcept>

#include "internal/db/api/cursor.hpp"
#include "internal/db/codec/document_codec.hpp"
#include "internal/jobs/job_state.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "jobstore/documents/v1/documents.pb.h"

namespace jobstore::batch {

namespace v1 = jobstore::documents::v1;

namespace {

// CAS rounds per counter update; each lost round means another writer succeeded.
constexpr uint32_t kMaxCounterAttempts = 64;

void RequireKey(const std::string& key, const char* what) {
  if (key.empty()) {
    throw std::invalid_argument(std::string(what) + " must not be empty");
  }
}

double Millis(util::TimePoint tp) {
  return static_cast<double>(util::ToUnixMillis(tp));
}

std::string TypeName(db::DocumentKind kind) {
  return std::string(db::DocumentTypeName(kind));
}

} // namespace

WriteBatch::WriteBatch(std::shared_ptr<db::DocumentStore> store, db::CollectionResolver resolver, jobs::JobManager& jobs, util::ClockFn clock)
    : store_(std::move(store)), resolver_(std::move(resolver)), jobs_(jobs), clock_(std::move(clock)) {
  if (!store_) {
    throw std::invalid_argument("write batch requires a document store");
  }
  if (!clock_) {
    clock_ = util::Now;
  }
}

WriteBatch::~WriteBatch() {
  if (!operations_.empty()) {
    JOBSTORE_LOG_WARN("write batch discarded without commit", {observability::IntField("operations", static_cast<int64_t>(operations_.size()))});
  }
}

void WriteBatch::Add(std::function<void()> operation) {
  operations_.push_back(std::move(operation));
}

void WriteBatch::Commit() {
  auto operations = std::move(operations_);
  operations_.clear();

  for (std::size_t i = 0; i < operations.size(); ++i) {
    try {
      operations[i]();
    } catch (const std::exception& e) {
      JOBSTORE_LOG_ERROR("write batch stopped", {observability::IntField("applied", static_cast<int64_t>(i)),
                                                 observability::IntField("skipped", static_cast<int64_t>(operations.size() - i - 1)),
                                                 observability::StringField("error", e.what())});
      throw;
    }
  }
}

// ------------------------------------------------------------
// jobs
// ------------------------------------------------------------

void WriteBatch::SetJobState(const std::string& job_id, jobs::StateChange state) {
  RequireKey(job_id, "job id");
  RequireKey(state.name, "state name");
  Add([this, job_id, state = std::move(state)] { jobs_.SetState(job_id, state); });
}

void WriteBatch::AddJobState(const std::string& job_id, jobs::StateChange state) {
  RequireKey(job_id, "job id");
  RequireKey(state.name, "state name");
  Add([this, job_id, state = std::move(state)] { jobs_.AddState(job_id, state); });
}

void WriteBatch::AddToQueue(const std::string& queue, const std::string& job_id) {
  RequireKey(queue, "queue");
  RequireKey(job_id, "job id");
  Add([this, queue, job_id] {
    if (jobs_.AddToQueue(job_id, queue)) {
      RefreshQueue(queue);
    }
  });
}

void WriteBatch::ExpireJob(const std::string& job_id, std::chrono::milliseconds expire_in) {
  RequireKey(job_id, "job id");
  Add([this, job_id, expire_in] { jobs_.Expire(job_id, expire_in); });
}

void WriteBatch::PersistJob(const std::string& job_id) {
  RequireKey(job_id, "job id");
  Add([this, job_id] { jobs_.Persist(job_id); });
}

// Denormalized view; authoritative counts always come from the job documents.
void WriteBatch::RefreshQueue(const std::string& queue) {
  const auto job_collection = resolver_.CollectionFor(db::DocumentKind::Job);
  const auto job_partition  = db::CollectionResolver::PartitionKeyFor(db::DocumentKind::Job, queue);

  auto count_in_state = [&](std::string_view state) {
    db::DocumentQuery query;
    query.OfType(TypeName(db::DocumentKind::Job)).Where("queueName", queue).Where("state", std::string(state));
    return store_->Count(job_collection, query, job_partition);
  };

  v1::QueueBody body;
  body.set_queue_name(queue);
  body.set_length(static_cast<int32_t>(count_in_state(jobs::states::kEnqueued)));
  body.set_fetched(static_cast<int32_t>(count_in_state(jobs::states::kProcessing)));
  body.set_last_updated(Millis(clock_()));

  const auto   location = resolver_.Resolve(db::DocumentKind::Queue);
  db::Document doc;
  doc.id            = "queue:" + queue;
  doc.partition_key = location.partition_key;
  doc.document_type = TypeName(db::DocumentKind::Queue);
  db::codec::Pack(body, &doc);

  util::ThrowIfDbError(store_->Upsert(location.collection, doc), "refresh queue " + queue);
}

// ------------------------------------------------------------
// counters
// ------------------------------------------------------------

int64_t WriteBatch::AdjustCounter(db::DocumentStore& store, const db::CollectionResolver& resolver, const std::string& key, int64_t delta,
                                  std::optional<std::chrono::milliseconds> expire_in, bool create_missing, util::TimePoint now) {
  const auto location = resolver.Resolve(db::DocumentKind::Counter);
  const auto id       = "counter:" + key;

  std::optional<int64_t> expire_at_ms;
  if (expire_in) {
    expire_at_ms = util::ToUnixMillis(now) + expire_in->count();
  }

  for (uint32_t attempt = 0; attempt < kMaxCounterAttempts; ++attempt) {
    auto existing = store.Get(location.collection, id, location.partition_key);

    if (!existing) {
      if (!create_missing) {
        return 0;
      }

      v1::CounterBody body;
      body.set_key(key);
      body.set_value(delta);
      body.set_created_at(Millis(now));
      body.set_updated_at(Millis(now));

      db::Document doc;
      doc.id            = id;
      doc.partition_key = location.partition_key;
      doc.document_type = TypeName(db::DocumentKind::Counter);
      doc.expire_at_ms  = expire_at_ms;
      db::codec::Pack(body, &doc);

      auto result = store.Create(location.collection, doc);
      if (result) {
        return delta;
      }
      if (result.code == db::ErrorCode::AlreadyExists) {
        continue;
      }
      util::ThrowIfDbError(result, "create counter " + key);
    }

    auto body = db::codec::Unpack<v1::CounterBody>(*existing);
    body.set_value(body.value() + delta);
    body.set_updated_at(Millis(now));
    if (expire_at_ms) {
      existing->expire_at_ms = expire_at_ms;
    }

    const auto etag = existing->etag;
    db::codec::Pack(body, &*existing);

    auto result = store.Replace(location.collection, *existing, etag);
    if (result) {
      return body.value();
    }
    if (result.code == db::ErrorCode::Conflict || result.code == db::ErrorCode::NotFound) {
      continue;
    }
    util::ThrowIfDbError(result, "update counter " + key);
  }

  throw util::ConcurrencyConflict("counter " + key + " is too contended");
}

void WriteBatch::IncrementCounter(const std::string& key, std::optional<std::chrono::milliseconds> expire_in) {
  RequireKey(key, "counter key");
  Add([this, key, expire_in] { AdjustCounter(*store_, resolver_, key, 1, expire_in, true, clock_()); });
}

void WriteBatch::DecrementCounter(const std::string& key, std::optional<std::chrono::milliseconds> expire_in) {
  RequireKey(key, "counter key");
  // decrementing a counter that does not exist is a no-op
  Add([this, key, expire_in] { AdjustCounter(*store_, resolver_, key, -1, expire_in, false, clock_()); });
}

// ------------------------------------------------------------
// partitions of sets / lists / hashes
// ------------------------------------------------------------

std::vector<db::Document> WriteBatch::PartitionDocuments(db::DocumentKind kind, const std::string& key, db::DocumentQuery query) {
  const auto location = resolver_.Resolve(kind, key);

  db::QueryOptions options;
  options.partition_key = location.partition_key;

  query.OfType(TypeName(kind)).Where("key", key);
  return db::DocumentCursor(*store_, location.collection, std::move(query), std::move(options)).ToVector();
}

void WriteBatch::SetPartitionExpiry(db::DocumentKind kind, const std::string& key, std::optional<int64_t> expire_at_ms) {
  const auto collection = resolver_.CollectionFor(kind);
  for (auto& doc : PartitionDocuments(kind, key, {})) {
    const auto etag = doc.etag;
    doc.expire_at_ms = expire_at_ms;

    auto result = store_->Replace(collection, doc, etag);
    if (result.code == db::ErrorCode::NotFound) {
      continue;
    }
    util::ThrowIfDbError(result, "set expiry on " + doc.id);
  }
}

// ------------------------------------------------------------
// sets
// ------------------------------------------------------------

void WriteBatch::AddToSet(const std::string& key, const std::string& value, std::optional<double> score) {
  RequireKey(key, "set key");
  RequireKey(value, "set value");

  Add([this, key, value, score] {
    const auto now      = clock_();
    const auto location = resolver_.Resolve(db::DocumentKind::Set, key);

    v1::SetBody body;
    body.set_key(key);
    body.set_value(value);
    body.set_score(score.value_or(util::ToUnixSeconds(now)));
    body.set_created_at(Millis(now));

    db::Document doc;
    doc.id            = "set:" + key + ":" + value;
    doc.partition_key = location.partition_key;
    doc.document_type = TypeName(db::DocumentKind::Set);
    db::codec::Pack(body, &doc);

    util::ThrowIfDbError(store_->Upsert(location.collection, doc), "add to set " + key);
  });
}

void WriteBatch::RemoveFromSet(const std::string& key, const std::string& value) {
  RequireKey(key, "set key");
  if (value.empty()) {
    // cleanup paths pass empty values; nothing to remove
    return;
  }

  Add([this, key, value] {
    const auto location = resolver_.Resolve(db::DocumentKind::Set, key);
    util::ThrowIfDbError(store_->Delete(location.collection, "set:" + key + ":" + value, location.partition_key), "remove from set " + key);
  });
}

void WriteBatch::ExpireSet(const std::string& key, std::chrono::milliseconds expire_in) {
  RequireKey(key, "set key");
  Add([this, key, expire_in] { SetPartitionExpiry(db::DocumentKind::Set, key, util::ToUnixMillis(clock_()) + expire_in.count()); });
}

void WriteBatch::PersistSet(const std::string& key) {
  RequireKey(key, "set key");
  Add([this, key] { SetPartitionExpiry(db::DocumentKind::Set, key, std::nullopt); });
}

// ------------------------------------------------------------
// lists
// ------------------------------------------------------------

void WriteBatch::InsertToList(const std::string& key, const std::string& value) {
  RequireKey(key, "list key");
  RequireKey(value, "list value");

  Add([this, key, value] {
    const auto now   = clock_();
    const auto index = AdjustCounter(*store_, resolver_, "list-seq:" + key, 1, std::nullopt, true, now) - 1;

    const auto location = resolver_.Resolve(db::DocumentKind::List, key);

    v1::ListBody body;
    body.set_key(key);
    body.set_index(static_cast<int32_t>(index));
    body.set_value(value);

    db::Document doc;
    doc.id            = "list:" + key + ":" + std::to_string(index);
    doc.partition_key = location.partition_key;
    doc.document_type = TypeName(db::DocumentKind::List);
    db::codec::Pack(body, &doc);

    util::ThrowIfDbError(store_->Create(location.collection, doc), "insert to list " + key);
  });
}

void WriteBatch::RemoveFromList(const std::string& key, const std::string& value) {
  RequireKey(key, "list key");
  RequireKey(value, "list value");

  Add([this, key, value] {
    const auto collection = resolver_.CollectionFor(db::DocumentKind::List);

    db::DocumentQuery query;
    query.Where("value", value);
    for (const auto& doc : PartitionDocuments(db::DocumentKind::List, key, std::move(query))) {
      util::ThrowIfDbError(store_->Delete(collection, doc.id, doc.partition_key), "remove from list " + key);
    }
  });
}

void WriteBatch::TrimList(const std::string& key, int32_t keep_from, int32_t keep_to) {
  RequireKey(key, "list key");

  Add([this, key, keep_from, keep_to] {
    const auto collection = resolver_.CollectionFor(db::DocumentKind::List);

    db::DocumentQuery query;
    query.OrderedBy("index");
    const auto items = PartitionDocuments(db::DocumentKind::List, key, std::move(query));

    for (std::size_t position = 0; position < items.size(); ++position) {
      const auto p = static_cast<int64_t>(position);
      if (p >= keep_from && p <= keep_to) {
        continue;
      }
      util::ThrowIfDbError(store_->Delete(collection, items[position].id, items[position].partition_key), "trim list " + key);
    }
  });
}

void WriteBatch::ExpireList(const std::string& key, std::chrono::milliseconds expire_in) {
  RequireKey(key, "list key");
  Add([this, key, expire_in] { SetPartitionExpiry(db::DocumentKind::List, key, util::ToUnixMillis(clock_()) + expire_in.count()); });
}

void WriteBatch::PersistList(const std::string& key) {
  RequireKey(key, "list key");
  Add([this, key] { SetPartitionExpiry(db::DocumentKind::List, key, std::nullopt); });
}

// ------------------------------------------------------------
// hashes
// ------------------------------------------------------------

void WriteBatch::SetRangeInHash(const std::string& key, const std::vector<std::pair<std::string, std::string>>& entries) {
  RequireKey(key, "hash key");
  for (const auto& entry : entries) {
    RequireKey(entry.first, "hash field");
  }

  Add([this, key, entries] {
    const auto location = resolver_.Resolve(db::DocumentKind::Hash, key);
    for (const auto& [field, value] : entries) {
      v1::HashBody body;
      body.set_key(key);
      body.set_field(field);
      body.set_value(value);

      db::Document doc;
      doc.id            = "hash:" + key + ":" + field;
      doc.partition_key = location.partition_key;
      doc.document_type = TypeName(db::DocumentKind::Hash);
      db::codec::Pack(body, &doc);

      util::ThrowIfDbError(store_->Upsert(location.collection, doc), "set hash field " + key + "." + field);
    }
  });
}

void WriteBatch::RemoveHash(const std::string& key) {
  RequireKey(key, "hash key");

  Add([this, key] {
    const auto collection = resolver_.CollectionFor(db::DocumentKind::Hash);
    for (const auto& doc : PartitionDocuments(db::DocumentKind::Hash, key, {})) {
      util::ThrowIfDbError(store_->Delete(collection, doc.id, doc.partition_key), "remove hash " + key);
    }
  });
}

void WriteBatch::ExpireHash(const std::string& key, std::chrono::milliseconds expire_in) {
  RequireKey(key, "hash key");
  Add([this, key, expire_in] { SetPartitionExpiry(db::DocumentKind::Hash, key, util::ToUnixMillis(clock_()) + expire_in.count()); });
}

void WriteBatch::PersistHash(const std::string& key) {
  RequireKey(key, "hash key");
  Add([this, key] { SetPartitionExpiry(db::DocumentKind::Hash, key, std::nullopt); });
}

} // namespace jobstore::batch
