#include "storage_connection.hpp"

#include <unistd.h>

#include <algorithm>
#include <climits>
#include <limits>
#include <stdexcept>

#include "internal/db/api/cursor.hpp"
#include "internal/db/codec/document_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "jobstore/documents/v1/documents.pb.h"

namespace jobstore::connection {

namespace v1 = jobstore::documents::v1;

namespace {

constexpr int kHeartbeatAttempts = 3;

void RequireKey(const std::string& key, const char* what) {
  if (key.empty()) {
    throw std::invalid_argument(std::string(what) + " must not be empty");
  }
}

std::string TypeName(db::DocumentKind kind) {
  return std::string(db::DocumentTypeName(kind));
}

double Millis(util::TimePoint tp) {
  return static_cast<double>(util::ToUnixMillis(tp));
}

std::string HostName() {
  char buffer[HOST_NAME_MAX + 1] = {};
  if (gethostname(buffer, sizeof(buffer) - 1) != 0) {
    return "unknown";
  }
  return buffer;
}

lock::LockOptions MakeLockOptions(const config::StorageOptions& options, const std::string& server_id) {
  lock::LockOptions lock_options;
  lock_options.owner_id       = server_id.empty() ? HostName() : server_id;
  lock_options.renew_enabled  = options.lock_renew_enabled;
  lock_options.renew_interval = options.lock_renew_interval;
  return lock_options;
}

} // namespace

StorageConnection::StorageConnection(std::shared_ptr<db::DocumentStore> store, config::StorageOptions options, std::string server_id,
                                     util::ClockFn clock)
    : store_(std::move(store)),
      options_(std::move(options)),
      resolver_(options_.layout, options_.collections),
      clock_(clock ? std::move(clock) : util::ClockFn(util::Now)),
      jobs_(store_, resolver_, jobs::JobManagerOptions{options_.conflict_retry_limit}, clock_),
      locks_(store_, resolver_, MakeLockOptions(options_, server_id), clock_),
      fetcher_(jobs_, queue::FetcherOptions{options_.query_page_size}) {
  options_.Validate();
}

// ------------------------------------------------------------
// jobs
// ------------------------------------------------------------

std::string StorageConnection::CreateExpiredJob(const jobs::Invocation& invocation, const std::string& queue,
                                                const std::map<std::string, std::string>& parameters, std::chrono::milliseconds expire_in,
                                                std::optional<util::TimePoint> created_at) {
  if (expire_in <= std::chrono::milliseconds::zero()) {
    expire_in = options_.default_job_expiration;
  }
  return jobs_.CreateExpiredJob(invocation, queue, parameters, expire_in, created_at);
}

std::unique_ptr<queue::FetchedJob> StorageConnection::FetchNextJob(const std::vector<std::string>& queues, const util::CancellationToken& cancellation) {
  return fetcher_.FetchNext(queues, cancellation);
}

std::optional<jobs::JobData> StorageConnection::GetJobData(const std::string& job_id) {
  RequireKey(job_id, "job id");
  return jobs_.GetJobData(job_id);
}

std::optional<jobs::StateData> StorageConnection::GetStateData(const std::string& job_id) {
  RequireKey(job_id, "job id");
  return jobs_.GetStateData(job_id);
}

std::optional<std::string> StorageConnection::GetJobParameter(const std::string& job_id, const std::string& name) {
  RequireKey(job_id, "job id");
  RequireKey(name, "parameter name");
  return jobs_.GetParameter(job_id, name);
}

void StorageConnection::SetJobParameter(const std::string& job_id, const std::string& name, const std::string& value) {
  RequireKey(job_id, "job id");
  RequireKey(name, "parameter name");
  jobs_.SetParameter(job_id, name, value);
}

std::unique_ptr<batch::WriteBatch> StorageConnection::CreateWriteBatch() {
  return std::make_unique<batch::WriteBatch>(store_, resolver_, jobs_, clock_);
}

std::unique_ptr<lock::DistributedLock> StorageConnection::AcquireDistributedLock(const std::string& resource, std::chrono::milliseconds timeout) {
  RequireKey(resource, "lock resource");
  if (timeout <= std::chrono::milliseconds::zero()) {
    timeout = options_.lock_timeout;
  }
  return locks_.Acquire(resource, std::min(timeout, options_.lock_ttl));
}

// ------------------------------------------------------------
// servers
// ------------------------------------------------------------

void StorageConnection::AnnounceServer(const std::string& server_id, const ServerContext& context) {
  RequireKey(server_id, "server id");

  const auto now      = clock_();
  const auto location = resolver_.Resolve(db::DocumentKind::Server);

  v1::ServerBody body;
  body.set_server_id(server_id);
  body.set_last_heartbeat(Millis(now));
  body.set_started_at(Millis(now));

  auto* data = body.mutable_data();
  data->set_worker_count(context.worker_count);
  for (const auto& queue : context.queues) {
    data->add_queues(queue);
  }
  data->set_started_at(Millis(now));
  data->set_name(HostName());

  db::Document doc;
  doc.id            = "server:" + server_id;
  doc.partition_key = location.partition_key;
  doc.document_type = TypeName(db::DocumentKind::Server);
  doc.expire_at_ms  = util::ToUnixMillis(now) + options_.server_ttl.count();
  db::codec::Pack(body, &doc);

  util::ThrowIfDbError(store_->Upsert(location.collection, doc), "announce server " + server_id);
  JOBSTORE_LOG_INFO("server announced", {observability::StringField("server_id", server_id),
                                         observability::IntField("workers", context.worker_count)});
}

void StorageConnection::Heartbeat(const std::string& server_id) {
  RequireKey(server_id, "server id");
  const auto location = resolver_.Resolve(db::DocumentKind::Server);

  for (int attempt = 0; attempt < kHeartbeatAttempts; ++attempt) {
    auto doc = store_->Get(location.collection, "server:" + server_id, location.partition_key);
    if (!doc) {
      throw util::NotFound("server " + server_id + " is not registered");
    }

    const auto now  = clock_();
    auto       body = db::codec::Unpack<v1::ServerBody>(*doc);
    body.set_last_heartbeat(Millis(now));
    doc->expire_at_ms = util::ToUnixMillis(now) + options_.server_ttl.count();

    const auto etag = doc->etag;
    db::codec::Pack(body, &*doc);

    auto result = store_->Replace(location.collection, *doc, etag);
    if (result) {
      return;
    }
    if (result.code == db::ErrorCode::NotFound) {
      throw util::NotFound("server " + server_id + " is not registered");
    }
    if (result.code != db::ErrorCode::Conflict) {
      util::ThrowIfDbError(result, "heartbeat server " + server_id);
    }
  }
  throw util::ConcurrencyConflict("heartbeat of server " + server_id + " kept conflicting");
}

void StorageConnection::RemoveServer(const std::string& server_id) {
  RequireKey(server_id, "server id");
  const auto location = resolver_.Resolve(db::DocumentKind::Server);
  util::ThrowIfDbError(store_->Delete(location.collection, "server:" + server_id, location.partition_key), "remove server " + server_id);
  JOBSTORE_LOG_INFO("server removed", {observability::StringField("server_id", server_id)});
}

std::size_t StorageConnection::RemoveTimedOutServers(std::chrono::milliseconds timeout) {
  if (timeout <= std::chrono::milliseconds::zero()) {
    throw std::invalid_argument("server timeout must be positive");
  }

  const auto location = resolver_.Resolve(db::DocumentKind::Server);

  db::DocumentQuery query;
  query.OfType(TypeName(db::DocumentKind::Server)).Where("lastHeartbeat", db::CompareOp::Lt, Millis(clock_() - timeout));

  db::QueryOptions options;
  options.partition_key = location.partition_key;
  options.page_size     = options_.query_page_size;

  const auto timed_out = db::DocumentCursor(*store_, location.collection, std::move(query), std::move(options)).ToVector();

  std::size_t removed = 0;
  for (const auto& doc : timed_out) {
    // a heartbeat that landed in between wins
    auto result = store_->Delete(location.collection, doc.id, doc.partition_key, doc.etag);
    if (result.code == db::ErrorCode::Conflict) {
      continue;
    }
    util::ThrowIfDbError(result, "remove timed out server " + doc.id);
    ++removed;
  }

  if (removed > 0) {
    JOBSTORE_LOG_INFO("removed timed out servers", {observability::IntField("count", static_cast<int64_t>(removed))});
  }
  return removed;
}

// ------------------------------------------------------------
// partition readers
// ------------------------------------------------------------

std::vector<db::Document> StorageConnection::PartitionItems(db::DocumentKind kind, const std::string& key, db::DocumentQuery query) {
  RequireKey(key, "key");
  const auto location = resolver_.Resolve(kind, key);

  db::QueryOptions options;
  options.partition_key = location.partition_key;
  options.page_size     = options_.query_page_size;

  query.OfType(TypeName(kind)).Where("key", key);
  return db::DocumentCursor(*store_, location.collection, std::move(query), std::move(options)).ToVector();
}

std::vector<db::Document> StorageConnection::PartitionRange(db::DocumentKind kind, const std::string& key, const std::string& order_field,
                                                            int32_t start, int32_t end) {
  RequireKey(key, "key");
  if (start < 0 || end < start) {
    return {};
  }

  const auto location = resolver_.Resolve(kind, key);

  db::DocumentQuery query;
  query.OfType(TypeName(kind)).Where("key", key).OrderedBy(order_field);

  db::QueryOptions options;
  options.partition_key = location.partition_key;
  options.continuation  = db::EncodeContinuation(start);
  // end may be INT32_MAX ("to the end"), so the width is taken in 64 bits
  const int64_t width = static_cast<int64_t>(end) - start + 1;
  options.page_size   = static_cast<int32_t>(std::min<int64_t>(width, std::numeric_limits<int32_t>::max()));

  return store_->Query(location.collection, query, options).documents;
}

int64_t StorageConnection::PartitionCount(db::DocumentKind kind, const std::string& key) {
  RequireKey(key, "key");
  const auto location = resolver_.Resolve(kind, key);

  db::DocumentQuery query;
  query.OfType(TypeName(kind)).Where("key", key);
  return store_->Count(location.collection, query, location.partition_key);
}

// Time until the earliest expiring item; nullopt when nothing expires.
std::optional<std::chrono::milliseconds> StorageConnection::PartitionTtl(db::DocumentKind kind, const std::string& key) {
  std::optional<int64_t> earliest;
  for (const auto& doc : PartitionItems(kind, key, {})) {
    if (doc.expire_at_ms && (!earliest || *doc.expire_at_ms < *earliest)) {
      earliest = doc.expire_at_ms;
    }
  }
  if (!earliest) {
    return std::nullopt;
  }
  return std::chrono::milliseconds(std::max<int64_t>(0, *earliest - util::ToUnixMillis(clock_())));
}

// ------------------------------------------------------------
// sets
// ------------------------------------------------------------

std::vector<std::string> StorageConnection::GetAllItemsFromSet(const std::string& key) {
  db::DocumentQuery query;
  query.OrderedBy("score");

  std::vector<std::string> values;
  for (const auto& doc : PartitionItems(db::DocumentKind::Set, key, std::move(query))) {
    values.push_back(db::codec::Unpack<v1::SetBody>(doc).value());
  }
  return values;
}

std::optional<std::string> StorageConnection::GetFirstByLowestScoreFromSet(const std::string& key, double from_score, double to_score) {
  RequireKey(key, "set key");
  if (from_score > to_score) {
    throw std::invalid_argument("from_score must not exceed to_score");
  }

  const auto location = resolver_.Resolve(db::DocumentKind::Set, key);

  db::DocumentQuery query;
  query.OfType(TypeName(db::DocumentKind::Set))
      .Where("key", key)
      .Where("score", db::CompareOp::Ge, from_score)
      .Where("score", db::CompareOp::Le, to_score)
      .OrderedBy("score")
      .Limit(1);

  db::QueryOptions options;
  options.partition_key = location.partition_key;
  options.page_size     = 1;

  auto page = store_->Query(location.collection, query, options);
  if (page.documents.empty()) {
    return std::nullopt;
  }
  return db::codec::Unpack<v1::SetBody>(page.documents.front()).value();
}

std::vector<std::string> StorageConnection::GetRangeFromSet(const std::string& key, int32_t start, int32_t end) {
  std::vector<std::string> values;
  for (const auto& doc : PartitionRange(db::DocumentKind::Set, key, "score", start, end)) {
    values.push_back(db::codec::Unpack<v1::SetBody>(doc).value());
  }
  return values;
}

int64_t StorageConnection::GetSetCount(const std::string& key) {
  return PartitionCount(db::DocumentKind::Set, key);
}

std::optional<std::chrono::milliseconds> StorageConnection::GetSetTtl(const std::string& key) {
  return PartitionTtl(db::DocumentKind::Set, key);
}

// ------------------------------------------------------------
// lists
// ------------------------------------------------------------

std::vector<std::string> StorageConnection::GetAllItemsFromList(const std::string& key) {
  db::DocumentQuery query;
  query.OrderedBy("index");

  std::vector<std::string> values;
  for (const auto& doc : PartitionItems(db::DocumentKind::List, key, std::move(query))) {
    values.push_back(db::codec::Unpack<v1::ListBody>(doc).value());
  }
  return values;
}

std::vector<std::string> StorageConnection::GetRangeFromList(const std::string& key, int32_t start, int32_t end) {
  std::vector<std::string> values;
  for (const auto& doc : PartitionRange(db::DocumentKind::List, key, "index", start, end)) {
    values.push_back(db::codec::Unpack<v1::ListBody>(doc).value());
  }
  return values;
}

int64_t StorageConnection::GetListCount(const std::string& key) {
  return PartitionCount(db::DocumentKind::List, key);
}

std::optional<std::chrono::milliseconds> StorageConnection::GetListTtl(const std::string& key) {
  return PartitionTtl(db::DocumentKind::List, key);
}

// ------------------------------------------------------------
// hashes
// ------------------------------------------------------------

std::map<std::string, std::string> StorageConnection::GetAllEntriesFromHash(const std::string& key) {
  std::map<std::string, std::string> entries;
  for (const auto& doc : PartitionItems(db::DocumentKind::Hash, key, {})) {
    auto body               = db::codec::Unpack<v1::HashBody>(doc);
    entries[body.field()] = body.value();
  }
  return entries;
}

std::optional<std::string> StorageConnection::GetValueFromHash(const std::string& key, const std::string& field) {
  RequireKey(key, "hash key");
  RequireKey(field, "hash field");

  const auto location = resolver_.Resolve(db::DocumentKind::Hash, key);
  auto       doc      = store_->Get(location.collection, "hash:" + key + ":" + field, location.partition_key);
  if (!doc) {
    return std::nullopt;
  }
  return db::codec::Unpack<v1::HashBody>(*doc).value();
}

int64_t StorageConnection::GetHashCount(const std::string& key) {
  return PartitionCount(db::DocumentKind::Hash, key);
}

std::optional<std::chrono::milliseconds> StorageConnection::GetHashTtl(const std::string& key) {
  return PartitionTtl(db::DocumentKind::Hash, key);
}

void StorageConnection::SetRangeInHash(const std::string& key, const std::vector<std::pair<std::string, std::string>>& entries) {
  auto batch = CreateWriteBatch();
  batch->SetRangeInHash(key, entries);
  batch->Commit();
}

// ------------------------------------------------------------
// counters
// ------------------------------------------------------------

int64_t StorageConnection::GetCounter(const std::string& key) {
  RequireKey(key, "counter key");

  const auto location = resolver_.Resolve(db::DocumentKind::Counter);
  auto       doc      = store_->Get(location.collection, "counter:" + key, location.partition_key);
  if (!doc) {
    return 0;
  }
  return db::codec::Unpack<v1::CounterBody>(*doc).value();
}

} // namespace jobstore::connection
