#include "distributed_lock.hpp"

#include <algorithm>

#include "internal/db/codec/document_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"
#include "jobstore/documents/v1/documents.pb.h"

namespace jobstore::lock {

namespace v1 = jobstore::documents::v1;

DistributedLock::DistributedLock(std::shared_ptr<db::DocumentStore> store, const db::CollectionResolver& resolver, std::string resource,
                                 std::chrono::milliseconds timeout, LockOptions options, util::ClockFn clock)
    : store_(std::move(store)), resource_(std::move(resource)), timeout_(timeout), clock_(std::move(clock)) {
  if (!store_) {
    throw std::invalid_argument("distributed lock requires a document store");
  }
  if (resource_.empty()) {
    throw std::invalid_argument("lock resource must not be empty");
  }
  if (timeout_ <= std::chrono::milliseconds::zero()) {
    throw std::invalid_argument("lock timeout must be positive");
  }
  if (!clock_) {
    clock_ = util::Now;
  }

  const auto token = util::ToCompactString(util::GenerateUUID());
  owner_           = options.owner_id.empty() ? token : options.owner_id + ":" + token;

  const auto location = resolver.Resolve(db::DocumentKind::Lock);
  collection_         = location.collection;

  const auto now = clock_();

  v1::LockBody body;
  body.set_resource(resource_);
  body.set_owner(owner_);
  body.set_acquired_at(static_cast<double>(util::ToUnixMillis(now)));
  body.set_timeout_ms(static_cast<double>(timeout_.count()));

  doc_.id            = "lock:" + resource_;
  doc_.partition_key = location.partition_key;
  doc_.document_type = std::string(db::DocumentTypeName(db::DocumentKind::Lock));
  doc_.expire_at_ms  = util::ToUnixMillis(now) + timeout_.count();
  db::codec::Pack(body, &doc_);

  auto result = store_->Create(collection_, doc_);
  if (result.code == db::ErrorCode::AlreadyExists) {
    throw util::LockUnavailable(resource_, "lock '" + resource_ + "' is held by another owner");
  }
  util::ThrowIfDbError(result, "acquire lock " + resource_);
  held_ = true;

  JOBSTORE_LOG_INFO("lock acquired", {observability::StringField("resource", resource_), observability::StringField("owner", owner_),
                                      observability::IntField("timeout_ms", timeout_.count())});

  if (options.renew_enabled) {
    auto interval = options.renew_interval;
    if (interval <= std::chrono::milliseconds::zero()) {
      interval = std::max(timeout_ / 3, std::chrono::milliseconds(1));
    }
    renew_thread_ = std::thread([this, interval] { RenewLoop(interval); });
  }
}

DistributedLock::~DistributedLock() {
  Release();
}

void DistributedLock::RenewLoop(std::chrono::milliseconds interval) {
  std::unique_lock lock(mutex_);
  while (!stopping_ && held_) {
    if (cv_.wait_for(lock, interval, [this] { return stopping_; })) {
      return;
    }
    Renew();
  }
}

// Called with mutex_ held.
void DistributedLock::Renew() {
  db::Document next = doc_;
  next.expire_at_ms = util::ToUnixMillis(clock_()) + timeout_.count();

  db::Result result;
  try {
    result = store_->Replace(collection_, next, doc_.etag);
  } catch (const std::exception& e) {
    JOBSTORE_LOG_WARN("lock renewal failed", {observability::StringField("resource", resource_), observability::StringField("error", e.what())});
    return;
  }

  if (result) {
    doc_ = std::move(next);
    return;
  }

  if (result.code == db::ErrorCode::Conflict || result.code == db::ErrorCode::NotFound) {
    held_ = false;
    JOBSTORE_LOG_ERROR("lock lost before renewal", {observability::StringField("resource", resource_), observability::StringField("owner", owner_),
                                                    observability::StringField("code", db::ToString(result.code))});
    return;
  }

  JOBSTORE_LOG_WARN("lock renewal failed", {observability::StringField("resource", resource_), observability::StringField("error", result.message)});
}

void DistributedLock::Release() {
  {
    std::lock_guard lock(mutex_);
    if (released_) {
      return;
    }
    released_ = true;
    stopping_ = true;
  }
  cv_.notify_all();
  if (renew_thread_.joinable()) {
    renew_thread_.join();
  }

  if (!held_.exchange(false)) {
    return;
  }

  try {
    auto result = store_->Delete(collection_, doc_.id, doc_.partition_key, doc_.etag);
    if (result.code == db::ErrorCode::Conflict) {
      // expired and taken by someone else; theirs now
      JOBSTORE_LOG_WARN("lock already taken over at release", {observability::StringField("resource", resource_)});
    } else if (!result) {
      JOBSTORE_LOG_WARN("lock release failed",
                        {observability::StringField("resource", resource_), observability::StringField("error", db::ToString(result.code))});
    }
  } catch (const std::exception& e) {
    JOBSTORE_LOG_WARN("lock release failed", {observability::StringField("resource", resource_), observability::StringField("error", e.what())});
  }
}

LockProvider::LockProvider(std::shared_ptr<db::DocumentStore> store, db::CollectionResolver resolver, LockOptions options, util::ClockFn clock)
    : store_(std::move(store)), resolver_(std::move(resolver)), options_(std::move(options)), clock_(std::move(clock)) {
}

std::unique_ptr<DistributedLock> LockProvider::Acquire(const std::string& resource, std::chrono::milliseconds timeout) {
  return std::make_unique<DistributedLock>(store_, resolver_, resource, timeout, options_, clock_);
}

} // namespace jobstore::lock
