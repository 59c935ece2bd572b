#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "internal/db/api/document_store.hpp"
#include "internal/db/collection_resolver.hpp"
#include "internal/util/time.hpp"

namespace jobstore::lock {

struct LockOptions {
  // Prefix of every owner token; usually the server id.
  std::string owner_id;

  // Extend expireAt from a background thread while the lock is held.
  bool renew_enabled = false;

  // 0 means a third of the lock timeout.
  std::chrono::milliseconds renew_interval{0};
};

/*
  DistributedLock

  Lease-style lock on a named resource. Acquisition creates the document
  lock:{resource} with expireAt = now + timeout; the store rejects a second
  live document with the same id, which is the whole exclusion mechanism.
  An expired lock document no longer blocks creation, so a crashed holder
  loses the lock after its timeout.

  The constructor acquires (util::LockUnavailable when held elsewhere).
  Release() deletes the document only if it still carries this handle's
  etag, stops the renewal thread first and runs at most once; it never
  throws. The destructor releases.
*/
class DistributedLock {
 public:
  DistributedLock(std::shared_ptr<db::DocumentStore> store, const db::CollectionResolver& resolver, std::string resource,
                  std::chrono::milliseconds timeout, LockOptions options = {}, util::ClockFn clock = util::Now);
  ~DistributedLock();

  DistributedLock(const DistributedLock&)            = delete;
  DistributedLock& operator=(const DistributedLock&) = delete;

  void Release();

  // false after release or when renewal found the lock taken over.
  bool IsHeld() const {
    return held_.load();
  }

  const std::string& Resource() const {
    return resource_;
  }

  const std::string& Owner() const {
    return owner_;
  }

 private:
  void RenewLoop(std::chrono::milliseconds interval);
  void Renew();

  std::shared_ptr<db::DocumentStore> store_;
  std::string                        collection_;
  std::string                        resource_;
  std::string                        owner_;
  std::chrono::milliseconds          timeout_;
  util::ClockFn                      clock_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  db::Document            doc_;
  bool                    stopping_ = false;
  bool                    released_ = false;
  std::atomic<bool>       held_{false};
  std::thread             renew_thread_;
};

/*
  Hands out locks bound to one store, layout and owner.
*/
class LockProvider {
 public:
  LockProvider(std::shared_ptr<db::DocumentStore> store, db::CollectionResolver resolver, LockOptions options, util::ClockFn clock = util::Now);

  std::unique_ptr<DistributedLock> Acquire(const std::string& resource, std::chrono::milliseconds timeout);

 private:
  std::shared_ptr<db::DocumentStore> store_;
  db::CollectionResolver             resolver_;
  LockOptions                        options_;
  util::ClockFn                      clock_;
};

} // namespace jobstore::lock
