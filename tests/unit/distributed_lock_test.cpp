#include "internal/lock/distributed_lock.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include "internal/db/memory/memory_document_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using jobstore::db::CollectionLayout;
using jobstore::db::CollectionNames;
using jobstore::db::CollectionResolver;
using jobstore::db::DocumentKind;
using jobstore::lock::LockOptions;
using jobstore::lock::LockProvider;
using jobstore::util::TimePoint;

struct FakeClock {
  std::shared_ptr<TimePoint> now = std::make_shared<TimePoint>(jobstore::util::FromUnixMillis(1'700'000'000'000));

  jobstore::util::ClockFn Fn() const {
    auto shared = now;
    return [shared] { return *shared; };
  }
};

CollectionResolver Resolver() {
  return CollectionResolver(CollectionLayout::Dedicated, CollectionNames{});
}

bool IsUnavailable(LockProvider& locks, const std::string& resource) {
  try {
    auto lock = locks.Acquire(resource, std::chrono::seconds(1));
  } catch (const jobstore::util::LockUnavailable& e) {
    assert(e.resource() == resource);
    return true;
  }
  return false;
}

void TestSecondAcquireFailsUntilRelease() {
  auto         store = std::make_shared<jobstore::db::memory::MemoryDocumentStore>();
  LockProvider locks(store, Resolver(), LockOptions{"server-a"});

  auto lock = locks.Acquire("recurring-jobs", std::chrono::seconds(30));
  assert(lock->IsHeld());
  assert(lock->Owner().rfind("server-a:", 0) == 0);
  assert(IsUnavailable(locks, "recurring-jobs"));

  // different resources do not interfere
  assert(!IsUnavailable(locks, "other"));

  lock->Release();
  assert(!lock->IsHeld());
  lock->Release();
  assert(!IsUnavailable(locks, "recurring-jobs"));
}

void TestDestructorReleases() {
  auto         store = std::make_shared<jobstore::db::memory::MemoryDocumentStore>();
  LockProvider locks(store, Resolver(), LockOptions{});
  {
    auto lock = locks.Acquire("scoped", std::chrono::seconds(30));
  }
  assert(!IsUnavailable(locks, "scoped"));
}

void TestExpiredLockCanBeTakenOver() {
  FakeClock    clock;
  auto         store = std::make_shared<jobstore::db::memory::MemoryDocumentStore>(clock.Fn());
  LockProvider locks(store, Resolver(), LockOptions{"a"}, clock.Fn());

  auto first = locks.Acquire("cleanup", std::chrono::seconds(1));
  *clock.now += std::chrono::milliseconds(900);
  assert(IsUnavailable(locks, "cleanup"));

  *clock.now += std::chrono::milliseconds(200);
  auto second = locks.Acquire("cleanup", std::chrono::seconds(1));
  assert(second->IsHeld());

  // the stale holder must not delete the new owner's document
  first->Release();
  const auto location = Resolver().Resolve(DocumentKind::Lock);
  assert(store->Get(location.collection, "lock:cleanup", location.partition_key).has_value());
  assert(IsUnavailable(locks, "cleanup"));
}

void TestRenewalKeepsLockAlive() {
  auto        store = std::make_shared<jobstore::db::memory::MemoryDocumentStore>();
  LockOptions options;
  options.owner_id       = "renewer";
  options.renew_enabled  = true;
  options.renew_interval = std::chrono::milliseconds(40);
  LockProvider locks(store, Resolver(), options);

  auto lock = locks.Acquire("long-running", std::chrono::milliseconds(200));
  std::this_thread::sleep_for(std::chrono::milliseconds(500));

  assert(lock->IsHeld());
  LockProvider others(store, Resolver(), LockOptions{"other"});
  assert(IsUnavailable(others, "long-running"));

  lock->Release();
  assert(!IsUnavailable(others, "long-running"));
}

void TestRenewalNoticesLostLock() {
  auto        store = std::make_shared<jobstore::db::memory::MemoryDocumentStore>();
  LockOptions options;
  options.renew_enabled  = true;
  options.renew_interval = std::chrono::milliseconds(20);
  LockProvider locks(store, Resolver(), options);

  auto       lock     = locks.Acquire("fragile", std::chrono::seconds(5));
  const auto location = Resolver().Resolve(DocumentKind::Lock);
  assert(store->Delete(location.collection, "lock:fragile", location.partition_key));

  for (int i = 0; i < 50 && lock->IsHeld(); ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  assert(!lock->IsHeld());
}

void TestInvalidArgumentsAreRejected() {
  auto         store = std::make_shared<jobstore::db::memory::MemoryDocumentStore>();
  LockProvider locks(store, Resolver(), LockOptions{});

  bool threw = false;
  try {
    (void)locks.Acquire("", std::chrono::seconds(1));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)locks.Acquire("x", std::chrono::milliseconds(0));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestSecondAcquireFailsUntilRelease();
  TestDestructorReleases();
  TestExpiredLockCanBeTakenOver();
  TestRenewalKeepsLockAlive();
  TestRenewalNoticesLostLock();
  TestInvalidArgumentsAreRejected();

  std::cout << "jobstore_unit_distributed_lock: pass\n";
  return 0;
}
