#include "internal/resilience/circuit_breaker.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using jobstore::resilience::CircuitBreaker;
using jobstore::resilience::CircuitBreakerOptions;
using jobstore::resilience::CircuitState;
using jobstore::util::TimePoint;

struct FakeClock {
  std::shared_ptr<TimePoint> now = std::make_shared<TimePoint>(jobstore::util::FromUnixMillis(1'700'000'000'000));

  jobstore::util::ClockFn Fn() const {
    auto shared = now;
    return [shared] { return *shared; };
  }

  void Advance(std::chrono::milliseconds by) {
    *now += by;
  }
};

CircuitBreakerOptions ThreeStrikeOptions() {
  CircuitBreakerOptions options;
  options.failure_threshold = 3;
  options.open_timeout      = std::chrono::seconds(10);
  options.success_threshold = 2;
  return options;
}

void Fail(CircuitBreaker& breaker, const std::string& op) {
  try {
    breaker.Execute(op, []() -> int { throw std::runtime_error("boom"); });
  } catch (const std::runtime_error&) {
    return;
  }
  assert(false && "failure must be rethrown");
}

bool IsRejected(CircuitBreaker& breaker) {
  try {
    breaker.Execute("probe", [] { return 1; });
  } catch (const jobstore::util::CircuitOpen&) {
    return true;
  }
  return false;
}

void TestOpensAfterThresholdAndRejects() {
  FakeClock      clock;
  CircuitBreaker breaker(ThreeStrikeOptions(), clock.Fn());

  Fail(breaker, "get/jobs");
  Fail(breaker, "get/jobs");
  assert(breaker.State() == CircuitState::Closed);
  assert(breaker.FailureCount() == 2);

  Fail(breaker, "replace/jobs");
  assert(breaker.State() == CircuitState::Open);
  assert(breaker.OperationFailureCounts().at("get/jobs") == 2);
  assert(breaker.OperationFailureCounts().at("replace/jobs") == 1);

  bool rejected = false;
  try {
    breaker.Execute("get/jobs", [] { return 1; });
  } catch (const jobstore::util::CircuitOpen& e) {
    rejected = true;
    assert(e.operation() == "get/jobs");
    assert(e.retry_after() == *clock.now + std::chrono::seconds(10));
  }
  assert(rejected);
}

void TestSuccessResetsConsecutiveFailures() {
  FakeClock      clock;
  CircuitBreaker breaker(ThreeStrikeOptions(), clock.Fn());

  Fail(breaker, "op");
  Fail(breaker, "op");
  assert(breaker.Execute("op", [] { return 7; }) == 7);
  assert(breaker.FailureCount() == 0);
  assert(breaker.OperationFailureCounts().count("op") == 0);

  Fail(breaker, "op");
  assert(breaker.State() == CircuitState::Closed);
}

void TestHalfOpenClosesAfterSuccessThreshold() {
  FakeClock      clock;
  CircuitBreaker breaker(ThreeStrikeOptions(), clock.Fn());

  for (int i = 0; i < 3; ++i) Fail(breaker, "op");
  assert(breaker.State() == CircuitState::Open);

  clock.Advance(std::chrono::seconds(9));
  assert(IsRejected(breaker));

  clock.Advance(std::chrono::seconds(1));
  assert(!IsRejected(breaker));
  assert(breaker.State() == CircuitState::HalfOpen);
  assert(breaker.SuccessCount() == 1);

  breaker.Execute("op", [] {});
  assert(breaker.State() == CircuitState::Closed);
}

void TestHalfOpenFailureReopens() {
  FakeClock      clock;
  CircuitBreaker breaker(ThreeStrikeOptions(), clock.Fn());

  for (int i = 0; i < 3; ++i) Fail(breaker, "op");
  clock.Advance(std::chrono::seconds(11));

  Fail(breaker, "op");
  assert(breaker.State() == CircuitState::Open);
  assert(IsRejected(breaker));
}

void TestDisabledBreakerPassesEverythingThrough() {
  auto options    = ThreeStrikeOptions();
  options.enabled = false;
  CircuitBreaker breaker(options);

  for (int i = 0; i < 10; ++i) Fail(breaker, "op");
  assert(breaker.State() == CircuitState::Closed);
  assert(!IsRejected(breaker));
}

void TestResetClosesAndClearsCounters() {
  FakeClock      clock;
  CircuitBreaker breaker(ThreeStrikeOptions(), clock.Fn());

  for (int i = 0; i < 3; ++i) Fail(breaker, "op");
  breaker.Reset();
  assert(breaker.State() == CircuitState::Closed);
  assert(breaker.FailureCount() == 0);
  assert(breaker.OperationFailureCounts().empty());
}

void TestInvalidOptionsAreRejected() {
  auto options              = ThreeStrikeOptions();
  options.failure_threshold = 0;

  bool threw = false;
  try {
    CircuitBreaker breaker(options);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
  assert(std::string(jobstore::resilience::ToString(CircuitState::HalfOpen)) == "half_open");
}

} // namespace

int main() {
  TestOpensAfterThresholdAndRejects();
  TestSuccessResetsConsecutiveFailures();
  TestHalfOpenClosesAfterSuccessThreshold();
  TestHalfOpenFailureReopens();
  TestDisabledBreakerPassesEverythingThrough();
  TestResetClosesAndClearsCounters();
  TestInvalidOptionsAreRejected();

  std::cout << "jobstore_unit_circuit_breaker: pass\n";
  return 0;
}
