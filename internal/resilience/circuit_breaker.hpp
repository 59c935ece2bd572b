#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>

#include "internal/util/time.hpp"

namespace jobstore::resilience {

enum class CircuitState {
  Closed,   // calls pass through
  Open,     // calls fail fast with util::CircuitOpen
  HalfOpen, // calls probe recovery
};

const char* ToString(CircuitState state);

struct CircuitBreakerOptions {
  bool                      enabled           = true;
  uint32_t                  failure_threshold = 5;
  std::chrono::milliseconds open_timeout{60'000};
  uint32_t                  success_threshold = 3;
  std::chrono::milliseconds operation_timeout{30'000};

  // Throws std::invalid_argument.
  void Validate() const;
};

/*
  CircuitBreaker

  Closed  -> Open      after failure_threshold consecutive failures
  Open    -> HalfOpen  on the first call after open_timeout has elapsed
  HalfOpen-> Closed    after success_threshold consecutive successes
  HalfOpen-> Open      on any failure

  One mutex guards the counters and the state; the guarded call itself
  runs outside it. The operation timeout is enforced by the caller
  (ResilientDocumentStore), the breaker only carries the setting.
*/
class CircuitBreaker {
 public:
  explicit CircuitBreaker(CircuitBreakerOptions options, util::ClockFn clock = util::Now);

  // Runs fn under the breaker; any exception counts as a failure and is rethrown.
  template <typename Fn>
  auto Execute(std::string_view operation, Fn&& fn) -> std::invoke_result_t<Fn> {
    if (!options_.enabled) {
      return fn();
    }

    const std::string op(operation);
    BeforeCall(op);
    try {
      if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
        fn();
        RecordSuccess(op);
      } else {
        auto result = fn();
        RecordSuccess(op);
        return result;
      }
    } catch (const std::exception& e) {
      RecordFailure(op, e.what());
      throw;
    }
  }

  // Throws util::CircuitOpen when the call must be rejected.
  void BeforeCall(const std::string& operation);
  void RecordSuccess(const std::string& operation);
  void RecordFailure(const std::string& operation, std::string_view error);

  CircuitState State() const;
  uint32_t     FailureCount() const;
  uint32_t     SuccessCount() const;

  std::map<std::string, uint32_t> OperationFailureCounts() const;

  // Back to Closed with all counters cleared.
  void Reset();

  const CircuitBreakerOptions& Options() const {
    return options_;
  }

  bool Enabled() const {
    return options_.enabled;
  }

 private:
  void TransitionLocked(CircuitState next, const std::string& operation);

  CircuitBreakerOptions options_;
  util::ClockFn         clock_;

  mutable std::mutex              mutex_;
  CircuitState                    state_         = CircuitState::Closed;
  uint32_t                        failure_count_ = 0;
  uint32_t                        success_count_ = 0;
  util::TimePoint                 last_failure_{};
  std::map<std::string, uint32_t> operation_failures_;
};

} // namespace jobstore::resilience
