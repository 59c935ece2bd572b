#include "circuit_breaker.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace jobstore::resilience {

const char* ToString(CircuitState state) {
  switch (state) {
    case CircuitState::Closed:
      return "closed";
    case CircuitState::Open:
      return "open";
    case CircuitState::HalfOpen:
      return "half_open";
  }
  return "unknown";
}

void CircuitBreakerOptions::Validate() const {
  if (failure_threshold == 0) {
    throw std::invalid_argument("circuit_breaker.failure_threshold must be greater than zero");
  }
  if (open_timeout <= std::chrono::milliseconds::zero()) {
    throw std::invalid_argument("circuit_breaker.open_timeout must be positive");
  }
  if (success_threshold == 0) {
    throw std::invalid_argument("circuit_breaker.success_threshold must be greater than zero");
  }
  if (operation_timeout <= std::chrono::milliseconds::zero()) {
    throw std::invalid_argument("circuit_breaker.operation_timeout must be positive");
  }
}

CircuitBreaker::CircuitBreaker(CircuitBreakerOptions options, util::ClockFn clock) : options_(options), clock_(std::move(clock)) {
  options_.Validate();
  if (!clock_) {
    clock_ = util::Now;
  }
}

void CircuitBreaker::TransitionLocked(CircuitState next, const std::string& operation) {
  if (state_ == next) {
    return;
  }
  state_ = next;
  observability::Metrics::Instance().RecordCircuitState(ToString(next));

  switch (next) {
    case CircuitState::Open:
      JOBSTORE_LOG_ERROR("circuit breaker opened", {observability::StringField("operation", operation),
                                                    observability::IntField("failures", failure_count_)});
      break;
    case CircuitState::HalfOpen:
      JOBSTORE_LOG_INFO("circuit breaker half-open", {observability::StringField("operation", operation)});
      break;
    case CircuitState::Closed:
      JOBSTORE_LOG_INFO("circuit breaker closed", {observability::StringField("operation", operation)});
      break;
  }
}

void CircuitBreaker::BeforeCall(const std::string& operation) {
  std::lock_guard lock(mutex_);

  if (state_ != CircuitState::Open) {
    return;
  }

  const auto retry_after = last_failure_ + options_.open_timeout;
  if (clock_() >= retry_after) {
    success_count_ = 0;
    TransitionLocked(CircuitState::HalfOpen, operation);
    return;
  }

  JOBSTORE_LOG_WARN("circuit breaker rejected call", {observability::StringField("operation", operation),
                                                      observability::StringField("retry_after", util::ToIso8601(retry_after))});
  throw util::CircuitOpen(operation, retry_after);
}

void CircuitBreaker::RecordSuccess(const std::string& operation) {
  std::lock_guard lock(mutex_);

  failure_count_ = 0;
  operation_failures_.erase(operation);

  if (state_ == CircuitState::HalfOpen) {
    ++success_count_;
    if (success_count_ >= options_.success_threshold) {
      success_count_ = 0;
      TransitionLocked(CircuitState::Closed, operation);
    }
  }
}

void CircuitBreaker::RecordFailure(const std::string& operation, std::string_view error) {
  std::lock_guard lock(mutex_);

  ++failure_count_;
  last_failure_ = clock_();
  ++operation_failures_[operation];

  JOBSTORE_LOG_WARN("circuit breaker recorded failure",
                    {observability::StringField("operation", operation), observability::IntField("failures", failure_count_),
                     observability::IntField("threshold", options_.failure_threshold), observability::StringField("error", error)});

  if (state_ == CircuitState::HalfOpen || failure_count_ >= options_.failure_threshold) {
    success_count_ = 0;
    TransitionLocked(CircuitState::Open, operation);
  }
}

CircuitState CircuitBreaker::State() const {
  std::lock_guard lock(mutex_);
  return state_;
}

uint32_t CircuitBreaker::FailureCount() const {
  std::lock_guard lock(mutex_);
  return failure_count_;
}

uint32_t CircuitBreaker::SuccessCount() const {
  std::lock_guard lock(mutex_);
  return success_count_;
}

std::map<std::string, uint32_t> CircuitBreaker::OperationFailureCounts() const {
  std::lock_guard lock(mutex_);
  return operation_failures_;
}

void CircuitBreaker::Reset() {
  std::lock_guard lock(mutex_);
  failure_count_ = 0;
  success_count_ = 0;
  last_failure_  = {};
  operation_failures_.clear();
  TransitionLocked(CircuitState::Closed, "reset");
}

} // namespace jobstore::resilience
