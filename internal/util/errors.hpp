#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"

namespace jobstore::util {

/*
  Central error types.

  The document store layer reports db::Result codes; everything above it
  converts them into these exceptions.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Another holder owns a live lock document for the resource.
class LockUnavailable : public std::runtime_error {
 public:
  LockUnavailable(std::string resource, const std::string& msg) : std::runtime_error(msg), resource_(std::move(resource)) {
  }

  const std::string& resource() const {
    return resource_;
  }

 private:
  std::string resource_;
};

class CircuitOpen : public std::runtime_error {
 public:
  CircuitOpen(std::string operation, std::chrono::system_clock::time_point retry_after)
      : std::runtime_error("circuit breaker is open for operation '" + operation + "'"),
        operation_(std::move(operation)),
        retry_after_(retry_after) {
  }

  const std::string& operation() const {
    return operation_;
  }

  std::chrono::system_clock::time_point retry_after() const {
    return retry_after_;
  }

 private:
  std::string                           operation_;
  std::chrono::system_clock::time_point retry_after_;
};

class Timeout : public std::runtime_error {
 public:
  explicit Timeout(const std::string& msg) : std::runtime_error(msg) {
  }
};

class OperationCancelled : public std::runtime_error {
 public:
  explicit OperationCancelled(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The job's described method can no longer be resolved or its payload is malformed.
class InvocationError : public std::runtime_error {
 public:
  explicit InvocationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConcurrencyConflict : public std::runtime_error {
 public:
  explicit ConcurrencyConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Backend failure surfaced from a read path (reads return values, not Result).
class StoreError : public std::runtime_error {
 public:
  StoreError(db::ErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  db::ErrorCode code() const {
    return code_;
  }

 private:
  db::ErrorCode code_;
};

/*
  Maps a failed write Result to the matching exception.
  No-op for Ok.
*/
inline void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw NotFound(message);
    case db::ErrorCode::Conflict:
      throw ConcurrencyConflict(message);
    default:
      throw StoreError(result.code, message);
  }
}

} // namespace jobstore::util
