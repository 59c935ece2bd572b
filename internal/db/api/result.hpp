#pragma once

#include <string>

namespace jobstore::db {

/*
  Portable DB result codes.

  Every document store backend must translate its errors into these.
  Upper layers should never depend on pqxx/sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict, // etag precondition failed
  Busy,

  ConstraintViolation,
  SerializationFailure,

  IOError,
  Corruption,

  Unsupported,
  InvalidData, // document or query the backend could not encode or decode
  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

// Outcomes that say something about the store's health rather than the data.
inline bool IsTransient(ErrorCode code) {
  switch (code) {
    case ErrorCode::Busy:
    case ErrorCode::IOError:
    case ErrorCode::Corruption:
    case ErrorCode::SerializationFailure:
    case ErrorCode::InternalError:
      return true;
    default:
      return false;
  }
}

const char* ToString(ErrorCode code);

} // namespace jobstore::db
