#pragma once

#include <string>
#include <utility>

namespace notify::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on pqxx/sqlite error types.

  Conflict is reserved for a failed create-if-absent predicate: the
  target key already holds a record.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  Conflict,
  Busy,

  ConstraintViolation,
  SerializationFailure,

  IOError,
  Corruption,

  Unsupported,
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

// Busy, IO and serialization failures may succeed if simply tried again.
inline bool IsTransient(ErrorCode code) {
  return code == ErrorCode::Busy || code == ErrorCode::IOError || code == ErrorCode::SerializationFailure;
}

const char* ToString(ErrorCode code);

} // namespace notify::db
