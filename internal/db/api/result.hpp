#pragma once

#include <string>

namespace weave::db {

/*
  Store outcome codes shared by every backend.

  Backends translate sqlite/pqxx failures into these; the engine turns a
  failed Result into the weave::util exception taxonomy (see db_error.hpp).

    Conflict              compare-and-append lost (run log moved on)
    SerializationFailure  backend aborted the transaction, safe to retry
    Busy, IOError         store unavailable
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,

  SerializationFailure,
  Busy,
  IOError,
  Corruption,

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

} // namespace weave::db
