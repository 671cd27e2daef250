#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace weave::db {

// Converts a failed store Result into the engine exception taxonomy.
inline void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::AlreadyExists:
      throw weave::util::AlreadyExists(message);
    case ErrorCode::NotFound:
      throw weave::util::NotFound(message);
    case ErrorCode::Conflict:
    case ErrorCode::SerializationFailure:
      throw weave::util::ConcurrencyConflict(message);
    case ErrorCode::Busy:
    case ErrorCode::IOError:
      throw weave::util::StoreUnavailable(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace weave::db
