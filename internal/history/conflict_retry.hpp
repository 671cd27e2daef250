#pragma once

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace weave::history {

inline constexpr int kMaxConflictRetries = 5;

/*
  Re-runs fn when another writer advanced the run between our read and
  our append. fn must re-read everything it appends against.
*/
template <typename Fn>
auto RetryOnConflict(const char* operation, Fn&& fn) -> decltype(fn()) {
  for (int attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const util::ConcurrencyConflict& e) {
      if (attempt >= kMaxConflictRetries) throw;
      WEAVE_LOG_DEBUG("append conflict, retrying", {observability::StringField("operation", operation),
                                                    observability::IntField("attempt", attempt), observability::StringField("error", e.what())});
    }
  }
}

} // namespace weave::history
