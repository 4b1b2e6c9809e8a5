#pragma once

#include <cstdint>
#include <string_view>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace timebank::service {

/*
  Runs `fn` (one whole transaction) again when it fails with
  ConcurrencyConflict, up to max_retries extra attempts.
*/
template <typename Fn>
auto WithConflictRetry(std::string_view operation, uint32_t max_retries, Fn&& fn) -> decltype(fn()) {
  for (uint32_t attempt = 0;; ++attempt) {
    try {
      return fn();
    } catch (const util::ConcurrencyConflict& e) {
      if (attempt >= max_retries) {
        TIMEBANK_LOG_WARN("concurrency conflict, giving up",
                          {observability::StringField("operation", operation),
                           observability::IntField("attempts", attempt + 1),
                           observability::StringField("error", e.what())});
        throw;
      }
      TIMEBANK_LOG_DEBUG("concurrency conflict, retrying",
                         {observability::StringField("operation", operation),
                          observability::IntField("attempt", attempt + 1)});
    }
  }
}

} // namespace timebank::service
