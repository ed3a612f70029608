#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include "internal/db/api/result.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace settlement::core {

inline void ThrowIfDbError(const settlement::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  if (result.Retryable()) {
    throw settlement::util::Transient(message);
  }

  switch (result.code) {
    case settlement::db::ErrorCode::AlreadyExists:
      throw settlement::util::AlreadyExists(message);
    case settlement::db::ErrorCode::NotFound:
      throw settlement::util::NotFound(message);
    case settlement::db::ErrorCode::ConstraintViolation:
      throw settlement::util::InvalidState(message);
    default:
      throw std::runtime_error(message);
  }
}

/*
  Runs one unit of work, starting over when the store reports a lost
  race (util::Transient from a statement or from Commit). Each attempt
  must open its own transaction so that reads are redone.
*/
template <typename Fn>
auto RetryOnConflict(std::string_view operation, std::uint32_t max_attempts, Fn&& fn) -> decltype(fn()) {
  const std::uint32_t attempts = max_attempts == 0 ? 1 : max_attempts;
  for (std::uint32_t attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const settlement::util::Transient& e) {
      if (attempt >= attempts) {
        throw;
      }
      SETTLEMENT_LOG_WARN("store conflict, retrying",
                          {settlement::observability::StringField("operation", operation), settlement::observability::IntField("attempt", attempt),
                           settlement::observability::StringField("error", e.what())});
    }
  }
}

} // namespace settlement::core
