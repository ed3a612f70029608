#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace settlement::db::model {

/*
  Dead-letter row: an authenticated processor event that could not be
  applied. Kept until replayed successfully (resolved_at_ms set).
*/
struct FailedEventRecord {
  std::string id;

  std::string event_id;
  std::string event_type;
  std::string raw_payload;
  std::string error_message;

  // Best effort, empty when the payload could not be decoded.
  std::string order_id;

  int64_t                created_at_ms = 0;
  std::optional<int64_t> resolved_at_ms;
  uint32_t               replay_attempts = 0;
};

} // namespace settlement::db::model
