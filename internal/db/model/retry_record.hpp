#pragma once

#include <cstdint>
#include <string>

namespace settlement::db::model {

/*
  Durable retry queue row for events that failed with a retryable
  error. A worker claims a row by writing lease_owner and
  lease_expires_at_ms; an expired lease makes the row claimable again.
*/
struct RetryRecord {
  std::string id;

  std::string event_id;
  std::string event_type;
  std::string raw_payload;
  std::string order_id;

  uint32_t    attempts           = 0;
  int64_t     next_attempt_at_ms = 0;
  std::string last_error;

  std::string lease_owner;
  int64_t     lease_expires_at_ms = 0;

  int64_t created_at_ms = 0;
};

} // namespace settlement::db::model
