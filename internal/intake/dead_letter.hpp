#pragma once

#include <cstdint>
#include <string>

#include "internal/db/model/failed_event_record.hpp"
#include "internal/db/model/retry_record.hpp"
#include "internal/util/uuid.hpp"

namespace settlement::intake {

inline db::model::FailedEventRecord MakeFailedEvent(const std::string& event_id, const std::string& event_type, const std::string& raw_payload,
                                                    const std::string& order_id, const std::string& error, int64_t now_ms) {
  db::model::FailedEventRecord record;
  record.id            = util::NewId();
  record.event_id      = event_id;
  record.event_type    = event_type;
  record.raw_payload   = raw_payload;
  record.error_message = error;
  record.order_id      = order_id;
  record.created_at_ms = now_ms;
  return record;
}

inline db::model::FailedEventRecord MakeFailedEvent(const db::model::RetryRecord& retry, const std::string& error, int64_t now_ms) {
  return MakeFailedEvent(retry.event_id, retry.event_type, retry.raw_payload, retry.order_id, error, now_ms);
}

} // namespace settlement::intake
