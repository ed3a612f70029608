#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "settlement/engine/core/v1/ledger.pb.h"

namespace settlement::db::model {

// Descriptive fields copied onto every ledger entry at settlement time.
struct ContextSnapshot {
  std::string service_name;
  std::string subject;
  std::string payer_name;
  std::string fulfiller_name;
  std::string facilitator_name;
};

/*
  Persistent order row.

  Written by the order collaborator; the settlement engine only moves
  status and stamps payment_ref / paid_at_ms.
*/
struct OrderRecord {
  std::string id;

  std::string                payer_id;
  std::string                fulfiller_id;
  std::optional<std::string> referrer_id;
  std::optional<std::string> facilitator_id;

  int64_t gross_minor = 0;

  // Processor payment reference, empty until paid.
  std::string payment_ref;

  int64_t fulfillment_end_ms = 0;

  settlement::engine::core::v1::OrderStatus status = settlement::engine::core::v1::ORDER_STATUS_UNPAID;

  int64_t paid_at_ms = 0;

  ContextSnapshot context;

  int64_t created_at_ms = 0;
};

} // namespace settlement::db::model
