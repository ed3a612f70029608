#pragma once

#include <string>
#include <string_view>
#include <variant>

namespace settlement::intake {

// Processor event kinds, decoded from the envelope's event_type and
// payload.

struct PaymentSucceeded {
  std::string order_id;
  std::string payment_ref;
};

struct PaymentFailed {
  std::string order_id;
  std::string payment_ref;
  std::string failure_message;
};

struct TransferSucceeded {
  std::string withdrawal_id;
  std::string transfer_id;
};

struct TransferFailed {
  std::string withdrawal_id;
  std::string transfer_id;
  std::string failure_message;
};

struct TransferCanceled {
  std::string withdrawal_id;
  std::string transfer_id;
};

// status: paid | in_transit | pending | failed | canceled | ...
struct TransferUpdated {
  std::string withdrawal_id;
  std::string transfer_id;
  std::string status;
};

struct ChargebackOpened {
  std::string payment_ref;
  std::string order_id;
};

// Authentic but of no interest to the engine; acknowledged and logged.
struct Unhandled {
  std::string event_type;
};

using EventBody =
    std::variant<PaymentSucceeded, PaymentFailed, TransferSucceeded, TransferFailed, TransferCanceled, TransferUpdated, ChargebackOpened, Unhandled>;

struct ProcessorEvent {
  std::string event_id;
  std::string event_type;
  EventBody   body;
  // Best effort, for dead-letter rows.
  std::string order_id;
};

/*
  Parses the JSON envelope {event_id, event_type, payload{...}}.

  Throws util::ValidationError when the body is not a valid envelope or
  a known event type lacks its required payload fields. Unknown event
  types decode to Unhandled.
*/
ProcessorEvent DecodeEvent(std::string_view json);

// Envelope fields only, for recording an event that failed to decode.
// Never throws; missing fields come back empty.
ProcessorEvent PeekEnvelope(std::string_view json);

} // namespace settlement::intake
