#include "ledger_mapping.hpp"

namespace settlement::core {

namespace v1 = settlement::engine::core::v1;

namespace {

std::optional<std::string> OptionalId(const std::string& value) {
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

} // namespace

v1::OrderContext ToProto(const db::model::ContextSnapshot& context) {
  v1::OrderContext out;
  out.set_service_name(context.service_name);
  out.set_subject(context.subject);
  out.set_payer_name(context.payer_name);
  out.set_fulfiller_name(context.fulfiller_name);
  out.set_facilitator_name(context.facilitator_name);
  return out;
}

db::model::ContextSnapshot FromProto(const v1::OrderContext& context) {
  db::model::ContextSnapshot out;
  out.service_name     = context.service_name();
  out.subject          = context.subject();
  out.payer_name       = context.payer_name();
  out.fulfiller_name   = context.fulfiller_name();
  out.facilitator_name = context.facilitator_name();
  return out;
}

v1::Order ToProto(const db::model::OrderRecord& record) {
  v1::Order out;
  out.set_id(record.id);
  out.set_payer_id(record.payer_id);
  out.set_fulfiller_id(record.fulfiller_id);
  out.set_referrer_id(record.referrer_id.value_or(""));
  out.set_facilitator_id(record.facilitator_id.value_or(""));
  out.set_gross_minor(record.gross_minor);
  out.set_payment_ref(record.payment_ref);
  out.set_fulfillment_end_unix_ms(record.fulfillment_end_ms);
  out.set_status(record.status);
  out.set_paid_at_unix_ms(record.paid_at_ms);
  *out.mutable_context() = ToProto(record.context);
  return out;
}

db::model::OrderRecord FromProto(const v1::Order& order) {
  db::model::OrderRecord out;
  out.id                 = order.id();
  out.payer_id           = order.payer_id();
  out.fulfiller_id       = order.fulfiller_id();
  out.referrer_id        = OptionalId(order.referrer_id());
  out.facilitator_id     = OptionalId(order.facilitator_id());
  out.gross_minor        = order.gross_minor();
  out.payment_ref        = order.payment_ref();
  out.fulfillment_end_ms = order.fulfillment_end_unix_ms();
  out.status             = order.status() == v1::ORDER_STATUS_UNSPECIFIED ? v1::ORDER_STATUS_UNPAID : order.status();
  out.paid_at_ms         = order.paid_at_unix_ms();
  out.context            = FromProto(order.context());
  return out;
}

v1::LedgerEntry ToProto(const db::model::LedgerEntryRecord& record) {
  v1::LedgerEntry out;
  out.set_id(record.id);
  out.set_order_id(record.order_id);
  out.set_beneficiary_id(record.beneficiary_id.value_or(""));
  out.set_kind(record.kind);
  out.set_amount_minor(record.amount_minor);
  out.set_state(record.state);
  out.set_available_at_unix_ms(record.available_at_ms.value_or(0));
  out.set_external_payout_ref(record.external_payout_ref);
  out.set_reverses_entry_id(record.reverses_entry_id);
  out.set_description(record.description);
  *out.mutable_context() = ToProto(record.context);
  out.set_created_at_unix_ms(record.created_at_ms);
  return out;
}

v1::FailedEvent ToProto(const db::model::FailedEventRecord& record) {
  v1::FailedEvent out;
  out.set_id(record.id);
  out.set_event_id(record.event_id);
  out.set_event_type(record.event_type);
  out.set_raw_payload(record.raw_payload);
  out.set_error_message(record.error_message);
  out.set_order_id(record.order_id);
  out.set_created_at_unix_ms(record.created_at_ms);
  out.set_resolved_at_unix_ms(record.resolved_at_ms.value_or(0));
  out.set_replay_attempts(record.replay_attempts);
  return out;
}

v1::Balance ToProto(const std::string& beneficiary_id, const db::model::BalanceRecord& record) {
  v1::Balance out;
  out.set_beneficiary_id(beneficiary_id);
  out.set_available_minor(record.available_minor);
  out.set_held_minor(record.held_minor);
  out.set_disputed_minor(record.disputed_minor);
  out.set_lifetime_total_minor(record.lifetime_total_minor);
  return out;
}

} // namespace settlement::core
