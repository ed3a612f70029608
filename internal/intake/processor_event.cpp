#include "processor_event.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"
#include "settlement/engine/events/v1/envelope.pb.h"

namespace settlement::intake {

namespace ev1 = settlement::engine::events::v1;

namespace {

constexpr std::string_view kPaymentSucceeded  = "payment.succeeded";
constexpr std::string_view kPaymentFailed     = "payment.failed";
constexpr std::string_view kTransferSucceeded = "transfer.succeeded";
constexpr std::string_view kTransferFailed    = "transfer.failed";
constexpr std::string_view kTransferCanceled  = "transfer.canceled";
constexpr std::string_view kTransferUpdated   = "transfer.updated";
constexpr std::string_view kChargebackOpened  = "chargeback.opened";

bool ParseEnvelope(std::string_view json, ev1::ProcessorEventEnvelope* envelope, std::string* error) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  const auto status = google::protobuf::util::JsonStringToMessage(std::string(json), envelope, options);
  if (!status.ok()) {
    *error = std::string(status.message());
    return false;
  }
  return true;
}

std::string Field(const google::protobuf::Struct& payload, const std::string& key) {
  const auto it = payload.fields().find(key);
  if (it == payload.fields().end() || it->second.kind_case() != google::protobuf::Value::kStringValue) {
    return {};
  }
  return it->second.string_value();
}

std::string RequireField(const google::protobuf::Struct& payload, const std::string& key, std::string_view event_type) {
  auto value = Field(payload, key);
  if (value.empty()) {
    throw util::ValidationError("malformed_event", std::string(event_type) + " payload missing '" + key + "'");
  }
  return value;
}

void RequireTransferRef(const std::string& withdrawal_id, const std::string& transfer_id, std::string_view event_type) {
  if (withdrawal_id.empty() && transfer_id.empty()) {
    throw util::ValidationError("malformed_event", std::string(event_type) + " payload needs 'withdrawal_id' or 'transfer_id'");
  }
}

} // namespace

ProcessorEvent DecodeEvent(std::string_view json) {
  ev1::ProcessorEventEnvelope envelope;
  std::string                 error;
  if (!ParseEnvelope(json, &envelope, &error)) {
    throw util::ValidationError("malformed_event", "invalid event envelope: " + error);
  }
  if (envelope.event_id().empty() || envelope.event_type().empty()) {
    throw util::ValidationError("malformed_event", "event envelope requires event_id and event_type");
  }

  const auto& payload = envelope.payload();
  const auto& type    = envelope.event_type();

  ProcessorEvent event;
  event.event_id   = envelope.event_id();
  event.event_type = type;
  event.order_id   = Field(payload, "order_id");

  if (type == kPaymentSucceeded) {
    event.body = PaymentSucceeded{RequireField(payload, "order_id", type), RequireField(payload, "payment_ref", type)};
  } else if (type == kPaymentFailed) {
    event.body = PaymentFailed{RequireField(payload, "order_id", type), Field(payload, "payment_ref"), Field(payload, "failure_message")};
  } else if (type == kTransferSucceeded) {
    TransferSucceeded body{Field(payload, "withdrawal_id"), Field(payload, "transfer_id")};
    RequireTransferRef(body.withdrawal_id, body.transfer_id, type);
    event.body = std::move(body);
  } else if (type == kTransferFailed) {
    TransferFailed body{Field(payload, "withdrawal_id"), Field(payload, "transfer_id"), Field(payload, "failure_message")};
    RequireTransferRef(body.withdrawal_id, body.transfer_id, type);
    event.body = std::move(body);
  } else if (type == kTransferCanceled) {
    TransferCanceled body{Field(payload, "withdrawal_id"), Field(payload, "transfer_id")};
    RequireTransferRef(body.withdrawal_id, body.transfer_id, type);
    event.body = std::move(body);
  } else if (type == kTransferUpdated) {
    TransferUpdated body{Field(payload, "withdrawal_id"), Field(payload, "transfer_id"), RequireField(payload, "status", type)};
    RequireTransferRef(body.withdrawal_id, body.transfer_id, type);
    event.body = std::move(body);
  } else if (type == kChargebackOpened) {
    ChargebackOpened body{Field(payload, "payment_ref"), Field(payload, "order_id")};
    if (body.payment_ref.empty() && body.order_id.empty()) {
      throw util::ValidationError("malformed_event", "chargeback.opened payload needs 'payment_ref' or 'order_id'");
    }
    event.body = std::move(body);
  } else {
    event.body = Unhandled{type};
  }
  return event;
}

ProcessorEvent PeekEnvelope(std::string_view json) {
  ProcessorEvent              event;
  ev1::ProcessorEventEnvelope envelope;
  std::string                 error;
  if (ParseEnvelope(json, &envelope, &error)) {
    event.event_id   = envelope.event_id();
    event.event_type = envelope.event_type();
    event.order_id   = Field(envelope.payload(), "order_id");
  }
  event.body = Unhandled{event.event_type};
  return event;
}

} // namespace settlement::intake
