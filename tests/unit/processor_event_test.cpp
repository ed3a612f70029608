#include <cassert>
#include <iostream>
#include <string>
#include <variant>

#include "internal/intake/processor_event.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace settlement::intake;

bool Malformed(const std::string& json) {
  try {
    DecodeEvent(json);
  } catch (const settlement::util::ValidationError& e) {
    return e.reason() == "malformed_event";
  }
  return false;
}

void TestPaymentSucceeded() {
  const auto event = DecodeEvent(R"({"event_id":"evt_1","event_type":"payment.succeeded","payload":{"order_id":"o1","payment_ref":"pay_1","amount":10000}})");

  assert(event.event_id == "evt_1");
  assert(event.event_type == "payment.succeeded");
  assert(event.order_id == "o1");
  const auto& body = std::get<PaymentSucceeded>(event.body);
  assert(body.order_id == "o1");
  assert(body.payment_ref == "pay_1");
}

void TestPaymentFailed() {
  const auto event = DecodeEvent(R"({"event_id":"evt_2","event_type":"payment.failed","payload":{"order_id":"o1","failure_message":"card declined"}})");

  const auto& body = std::get<PaymentFailed>(event.body);
  assert(body.order_id == "o1");
  assert(body.payment_ref.empty());
  assert(body.failure_message == "card declined");
}

void TestTransferEvents() {
  const auto succeeded = DecodeEvent(R"({"event_id":"e","event_type":"transfer.succeeded","payload":{"transfer_id":"tr_1"}})");
  assert(std::get<TransferSucceeded>(succeeded.body).transfer_id == "tr_1");
  assert(std::get<TransferSucceeded>(succeeded.body).withdrawal_id.empty());

  const auto failed = DecodeEvent(R"({"event_id":"e","event_type":"transfer.failed","payload":{"withdrawal_id":"w1","failure_message":"closed"}})");
  assert(std::get<TransferFailed>(failed.body).withdrawal_id == "w1");
  assert(std::get<TransferFailed>(failed.body).failure_message == "closed");

  const auto canceled = DecodeEvent(R"({"event_id":"e","event_type":"transfer.canceled","payload":{"withdrawal_id":"w1"}})");
  assert(std::holds_alternative<TransferCanceled>(canceled.body));

  const auto updated = DecodeEvent(R"({"event_id":"e","event_type":"transfer.updated","payload":{"transfer_id":"tr_1","status":"in_transit"}})");
  assert(std::get<TransferUpdated>(updated.body).status == "in_transit");
}

void TestChargebackOpened() {
  const auto event = DecodeEvent(R"({"event_id":"e","event_type":"chargeback.opened","payload":{"payment_ref":"pay_1"}})");
  assert(std::get<ChargebackOpened>(event.body).payment_ref == "pay_1");
}

void TestUnknownTypeIsUnhandled() {
  const auto event = DecodeEvent(R"({"event_id":"e","event_type":"customer.created","payload":{}})");
  assert(std::get<Unhandled>(event.body).event_type == "customer.created");
}

void TestUnknownEnvelopeFieldsIgnored() {
  const auto event = DecodeEvent(R"({"event_id":"e","event_type":"customer.created","created":1700000000,"livemode":false})");
  assert(std::holds_alternative<Unhandled>(event.body));
}

void TestMalformedEvents() {
  assert(Malformed("not json"));
  assert(Malformed("{}"));
  assert(Malformed(R"({"event_type":"payment.succeeded","payload":{"order_id":"o1","payment_ref":"p"}})"));
  assert(Malformed(R"({"event_id":"e","event_type":"payment.succeeded","payload":{"order_id":"o1"}})"));
  assert(Malformed(R"({"event_id":"e","event_type":"payment.succeeded","payload":{"order_id":42,"payment_ref":"p"}})"));
  assert(Malformed(R"({"event_id":"e","event_type":"transfer.failed","payload":{}})"));
  assert(Malformed(R"({"event_id":"e","event_type":"transfer.updated","payload":{"transfer_id":"tr"}})"));
  assert(Malformed(R"({"event_id":"e","event_type":"chargeback.opened","payload":{}})"));
}

void TestPeekEnvelopeNeverThrows() {
  const auto garbage = PeekEnvelope("not json");
  assert(garbage.event_id.empty());
  assert(garbage.event_type.empty());

  const auto partial = PeekEnvelope(R"({"event_id":"evt_9","event_type":"payment.succeeded","payload":{"order_id":"o9"}})");
  assert(partial.event_id == "evt_9");
  assert(partial.event_type == "payment.succeeded");
  assert(partial.order_id == "o9");
}

} // namespace

int main() {
  TestPaymentSucceeded();
  TestPaymentFailed();
  TestTransferEvents();
  TestChargebackOpened();
  TestUnknownTypeIsUnhandled();
  TestUnknownEnvelopeFieldsIgnored();
  TestMalformedEvents();
  TestPeekEnvelopeNeverThrows();

  std::cout << "settlement_unit_processor_event: pass\n";
  return 0;
}
