#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/core/dispute_handler.hpp"
#include "internal/core/payout_processor.hpp"
#include "internal/core/settlement_engine.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/intake/event_dispatcher.hpp"
#include "internal/intake/event_intake.hpp"
#include "internal/intake/failed_event_replayer.hpp"
#include "internal/intake/signature_verifier.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/fixtures.hpp"
#include "tests/support/flaky_repository.hpp"

namespace {

using namespace std::chrono_literals;

using settlement::intake::Disposition;
using settlement::intake::EventIntake;
using settlement::intake::IntakeOptions;
using settlement::intake::SignatureVerifier;
using settlement::testing::FlakyRepository;
using settlement::testing::InsertOrder;
using settlement::testing::Ledger;
using settlement::testing::MakeOrder;
using settlement::testing::ManualClock;

namespace v1 = settlement::engine::core::v1;

constexpr const char* kSecret = "whsec_intake";

std::string PaymentSucceeded(const std::string& event_id, const std::string& order_id, const std::string& payment_ref) {
  return R"({"event_id":")" + event_id + R"(","event_type":"payment.succeeded","payload":{"order_id":")" + order_id + R"(","payment_ref":")" +
         payment_ref + R"("}})";
}

struct Pipeline {
  explicit Pipeline(IntakeOptions options = {}) {
    auto engine   = std::make_shared<settlement::core::SettlementEngine>(repo, settlement::core::AttributionResolver(),
                                                                       settlement::core::SettlementOptions{}, clock.Fn());
    auto payouts  = std::make_shared<settlement::core::PayoutProcessor>(repo, gateway, settlement::core::PayoutOptions{}, clock.Fn());
    auto disputes = std::make_shared<settlement::core::DisputeHandler>(repo, clock.Fn());

    processor  = payouts;
    dispatcher = std::make_shared<settlement::intake::EventDispatcher>(engine, payouts, disputes);
    intake     = std::make_unique<EventIntake>(repo, std::make_shared<SignatureVerifier>(kSecret, 300s, clock.Fn()), dispatcher, options,
                                               clock.Fn(), [this](std::chrono::milliseconds d) {
                                                 sleeps.push_back(d);
                                                 clock.Advance(d);
                                               });
    replayer   = std::make_unique<settlement::intake::FailedEventReplayer>(repo, dispatcher, clock.Fn());
  }

  settlement::intake::IntakeResult Deliver(const std::string& body) {
    return intake->Handle(body, SignatureVerifier::Sign(kSecret, body, clock.NowMs() / 1000));
  }

  std::vector<settlement::db::model::FailedEventRecord> FailedEvents() {
    auto tx = store->Begin();
    return store->ListFailedEvents(*tx, true, 100);
  }

  uint64_t QueuedRetries() {
    auto tx = store->Begin();
    return store->CountRetries(*tx);
  }

  ManualClock                                               clock;
  std::shared_ptr<settlement::db::memory::MemoryRepository> store   = std::make_shared<settlement::db::memory::MemoryRepository>();
  std::shared_ptr<FlakyRepository>                          repo    = std::make_shared<FlakyRepository>(store);
  std::shared_ptr<settlement::testing::FakeTransferGateway> gateway = std::make_shared<settlement::testing::FakeTransferGateway>();
  std::shared_ptr<settlement::core::PayoutProcessor>        processor;
  std::shared_ptr<settlement::intake::EventDispatcher>      dispatcher;
  std::unique_ptr<EventIntake>                              intake;
  std::unique_ptr<settlement::intake::FailedEventReplayer>  replayer;
  std::vector<std::chrono::milliseconds>                    sleeps;
};

void TestPaymentAppliedThenRedeliveryIgnored() {
  Pipeline p;
  InsertOrder(*p.store, MakeOrder("o1", 10000));

  const auto first = p.Deliver(PaymentSucceeded("evt_1", "o1", "pay_1"));
  assert(first.event_id == "evt_1");
  assert(first.disposition == Disposition::kApplied);
  assert(Ledger(*p.store, "o1").size() == 3);

  const auto again = p.Deliver(PaymentSucceeded("evt_1", "o1", "pay_1"));
  assert(again.disposition == Disposition::kIgnored);
  assert(Ledger(*p.store, "o1").size() == 3);
  assert(p.FailedEvents().empty());
}

void TestUnknownEventTypeIsAcknowledged() {
  Pipeline   p;
  const auto result = p.Deliver(R"({"event_id":"evt_9","event_type":"customer.created","payload":{"id":"cus_1"}})");

  assert(result.disposition == Disposition::kIgnored);
  assert(p.FailedEvents().empty());
  assert(p.QueuedRetries() == 0);
}

void TestBadSignatureRecordsNothing() {
  Pipeline p;
  InsertOrder(*p.store, MakeOrder("o1", 10000));
  const auto body = PaymentSucceeded("evt_1", "o1", "pay_1");

  bool rejected = false;
  try {
    p.intake->Handle(body, SignatureVerifier::Sign("wrong-secret", body, p.clock.NowMs() / 1000));
  } catch (const settlement::util::Unauthenticated&) {
    rejected = true;
  }
  assert(rejected);
  assert(Ledger(*p.store, "o1").empty());
  assert(p.FailedEvents().empty());
  assert(p.QueuedRetries() == 0);
}

void TestMissingOrderIsDeadLettered() {
  Pipeline   p;
  const auto body   = PaymentSucceeded("evt_2", "ghost", "pay_2");
  const auto result = p.Deliver(body);

  assert(result.disposition == Disposition::kDeadLettered);
  assert(!result.failed_event_id.empty());
  assert(p.sleeps.empty());

  const auto failed = p.FailedEvents();
  assert(failed.size() == 1);
  assert(failed[0].id == result.failed_event_id);
  assert(failed[0].event_id == "evt_2");
  assert(failed[0].event_type == "payment.succeeded");
  assert(failed[0].order_id == "ghost");
  assert(failed[0].raw_payload == body);
  assert(!failed[0].error_message.empty());
  assert(!failed[0].resolved_at_ms.has_value());
  assert(Ledger(*p.store, "ghost").empty());
}

void TestMalformedBodyIsDeadLettered() {
  Pipeline   p;
  const auto result = p.Deliver(R"({"event_id":"evt_3","event_type":"payment.succeeded","payload":{"order_id":"o1"}})");

  assert(result.disposition == Disposition::kDeadLettered);
  const auto failed = p.FailedEvents();
  assert(failed.size() == 1);
  assert(failed[0].event_id == "evt_3");
  assert(failed[0].event_type == "payment.succeeded");

  const auto garbage = p.Deliver("not json at all");
  assert(garbage.disposition == Disposition::kDeadLettered);
  assert(p.FailedEvents().size() == 2);
}

void TestTransientFailureRecoversInline() {
  Pipeline p;
  InsertOrder(*p.store, MakeOrder("o1", 10000));
  // Exhausts the engine's own attempts once, then one more.
  p.repo->FailOrderLocks(4);

  const auto result = p.Deliver(PaymentSucceeded("evt_1", "o1", "pay_1"));
  assert(result.disposition == Disposition::kApplied);
  assert(p.sleeps.size() == 1);
  assert(p.sleeps[0] == 100ms);
  assert(Ledger(*p.store, "o1").size() == 3);
  assert(p.QueuedRetries() == 0);
}

void TestPersistentTransientFailureIsQueued() {
  Pipeline p;
  InsertOrder(*p.store, MakeOrder("o1", 10000));
  p.repo->FailOrderLocks(1000);

  const auto result = p.Deliver(PaymentSucceeded("evt_1", "o1", "pay_1"));
  assert(result.disposition == Disposition::kQueuedForRetry);
  assert(result.failed_event_id.empty());
  assert(p.sleeps.size() == 2);
  assert(p.sleeps[0] == 100ms);
  assert(p.sleeps[1] == 200ms);
  assert(p.QueuedRetries() == 1);
  assert(p.FailedEvents().empty());
  assert(Ledger(*p.store, "o1").empty());
}

void TestEventDeadlineCutsInlineRetriesShort() {
  IntakeOptions options;
  options.max_inline_attempts = 10;
  options.inline_backoff      = 100ms;
  options.event_deadline      = 250ms;
  Pipeline p(options);
  InsertOrder(*p.store, MakeOrder("o1", 10000));
  p.repo->FailOrderLocks(1000);

  const auto result = p.Deliver(PaymentSucceeded("evt_1", "o1", "pay_1"));
  assert(result.disposition == Disposition::kQueuedForRetry);
  // 100ms, then 200ms would cross the deadline.
  assert(p.sleeps.size() == 1);

  auto tx    = p.store->Begin();
  auto claim = p.store->ClaimNextRetry(*tx, "inspector", p.clock.NowMs() + 60'000, 1000);
  assert(claim.has_value());
  assert(claim->event_id == "evt_1");
  assert(claim->attempts == 0);
  assert(claim->last_error.find("event deadline exceeded") == 0);
}

void TestCaptureFailureAsksForRedelivery() {
  Pipeline p;
  p.repo->FailCaptureWrites(true);

  bool unavailable = false;
  try {
    p.Deliver(PaymentSucceeded("evt_2", "ghost", "pay_2"));
  } catch (const settlement::util::Transient&) {
    unavailable = true;
  }
  assert(unavailable);
  assert(p.FailedEvents().empty());
}

void TestTransferFailureEventReversesWithdrawal() {
  Pipeline p;
  settlement::testing::SeedAvailable(*p.store, "alice", 5000);
  p.gateway->Then(settlement::transfer::TransferOutcome::kUnknown);

  const auto withdrawal = p.processor->Withdraw("alice", 3000);
  assert(withdrawal.status == settlement::core::PayoutStatus::kPending);
  assert(settlement::testing::Balance(*p.store, "alice").available_minor == 2000);

  const auto body = R"({"event_id":"evt_t","event_type":"transfer.failed","payload":{"withdrawal_id":")" + withdrawal.withdrawal_id +
                    R"(","failure_message":"account closed"}})";
  assert(p.Deliver(body).disposition == Disposition::kApplied);
  assert(settlement::testing::Balance(*p.store, "alice").available_minor == 5000);
  assert(p.Deliver(body).disposition == Disposition::kIgnored);
}

void TestReplayResolvesDeadLetter() {
  Pipeline   p;
  const auto result = p.Deliver(PaymentSucceeded("evt_2", "o2", "pay_2"));
  assert(result.disposition == Disposition::kDeadLettered);

  const auto still_missing = p.replayer->Replay(result.failed_event_id);
  assert(!still_missing.resolved);
  assert(!still_missing.error_message.empty());
  assert(p.FailedEvents()[0].replay_attempts == 1);

  InsertOrder(*p.store, MakeOrder("o2", 10000, "ref"));
  const auto replayed = p.replayer->Replay(result.failed_event_id);
  assert(replayed.resolved);
  assert(!replayed.already_resolved);
  assert(Ledger(*p.store, "o2").size() == 4);
  assert(p.FailedEvents()[0].resolved_at_ms == p.clock.NowMs());

  const auto again = p.replayer->Replay(result.failed_event_id);
  assert(again.resolved && again.already_resolved);
  assert(Ledger(*p.store, "o2").size() == 4);

  bool not_found = false;
  try {
    p.replayer->Replay("no-such-id");
  } catch (const settlement::util::NotFound&) {
    not_found = true;
  }
  assert(not_found);
}

void TestReplayUnresolvedBatch() {
  Pipeline p;
  p.Deliver(PaymentSucceeded("evt_a", "a", "pay_a"));
  p.Deliver(PaymentSucceeded("evt_b", "b", "pay_b"));
  InsertOrder(*p.store, MakeOrder("a", 5000));

  const auto batch = p.replayer->ReplayUnresolved(10);
  assert(batch.attempted == 2);
  assert(batch.resolved == 1);
  assert(batch.failed == 1);

  InsertOrder(*p.store, MakeOrder("b", 5000));
  const auto second = p.replayer->ReplayUnresolved(10);
  assert(second.attempted == 1);
  assert(second.resolved == 1);
  assert(p.replayer->ReplayUnresolved(10).attempted == 0);
}

} // namespace

int main() {
  TestPaymentAppliedThenRedeliveryIgnored();
  TestUnknownEventTypeIsAcknowledged();
  TestBadSignatureRecordsNothing();
  TestMissingOrderIsDeadLettered();
  TestMalformedBodyIsDeadLettered();
  TestTransientFailureRecoversInline();
  TestPersistentTransientFailureIsQueued();
  TestEventDeadlineCutsInlineRetriesShort();
  TestCaptureFailureAsksForRedelivery();
  TestTransferFailureEventReversesWithdrawal();
  TestReplayResolvesDeadLetter();
  TestReplayUnresolvedBatch();

  std::cout << "settlement_unit_event_intake: pass\n";
  return 0;
}
