#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "internal/core/settlement_engine.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/fixtures.hpp"

namespace {

using settlement::core::AttributionResolver;
using settlement::core::SettlementEngine;
using settlement::core::SettlementOptions;
using settlement::core::SettlementOutcome;
using settlement::db::memory::MemoryRepository;
using settlement::testing::kDayMs;
using settlement::testing::kEpochMs;
using settlement::testing::Ledger;
using settlement::testing::MakeOrder;
using settlement::testing::ManualClock;

namespace v1 = settlement::engine::core::v1;

struct Fixture {
  std::shared_ptr<MemoryRepository> repo = std::make_shared<MemoryRepository>();
  ManualClock                       clock;
  SettlementEngine                  engine{repo, AttributionResolver(), SettlementOptions{}, clock.Fn()};
};

const settlement::db::model::LedgerEntryRecord* FindKind(const std::vector<settlement::db::model::LedgerEntryRecord>& entries, v1::EntryKind kind) {
  for (const auto& entry : entries) {
    if (entry.kind == kind) return &entry;
  }
  return nullptr;
}

int64_t Sum(const std::vector<settlement::db::model::LedgerEntryRecord>& entries) {
  int64_t sum = 0;
  for (const auto& entry : entries) sum += entry.amount_minor;
  return sum;
}

void TestSettleWritesFulfillerAndPlatformFee() {
  Fixture f;
  settlement::testing::InsertOrder(*f.repo, MakeOrder("o1", 10000));

  const auto result = f.engine.Settle("o1", "pay_1");
  assert(result.outcome == SettlementOutcome::kSettled);
  assert(result.entries_written == 3);

  const auto entries = Ledger(*f.repo, "o1");
  assert(entries.size() == 3);
  assert(Sum(entries) == 0);

  const auto* payment = FindKind(entries, v1::ENTRY_KIND_PAYMENT);
  assert(payment && payment->amount_minor == -10000);
  assert(payment->state == v1::ENTRY_STATE_AVAILABLE);
  assert(payment->beneficiary_id == "payer-o1");
  assert(payment->available_at_ms == f.clock.NowMs());

  const auto* fulfiller = FindKind(entries, v1::ENTRY_KIND_FULFILLER_PAYOUT);
  assert(fulfiller && fulfiller->amount_minor == 9000);
  assert(fulfiller->state == v1::ENTRY_STATE_HELD);
  assert(fulfiller->available_at_ms == kEpochMs + 7 * kDayMs);
  assert(fulfiller->description == "Payout for Deep tissue massage");
  assert(fulfiller->context.service_name == "Deep tissue massage");

  const auto* fee = FindKind(entries, v1::ENTRY_KIND_PLATFORM_FEE);
  assert(fee && fee->amount_minor == 1000);
  assert(fee->state == v1::ENTRY_STATE_AVAILABLE);
  assert(!fee->beneficiary_id.has_value());

  const auto order = settlement::testing::Order(*f.repo, "o1");
  assert(order->status == v1::ORDER_STATUS_PAID);
  assert(order->payment_ref == "pay_1");
  assert(order->paid_at_ms == f.clock.NowMs());
}

void TestSettleSplitsForEveryRoleCombination() {
  struct Case {
    std::optional<std::string> referrer;
    std::optional<std::string> facilitator;
    int64_t                    fulfiller;
    int64_t                    referral;
    int64_t                    facilitation;
    size_t                     entries;
  };
  const std::vector<Case> cases = {
      {std::nullopt, std::nullopt, 9000, 0, 0, 3},
      {"ref", std::nullopt, 8000, 1000, 0, 4},
      {std::nullopt, "fac", 7000, 0, 2000, 4},
      {"ref", "fac", 6000, 1000, 2000, 5},
  };

  int n = 0;
  for (const auto& c : cases) {
    Fixture           f;
    const std::string id = "o" + std::to_string(++n);
    settlement::testing::InsertOrder(*f.repo, MakeOrder(id, 10000, c.referrer, c.facilitator));
    f.engine.Settle(id, "pay_" + id);

    const auto entries = Ledger(*f.repo, id);
    assert(entries.size() == c.entries);
    assert(Sum(entries) == 0);
    assert(FindKind(entries, v1::ENTRY_KIND_FULFILLER_PAYOUT)->amount_minor == c.fulfiller);
    assert(FindKind(entries, v1::ENTRY_KIND_PLATFORM_FEE)->amount_minor == 1000);

    const auto* referral = FindKind(entries, v1::ENTRY_KIND_REFERRAL_COMMISSION);
    assert(c.referral == 0 ? referral == nullptr : referral->amount_minor == c.referral);
    const auto* facilitation = FindKind(entries, v1::ENTRY_KIND_FACILITATOR_COMMISSION);
    assert(c.facilitation == 0 ? facilitation == nullptr : facilitation->amount_minor == c.facilitation);
    if (facilitation) {
      assert(facilitation->state == v1::ENTRY_STATE_HELD);
    }
  }
}

void TestRedeliveryIsNoOp() {
  Fixture f;
  settlement::testing::InsertOrder(*f.repo, MakeOrder("o1", 10000, "ref", "fac"));

  assert(f.engine.Settle("o1", "pay_1").outcome == SettlementOutcome::kSettled);
  const auto second = f.engine.Settle("o1", "pay_1");
  assert(second.outcome == SettlementOutcome::kAlreadySettled);
  assert(second.entries_written == 0);
  assert(Ledger(*f.repo, "o1").size() == 5);
}

void TestDifferentPaymentRefForPaidOrderIsRejected() {
  Fixture f;
  settlement::testing::InsertOrder(*f.repo, MakeOrder("o1", 10000));
  f.engine.Settle("o1", "pay_1");

  bool threw = false;
  try {
    f.engine.Settle("o1", "pay_2");
  } catch (const settlement::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(Ledger(*f.repo, "o1").size() == 3);
}

void TestPaymentRefAlreadyUsedByAnotherOrderIsRejected() {
  Fixture f;
  settlement::testing::InsertOrder(*f.repo, MakeOrder("o1", 10000));
  settlement::testing::InsertOrder(*f.repo, MakeOrder("o2", 5000));
  f.engine.Settle("o1", "pay_1");

  bool threw = false;
  try {
    f.engine.Settle("o2", "pay_1");
  } catch (const settlement::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(Ledger(*f.repo, "o2").empty());
  assert(settlement::testing::Order(*f.repo, "o2")->status == v1::ORDER_STATUS_UNPAID);
}

void TestMissingOrderWritesNothing() {
  Fixture f;

  bool threw = false;
  try {
    f.engine.Settle("missing", "pay_1");
  } catch (const settlement::util::NotFound&) {
    threw = true;
  }
  assert(threw);
  assert(Ledger(*f.repo, "missing").empty());
}

void TestMissingPaymentRefIsValidationError() {
  Fixture f;
  settlement::testing::InsertOrder(*f.repo, MakeOrder("o1", 10000));

  bool threw = false;
  try {
    f.engine.Settle("o1", "");
  } catch (const settlement::util::ValidationError& e) {
    threw = e.reason() == "missing_payment_ref";
  }
  assert(threw);
}

void TestPaidOrderWithIncompleteLedgerIsInvalidState() {
  Fixture f;
  auto    order   = MakeOrder("o1", 10000);
  order.status      = v1::ORDER_STATUS_PAID;
  order.payment_ref = "pay_1";
  settlement::testing::InsertOrder(*f.repo, order);

  bool threw = false;
  try {
    f.engine.Settle("o1", "pay_1");
  } catch (const settlement::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestPaymentFailedThenSucceeded() {
  Fixture f;
  settlement::testing::InsertOrder(*f.repo, MakeOrder("o1", 10000));

  assert(f.engine.MarkPaymentFailed("o1", "pay_1"));
  assert(!f.engine.MarkPaymentFailed("o1", "pay_1"));
  assert(settlement::testing::Order(*f.repo, "o1")->status == v1::ORDER_STATUS_PAYMENT_FAILED);

  assert(f.engine.Settle("o1", "pay_2").outcome == SettlementOutcome::kSettled);
  assert(settlement::testing::Order(*f.repo, "o1")->status == v1::ORDER_STATUS_PAID);
  assert(!f.engine.MarkPaymentFailed("o1", "pay_2"));
}

void TestHoldPeriodComesFromOptions() {
  auto        repo = std::make_shared<MemoryRepository>();
  ManualClock clock;
  SettlementOptions options;
  options.hold_period = std::chrono::hours(24);
  SettlementEngine engine(repo, AttributionResolver(), options, clock.Fn());

  auto order               = MakeOrder("o1", 10000);
  order.fulfillment_end_ms = kEpochMs + 3 * kDayMs;
  settlement::testing::InsertOrder(*repo, order);
  engine.Settle("o1", "pay_1");

  const auto entries = Ledger(*repo, "o1");
  assert(FindKind(entries, v1::ENTRY_KIND_FULFILLER_PAYOUT)->available_at_ms == kEpochMs + 4 * kDayMs);
}

void TestConcurrentSettlementWritesOneSet() {
  Fixture f;
  settlement::testing::InsertOrder(*f.repo, MakeOrder("o1", 10000, "ref", "fac"));

  std::atomic<int>         settled{0};
  std::atomic<int>         already{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 2; ++i) {
    threads.emplace_back([&] {
      const auto result = f.engine.Settle("o1", "pay_1");
      if (result.outcome == SettlementOutcome::kSettled) {
        ++settled;
      } else {
        ++already;
      }
    });
  }
  for (auto& t : threads) t.join();

  assert(settled == 1);
  assert(already == 1);
  const auto entries = Ledger(*f.repo, "o1");
  assert(entries.size() == 5);
  assert(Sum(entries) == 0);
}

} // namespace

int main() {
  TestSettleWritesFulfillerAndPlatformFee();
  TestSettleSplitsForEveryRoleCombination();
  TestRedeliveryIsNoOp();
  TestDifferentPaymentRefForPaidOrderIsRejected();
  TestPaymentRefAlreadyUsedByAnotherOrderIsRejected();
  TestMissingOrderWritesNothing();
  TestMissingPaymentRefIsValidationError();
  TestPaidOrderWithIncompleteLedgerIsInvalidState();
  TestPaymentFailedThenSucceeded();
  TestHoldPeriodComesFromOptions();
  TestConcurrentSettlementWritesOneSet();

  std::cout << "settlement_unit_settlement_engine: pass\n";
  return 0;
}
