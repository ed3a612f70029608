#include <cassert>
#include <iostream>
#include <memory>

#include "internal/core/dispute_handler.hpp"
#include "internal/core/maturity_transitioner.hpp"
#include "internal/core/settlement_engine.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/fixtures.hpp"

namespace {

using settlement::core::AttributionResolver;
using settlement::core::DisputeHandler;
using settlement::core::MaturityTransitioner;
using settlement::core::SettlementEngine;
using settlement::core::SettlementOptions;
using settlement::db::memory::MemoryRepository;
using settlement::testing::Balance;
using settlement::testing::kDayMs;
using settlement::testing::Ledger;
using settlement::testing::MakeOrder;
using settlement::testing::ManualClock;

namespace v1 = settlement::engine::core::v1;

struct Fixture {
  std::shared_ptr<MemoryRepository> repo = std::make_shared<MemoryRepository>();
  ManualClock                       clock;
  SettlementEngine                  engine{repo, AttributionResolver(), SettlementOptions{}, clock.Fn()};
  DisputeHandler                    disputes{repo, clock.Fn()};
};

void TestChargebackDisputesEveryOpenEntry() {
  Fixture f;
  settlement::testing::InsertOrder(*f.repo, MakeOrder("o1", 10000, "ref", "fac"));
  f.engine.Settle("o1", "pay_1");

  assert(f.disputes.OpenDispute("pay_1", "") == 5);
  for (const auto& entry : Ledger(*f.repo, "o1")) {
    assert(entry.state == v1::ENTRY_STATE_DISPUTED);
  }

  const auto balance = Balance(*f.repo, "ref");
  assert(balance.held_minor == 0);
  assert(balance.disputed_minor == 1000);
  assert(balance.lifetime_total_minor == 1000);
}

void TestRedeliveredChargebackIsNoOp() {
  Fixture f;
  settlement::testing::InsertOrder(*f.repo, MakeOrder("o1", 10000));
  f.engine.Settle("o1", "pay_1");

  assert(f.disputes.OpenDispute("pay_1", "") == 3);
  assert(f.disputes.OpenDispute("pay_1", "") == 0);
}

void TestChargebackFallsBackToOrderId() {
  Fixture f;
  settlement::testing::InsertOrder(*f.repo, MakeOrder("o1", 10000));
  f.engine.Settle("o1", "pay_1");

  assert(f.disputes.OpenDispute("unknown_ref", "o1") == 3);
}

void TestMaturedEntriesAreAlsoDisputed() {
  Fixture              f;
  MaturityTransitioner maturity(f.repo, f.clock.Fn());
  settlement::testing::InsertOrder(*f.repo, MakeOrder("o1", 10000));
  f.engine.Settle("o1", "pay_1");

  f.clock.Advance(std::chrono::milliseconds(7 * kDayMs));
  assert(maturity.Sweep() == 1);
  assert(Balance(*f.repo, "fulfiller-o1").available_minor == 9000);

  f.disputes.OpenDispute("pay_1", "");
  const auto balance = Balance(*f.repo, "fulfiller-o1");
  assert(balance.available_minor == 0);
  assert(balance.disputed_minor == 9000);
}

void TestUnknownOrderIsNotFound() {
  Fixture f;

  bool threw = false;
  try {
    f.disputes.OpenDispute("nope", "missing");
  } catch (const settlement::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestMissingReferenceIsValidationError() {
  Fixture f;

  bool threw = false;
  try {
    f.disputes.OpenDispute("", "");
  } catch (const settlement::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestChargebackDisputesEveryOpenEntry();
  TestRedeliveredChargebackIsNoOp();
  TestChargebackFallsBackToOrderId();
  TestMaturedEntriesAreAlsoDisputed();
  TestUnknownOrderIsNotFound();
  TestMissingReferenceIsValidationError();

  std::cout << "settlement_unit_dispute_handler: pass\n";
  return 0;
}
