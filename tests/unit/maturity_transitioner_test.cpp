#include <cassert>
#include <iostream>
#include <memory>

#include "internal/core/dispute_handler.hpp"
#include "internal/core/maturity_transitioner.hpp"
#include "internal/core/settlement_engine.hpp"
#include "internal/db/memory/memory_repository.hpp"
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
  MaturityTransitioner              maturity{repo, clock.Fn()};
};

void TestNothingMaturesBeforeHoldEnds() {
  Fixture f;
  settlement::testing::InsertOrder(*f.repo, MakeOrder("o1", 10000, "ref", "fac"));
  f.engine.Settle("o1", "pay_1");

  f.clock.Advance(std::chrono::milliseconds(7 * kDayMs - 1));
  assert(f.maturity.Sweep() == 0);

  const auto balance = Balance(*f.repo, "fulfiller-o1");
  assert(balance.available_minor == 0);
  assert(balance.held_minor == 6000);
  assert(balance.lifetime_total_minor == 6000);
}

void TestHeldEntriesPromotedOnceAtAvailableAt() {
  Fixture f;
  settlement::testing::InsertOrder(*f.repo, MakeOrder("o1", 10000, "ref", "fac"));
  f.engine.Settle("o1", "pay_1");

  f.clock.Advance(std::chrono::milliseconds(7 * kDayMs));
  assert(f.maturity.Sweep() == 3);
  assert(f.maturity.Sweep() == 0);

  for (const auto& entry : Ledger(*f.repo, "o1")) {
    assert(entry.state == v1::ENTRY_STATE_AVAILABLE);
  }

  const auto fulfiller = Balance(*f.repo, "fulfiller-o1");
  assert(fulfiller.available_minor == 6000);
  assert(fulfiller.held_minor == 0);
  assert(Balance(*f.repo, "ref").available_minor == 1000);
  assert(Balance(*f.repo, "fac").available_minor == 2000);
}

void TestOnlyDueOrdersArePromoted() {
  Fixture f;
  auto    early = MakeOrder("early", 10000);
  auto    late  = MakeOrder("late", 10000);
  late.fulfillment_end_ms += 2 * kDayMs;
  settlement::testing::InsertOrder(*f.repo, early);
  settlement::testing::InsertOrder(*f.repo, late);
  f.engine.Settle("early", "pay_early");
  f.engine.Settle("late", "pay_late");

  f.clock.Advance(std::chrono::milliseconds(8 * kDayMs));
  assert(f.maturity.Sweep() == 1);
  assert(Balance(*f.repo, "fulfiller-early").available_minor == 9000);
  assert(Balance(*f.repo, "fulfiller-late").held_minor == 9000);

  f.clock.Advance(std::chrono::milliseconds(kDayMs));
  assert(f.maturity.Sweep() == 1);
  assert(Balance(*f.repo, "fulfiller-late").available_minor == 9000);
}

void TestDisputedEntriesNeverMature() {
  Fixture        f;
  DisputeHandler disputes(f.repo, f.clock.Fn());
  settlement::testing::InsertOrder(*f.repo, MakeOrder("o1", 10000));
  f.engine.Settle("o1", "pay_1");

  assert(disputes.OpenDispute("pay_1", "") == 3);

  f.clock.Advance(std::chrono::milliseconds(30 * kDayMs));
  assert(f.maturity.Sweep() == 0);
  const auto balance = Balance(*f.repo, "fulfiller-o1");
  assert(balance.available_minor == 0);
  assert(balance.disputed_minor == 9000);
}

} // namespace

int main() {
  TestNothingMaturesBeforeHoldEnds();
  TestHeldEntriesPromotedOnceAtAvailableAt();
  TestOnlyDueOrdersArePromoted();
  TestDisputedEntriesNeverMature();

  std::cout << "settlement_unit_maturity_transitioner: pass\n";
  return 0;
}
