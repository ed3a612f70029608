#include <cassert>
#include <iostream>

#include "internal/model/entry_state_machine.hpp"

namespace {

using namespace settlement::model;

void TestAllowedTransitions() {
  static_assert(CanTransition(v1::ENTRY_STATE_HELD, v1::ENTRY_STATE_AVAILABLE));
  static_assert(CanTransition(v1::ENTRY_STATE_HELD, v1::ENTRY_STATE_DISPUTED));
  static_assert(CanTransition(v1::ENTRY_STATE_AVAILABLE, v1::ENTRY_STATE_PAID_OUT));
  static_assert(CanTransition(v1::ENTRY_STATE_AVAILABLE, v1::ENTRY_STATE_DISPUTED));
  static_assert(CanTransition(v1::ENTRY_STATE_AVAILABLE, v1::ENTRY_STATE_PENDING_CONFIRMATION));
  static_assert(CanTransition(v1::ENTRY_STATE_AVAILABLE, v1::ENTRY_STATE_FAILED));
  static_assert(CanTransition(v1::ENTRY_STATE_PENDING_CONFIRMATION, v1::ENTRY_STATE_PAID_OUT));
  static_assert(CanTransition(v1::ENTRY_STATE_PENDING_CONFIRMATION, v1::ENTRY_STATE_FAILED));
  static_assert(CanTransition(v1::ENTRY_STATE_PAID_OUT, v1::ENTRY_STATE_REVERSED));
}

void TestForbiddenTransitions() {
  assert(!CanTransition(v1::ENTRY_STATE_AVAILABLE, v1::ENTRY_STATE_HELD));
  assert(!CanTransition(v1::ENTRY_STATE_HELD, v1::ENTRY_STATE_PAID_OUT));
  assert(!CanTransition(v1::ENTRY_STATE_DISPUTED, v1::ENTRY_STATE_AVAILABLE));
  assert(!CanTransition(v1::ENTRY_STATE_PAID_OUT, v1::ENTRY_STATE_AVAILABLE));
  assert(!CanTransition(v1::ENTRY_STATE_PAID_OUT, v1::ENTRY_STATE_DISPUTED));
  assert(!CanTransition(v1::ENTRY_STATE_REVERSED, v1::ENTRY_STATE_AVAILABLE));
  assert(!CanTransition(v1::ENTRY_STATE_FAILED, v1::ENTRY_STATE_PAID_OUT));
  assert(!CanTransition(v1::ENTRY_STATE_HELD, v1::ENTRY_STATE_UNSPECIFIED));
}

void TestSameStateIsNoOp() {
  assert(CanTransition(v1::ENTRY_STATE_DISPUTED, v1::ENTRY_STATE_DISPUTED));
  assert(CanTransition(v1::ENTRY_STATE_FAILED, v1::ENTRY_STATE_FAILED));
}

void TestAvailableBalanceMembership() {
  assert(CountsTowardAvailable(v1::ENTRY_KIND_FULFILLER_PAYOUT, v1::ENTRY_STATE_AVAILABLE));
  assert(!CountsTowardAvailable(v1::ENTRY_KIND_FULFILLER_PAYOUT, v1::ENTRY_STATE_HELD));
  assert(!CountsTowardAvailable(v1::ENTRY_KIND_FULFILLER_PAYOUT, v1::ENTRY_STATE_PAID_OUT));
  assert(CountsTowardAvailable(v1::ENTRY_KIND_WITHDRAWAL, v1::ENTRY_STATE_PENDING_CONFIRMATION));
  assert(CountsTowardAvailable(v1::ENTRY_KIND_WITHDRAWAL, v1::ENTRY_STATE_PAID_OUT));
  assert(CountsTowardAvailable(v1::ENTRY_KIND_WITHDRAWAL, v1::ENTRY_STATE_FAILED));
  assert(CountsTowardAvailable(v1::ENTRY_KIND_REVERSAL, v1::ENTRY_STATE_AVAILABLE));
  assert(!CountsTowardAvailable(v1::ENTRY_KIND_PAYMENT, v1::ENTRY_STATE_AVAILABLE));
  assert(!CountsTowardAvailable(v1::ENTRY_KIND_PLATFORM_FEE, v1::ENTRY_STATE_AVAILABLE));
}

} // namespace

int main() {
  TestAllowedTransitions();
  TestForbiddenTransitions();
  TestSameStateIsNoOp();
  TestAvailableBalanceMembership();

  std::cout << "settlement_unit_entry_state_machine: pass\n";
  return 0;
}
