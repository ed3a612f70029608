#pragma once

#include "settlement/engine/core/v1/ledger.pb.h"

namespace settlement::model {

using settlement::engine::core::v1::EntryKind;
using settlement::engine::core::v1::EntryState;

namespace v1 = settlement::engine::core::v1;

constexpr bool IsTerminal(EntryState state) {
  return state == v1::ENTRY_STATE_REVERSED || state == v1::ENTRY_STATE_FAILED;
}

/*
  Allowed ledger entry transitions.

    held -> available | disputed
    available -> paid_out | disputed | pending_confirmation | failed
    pending_confirmation -> paid_out | failed
    paid_out -> reversed

  Writing the current state again is a no-op and always allowed.
*/
constexpr bool CanTransition(EntryState from, EntryState to) {
  if (from == to) {
    return true;
  }
  if (IsTerminal(from) || to == v1::ENTRY_STATE_UNSPECIFIED) {
    return false;
  }

  switch (from) {
    case v1::ENTRY_STATE_HELD:
      return to == v1::ENTRY_STATE_AVAILABLE || to == v1::ENTRY_STATE_DISPUTED;
    case v1::ENTRY_STATE_AVAILABLE:
      return to == v1::ENTRY_STATE_PAID_OUT || to == v1::ENTRY_STATE_DISPUTED || to == v1::ENTRY_STATE_PENDING_CONFIRMATION ||
             to == v1::ENTRY_STATE_FAILED;
    case v1::ENTRY_STATE_PENDING_CONFIRMATION:
      return to == v1::ENTRY_STATE_PAID_OUT || to == v1::ENTRY_STATE_FAILED;
    case v1::ENTRY_STATE_PAID_OUT:
      return to == v1::ENTRY_STATE_REVERSED;
    default:
      return false;
  }
}

// Kinds that make up a beneficiary balance. Payment debits and
// Platform-Fee credits belong to the platform side of the ledger.
constexpr bool IsBalanceKind(EntryKind kind) {
  return kind == v1::ENTRY_KIND_FULFILLER_PAYOUT || kind == v1::ENTRY_KIND_REFERRAL_COMMISSION || kind == v1::ENTRY_KIND_FACILITATOR_COMMISSION ||
         kind == v1::ENTRY_KIND_WITHDRAWAL || kind == v1::ENTRY_KIND_REVERSAL;
}

constexpr bool IsEarningKind(EntryKind kind) {
  return kind == v1::ENTRY_KIND_FULFILLER_PAYOUT || kind == v1::ENTRY_KIND_REFERRAL_COMMISSION || kind == v1::ENTRY_KIND_FACILITATOR_COMMISSION;
}

/*
  True when the entry counts toward the withdrawable balance.

  A Withdrawal stays debited once submitted (pending, paid out) and
  after failure; the failure is offset by its Reversal credit.
  Mirrored by db::sql::AvailableBalanceCase() for the SQL backends.
*/
constexpr bool CountsTowardAvailable(EntryKind kind, EntryState state) {
  if (!IsBalanceKind(kind)) {
    return false;
  }
  if (state == v1::ENTRY_STATE_AVAILABLE) {
    return true;
  }
  return kind == v1::ENTRY_KIND_WITHDRAWAL &&
         (state == v1::ENTRY_STATE_PENDING_CONFIRMATION || state == v1::ENTRY_STATE_PAID_OUT || state == v1::ENTRY_STATE_FAILED);
}

} // namespace settlement::model
