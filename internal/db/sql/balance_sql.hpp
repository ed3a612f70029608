#pragma once

#include <string>

#include "settlement/engine/core/v1/ledger.pb.h"

namespace settlement::db::sql {

/*
  Balance aggregation shared by the SQL backends.

  Placeholder free: each backend appends its own
  "FROM ledger_entries WHERE beneficiary_id=?|$1".
  Must agree with model::CountsTowardAvailable().
*/

namespace v1 = settlement::engine::core::v1;

inline std::string N(int value) {
  return std::to_string(value);
}

inline std::string BalanceKindList() {
  return "(" + N(v1::ENTRY_KIND_FULFILLER_PAYOUT) + "," + N(v1::ENTRY_KIND_REFERRAL_COMMISSION) + "," + N(v1::ENTRY_KIND_FACILITATOR_COMMISSION) + "," +
         N(v1::ENTRY_KIND_WITHDRAWAL) + "," + N(v1::ENTRY_KIND_REVERSAL) + ")";
}

inline std::string AvailableBalanceCase() {
  return "CASE WHEN kind IN " + BalanceKindList() + " AND (state=" + N(v1::ENTRY_STATE_AVAILABLE) + " OR (kind=" + N(v1::ENTRY_KIND_WITHDRAWAL) +
         " AND state IN (" + N(v1::ENTRY_STATE_PENDING_CONFIRMATION) + "," + N(v1::ENTRY_STATE_PAID_OUT) + "," + N(v1::ENTRY_STATE_FAILED) +
         "))) THEN amount_minor ELSE 0 END";
}

inline std::string StateBalanceCase(v1::EntryState state) {
  return "CASE WHEN kind IN " + BalanceKindList() + " AND state=" + N(state) + " THEN amount_minor ELSE 0 END";
}

inline std::string LifetimeCase() {
  return "CASE WHEN kind IN (" + N(v1::ENTRY_KIND_FULFILLER_PAYOUT) + "," + N(v1::ENTRY_KIND_REFERRAL_COMMISSION) + "," +
         N(v1::ENTRY_KIND_FACILITATOR_COMMISSION) + ") AND amount_minor > 0 THEN amount_minor ELSE 0 END";
}

inline std::string SelectAvailableBalance() {
  return "SELECT COALESCE(SUM(" + AvailableBalanceCase() + "),0) ";
}

inline std::string SelectBalanceSummary() {
  return "SELECT COALESCE(SUM(" + AvailableBalanceCase() + "),0), COALESCE(SUM(" + StateBalanceCase(v1::ENTRY_STATE_HELD) + "),0), COALESCE(SUM(" +
         StateBalanceCase(v1::ENTRY_STATE_DISPUTED) + "),0), COALESCE(SUM(" + LifetimeCase() + "),0) ";
}

} // namespace settlement::db::sql
