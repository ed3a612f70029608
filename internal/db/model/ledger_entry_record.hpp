#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/db/model/order_record.hpp"
#include "settlement/engine/core/v1/ledger.pb.h"

namespace settlement::db::model {

/*
  Persistent ledger row.

  IMPORTANT:
  - Rows are never deleted. Corrections are new Reversal rows.
  - Only state, available_at_ms, external_payout_ref and description
    change after insert.
*/
struct LedgerEntryRecord {
  std::string id;

  // Empty for Withdrawal and Reversal entries.
  std::string order_id;

  // nullopt only for the Platform-Fee credit.
  std::optional<std::string> beneficiary_id;

  settlement::engine::core::v1::EntryKind  kind  = settlement::engine::core::v1::ENTRY_KIND_UNSPECIFIED;
  settlement::engine::core::v1::EntryState state = settlement::engine::core::v1::ENTRY_STATE_UNSPECIFIED;

  int64_t amount_minor = 0;

  std::optional<int64_t> available_at_ms;

  std::string external_payout_ref;

  // Set on Reversal entries: the entry this one offsets.
  std::string reverses_entry_id;

  std::string     description;
  ContextSnapshot context;

  int64_t created_at_ms = 0;
  int64_t updated_at_ms = 0;
};

} // namespace settlement::db::model
