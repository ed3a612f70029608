#pragma once

#include <string>

#include "internal/db/model/balance_record.hpp"
#include "internal/db/model/failed_event_record.hpp"
#include "internal/db/model/ledger_entry_record.hpp"
#include "internal/db/model/order_record.hpp"
#include "settlement/engine/core/v1/ledger.pb.h"

namespace settlement::core {

// Conversions between repository records and wire messages.

settlement::engine::core::v1::Order        ToProto(const db::model::OrderRecord& record);
settlement::engine::core::v1::LedgerEntry  ToProto(const db::model::LedgerEntryRecord& record);
settlement::engine::core::v1::FailedEvent  ToProto(const db::model::FailedEventRecord& record);
settlement::engine::core::v1::Balance      ToProto(const std::string& beneficiary_id, const db::model::BalanceRecord& record);
settlement::engine::core::v1::OrderContext ToProto(const db::model::ContextSnapshot& context);

db::model::OrderRecord     FromProto(const settlement::engine::core::v1::Order& order);
db::model::ContextSnapshot FromProto(const settlement::engine::core::v1::OrderContext& context);

} // namespace settlement::core
