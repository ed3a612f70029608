#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "settlement/engine/core/v1/ledger.pb.h"

namespace settlement::core {

/*
  Entry point for the booking flow's orders, and read access to an
  order's ledger and to beneficiary balances.

  Balances are derived from the ledger on every call.
*/
class OrderRegistry {
 public:
  explicit OrderRegistry(std::shared_ptr<db::Repository> repository, util::NowFn now = util::Now);

  // Validates and stores an unpaid order.
  // Throws util::ValidationError, or util::AlreadyExists for a known id.
  settlement::engine::core::v1::Order Register(const settlement::engine::core::v1::Order& order);

  settlement::engine::core::v1::Order                    GetOrder(const std::string& order_id);
  std::vector<settlement::engine::core::v1::LedgerEntry> ListLedger(const std::string& order_id);

  settlement::engine::core::v1::Balance GetBalance(const std::string& beneficiary_id);

 private:
  std::shared_ptr<db::Repository> repository_;
  util::NowFn                     now_;
};

} // namespace settlement::core
