#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "internal/core/attribution_resolver.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace settlement::core {

struct SettlementOptions {
  // Added to the order's fulfillment end to get available_at.
  std::chrono::milliseconds hold_period{std::chrono::hours(24 * 7)};
  uint32_t                  max_attempts = 3;
};

enum class SettlementOutcome {
  kSettled,
  kAlreadySettled,
};

struct SettlementResult {
  SettlementOutcome outcome = SettlementOutcome::kSettled;
  std::string       order_id;
  // Zero for kAlreadySettled.
  size_t entries_written = 0;
};

/*
  Turns one successful payment into the order's complete ledger.

  Everything happens in one transaction that holds the order row:
  the Payment debit, one credit per SplitPlan line, and the order
  moving to paid with the payment reference stamped. The written set
  is re-read and checked (entry count, zero sum) before commit.

  Redelivery with the same payment reference is a no-op once the
  order's ledger is complete.

  Errors:
    util::NotFound        order does not exist
    util::ValidationError missing payment reference
    util::InvalidState    paid under another reference, or an
                          incomplete or unbalanced ledger
    util::Transient       store conflict after max_attempts
*/
class SettlementEngine {
 public:
  SettlementEngine(std::shared_ptr<db::Repository> repository, AttributionResolver resolver, SettlementOptions options = {},
                   util::NowFn now = util::Now);

  SettlementResult Settle(const std::string& order_id, const std::string& payment_ref);

  // unpaid -> payment_failed. Returns false when the order was already
  // paid or already marked failed.
  bool MarkPaymentFailed(const std::string& order_id, const std::string& payment_ref);

 private:
  SettlementResult SettleOnce(const std::string& order_id, const std::string& payment_ref);

  std::shared_ptr<db::Repository> repository_;
  AttributionResolver             resolver_;
  SettlementOptions               options_;
  util::NowFn                     now_;
};

} // namespace settlement::core
