#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/order_record.hpp"
#include "settlement/engine/core/v1/ledger.pb.h"

namespace settlement::core {

// Per-mille of the gross amount: 100 == 10%.
struct CommissionRates {
  uint32_t platform_fee_permille = 100;
  uint32_t referral_permille     = 100;
  uint32_t facilitator_permille  = 200;
};

struct SplitLine {
  // nullopt for the platform fee.
  std::optional<std::string>              beneficiary_id;
  settlement::engine::core::v1::EntryKind kind = settlement::engine::core::v1::ENTRY_KIND_UNSPECIFIED;
  uint32_t                                permille     = 0;
  int64_t                                 amount_minor = 0;
};

// Credits only, in precedence order: platform fee, referral,
// facilitator, fulfiller. Permilles add up to 1000 and amounts add up
// to the order's gross.
using SplitPlan = std::vector<SplitLine>;

/*
  Decides who is paid what for an order.

  - platform fee always applies
  - referral applies when the referrer is neither the fulfiller nor the
    facilitator
  - facilitator commission applies when the facilitator is not the
    fulfiller
  - fulfiller takes the rest, including every rounding remainder

  Pure apart from the gross range check.
*/
class AttributionResolver {
 public:
  static constexpr uint32_t kWholePermille = 1000;
  // Largest gross for which gross * permille stays inside int64.
  static constexpr int64_t kMaxGrossMinor = std::numeric_limits<int64_t>::max() / kWholePermille;

  // Throws std::invalid_argument when the commissions leave nothing
  // for the fulfiller.
  explicit AttributionResolver(CommissionRates rates = {});

  // Throws util::ValidationError("invalid_amount") unless
  // 0 < gross <= kMaxGrossMinor.
  SplitPlan Resolve(const db::model::OrderRecord& order) const;

  const CommissionRates& rates() const {
    return rates_;
  }

 private:
  CommissionRates rates_;
};

} // namespace settlement::core
