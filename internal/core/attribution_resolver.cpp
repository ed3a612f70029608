#include "attribution_resolver.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace settlement::core {

namespace v1 = settlement::engine::core::v1;

namespace {

// Rounds toward zero; Resolve bounds gross first.
int64_t Share(int64_t gross_minor, uint32_t permille) {
  return gross_minor * static_cast<int64_t>(permille) / static_cast<int64_t>(AttributionResolver::kWholePermille);
}

} // namespace

AttributionResolver::AttributionResolver(CommissionRates rates) : rates_(rates) {
  const uint64_t commissions = static_cast<uint64_t>(rates_.platform_fee_permille) + rates_.referral_permille + rates_.facilitator_permille;
  if (commissions >= kWholePermille) {
    throw std::invalid_argument("commission rates must leave a positive fulfiller share");
  }
}

SplitPlan AttributionResolver::Resolve(const db::model::OrderRecord& order) const {
  if (order.gross_minor <= 0 || order.gross_minor > kMaxGrossMinor) {
    throw util::ValidationError("invalid_amount", "order " + order.id + " gross " + std::to_string(order.gross_minor) + " is out of range");
  }

  SplitPlan plan;

  const auto add = [&](std::optional<std::string> beneficiary, v1::EntryKind kind, uint32_t permille) {
    plan.push_back(SplitLine{std::move(beneficiary), kind, permille, Share(order.gross_minor, permille)});
  };

  add(std::nullopt, v1::ENTRY_KIND_PLATFORM_FEE, rates_.platform_fee_permille);

  const bool referrer_is_other_role =
      order.referrer_id && (*order.referrer_id == order.fulfiller_id || (order.facilitator_id && *order.referrer_id == *order.facilitator_id));
  if (order.referrer_id && !order.referrer_id->empty() && !referrer_is_other_role) {
    add(order.referrer_id, v1::ENTRY_KIND_REFERRAL_COMMISSION, rates_.referral_permille);
  }

  if (order.facilitator_id && !order.facilitator_id->empty() && *order.facilitator_id != order.fulfiller_id) {
    add(order.facilitator_id, v1::ENTRY_KIND_FACILITATOR_COMMISSION, rates_.facilitator_permille);
  }

  uint32_t assigned_permille = 0;
  int64_t  assigned_minor    = 0;
  for (const auto& line : plan) {
    assigned_permille += line.permille;
    assigned_minor += line.amount_minor;
  }

  plan.push_back(SplitLine{order.fulfiller_id, v1::ENTRY_KIND_FULFILLER_PAYOUT, kWholePermille - assigned_permille, order.gross_minor - assigned_minor});
  return plan;
}

} // namespace settlement::core
