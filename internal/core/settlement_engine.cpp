#include "settlement_engine.hpp"

#include <vector>

#include "internal/core/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace settlement::core {

namespace v1 = settlement::engine::core::v1;

using settlement::observability::AmountField;
using settlement::observability::IntField;
using settlement::observability::StringField;

namespace {

std::string Describe(v1::EntryKind kind, const db::model::OrderRecord& order) {
  const std::string subject = order.context.service_name.empty() ? "order " + order.id : order.context.service_name;
  switch (kind) {
    case v1::ENTRY_KIND_PAYMENT:
      return "Payment for " + subject;
    case v1::ENTRY_KIND_FULFILLER_PAYOUT:
      return "Payout for " + subject;
    case v1::ENTRY_KIND_REFERRAL_COMMISSION:
      return "Referral commission for " + subject;
    case v1::ENTRY_KIND_FACILITATOR_COMMISSION:
      return "Facilitator commission for " + subject;
    case v1::ENTRY_KIND_PLATFORM_FEE:
      return "Platform fee for " + subject;
    default:
      return subject;
  }
}

bool IsSettlementKind(v1::EntryKind kind) {
  return kind == v1::ENTRY_KIND_PAYMENT || kind == v1::ENTRY_KIND_FULFILLER_PAYOUT || kind == v1::ENTRY_KIND_REFERRAL_COMMISSION ||
         kind == v1::ENTRY_KIND_FACILITATOR_COMMISSION || kind == v1::ENTRY_KIND_PLATFORM_FEE;
}

// Payment debit plus one credit per plan line, all summing to zero.
bool LedgerComplete(const std::vector<db::model::LedgerEntryRecord>& entries, const SplitPlan& plan) {
  size_t  count = 0;
  int64_t sum   = 0;
  for (const auto& entry : entries) {
    if (!IsSettlementKind(entry.kind)) {
      continue;
    }
    ++count;
    sum += entry.amount_minor;
  }
  return count == plan.size() + 1 && sum == 0;
}

} // namespace

SettlementEngine::SettlementEngine(std::shared_ptr<db::Repository> repository, AttributionResolver resolver, SettlementOptions options,
                                   util::NowFn now)
    : repository_(std::move(repository)), resolver_(std::move(resolver)), options_(options), now_(std::move(now)) {
}

SettlementResult SettlementEngine::Settle(const std::string& order_id, const std::string& payment_ref) {
  if (order_id.empty()) {
    throw util::ValidationError("missing_order_id", "settlement requires an order id");
  }
  if (payment_ref.empty()) {
    throw util::ValidationError("missing_payment_ref", "settlement requires a payment reference");
  }

  return RetryOnConflict("settle", options_.max_attempts, [&] { return SettleOnce(order_id, payment_ref); });
}

SettlementResult SettlementEngine::SettleOnce(const std::string& order_id, const std::string& payment_ref) {
  auto tx = repository_->Begin();

  auto order = repository_->GetOrderForUpdate(*tx, order_id);
  if (!order) {
    throw util::NotFound("order " + order_id + " not found");
  }

  const auto plan = resolver_.Resolve(*order);

  if (order->status == v1::ORDER_STATUS_PAID) {
    if (order->payment_ref != payment_ref) {
      throw util::InvalidState("order " + order_id + " already paid under payment " + order->payment_ref);
    }
    if (!LedgerComplete(repository_->ListLedgerEntriesByOrder(*tx, order_id), plan)) {
      throw util::InvalidState("order " + order_id + " is paid but its ledger is incomplete");
    }
    tx->Commit();
    SETTLEMENT_LOG_INFO("settlement already applied", {StringField("order_id", order_id), StringField("payment_ref", payment_ref)});
    return SettlementResult{SettlementOutcome::kAlreadySettled, order_id, 0};
  }

  if (const auto other = repository_->FindOrderByPaymentRef(*tx, payment_ref); other && other->id != order_id) {
    throw util::InvalidState("payment " + payment_ref + " already settled order " + other->id);
  }

  const int64_t now_ms          = util::ToUnixMillis(now_());
  const int64_t available_at_ms = order->fulfillment_end_ms + options_.hold_period.count();

  std::vector<db::model::LedgerEntryRecord> entries;
  entries.reserve(plan.size() + 1);

  const auto make_entry = [&](std::optional<std::string> beneficiary, v1::EntryKind kind, int64_t amount_minor, bool held) {
    db::model::LedgerEntryRecord entry;
    entry.id              = util::NewId();
    entry.order_id        = order_id;
    entry.beneficiary_id  = std::move(beneficiary);
    entry.kind            = kind;
    entry.state           = held ? v1::ENTRY_STATE_HELD : v1::ENTRY_STATE_AVAILABLE;
    entry.amount_minor    = amount_minor;
    entry.available_at_ms = held ? available_at_ms : now_ms;
    entry.description     = Describe(kind, *order);
    entry.context         = order->context;
    entry.created_at_ms   = now_ms;
    entry.updated_at_ms   = now_ms;
    entries.push_back(std::move(entry));
  };

  make_entry(order->payer_id, v1::ENTRY_KIND_PAYMENT, -order->gross_minor, false);
  for (const auto& line : plan) {
    make_entry(line.beneficiary_id, line.kind, line.amount_minor, line.kind != v1::ENTRY_KIND_PLATFORM_FEE);
  }

  for (const auto& entry : entries) {
    ThrowIfDbError(repository_->InsertLedgerEntry(*tx, entry), "insert ledger entry for order " + order_id);
  }

  if (!LedgerComplete(repository_->ListLedgerEntriesByOrder(*tx, order_id), plan)) {
    throw util::InvalidState("ledger for order " + order_id + " does not balance after write");
  }

  order->status      = v1::ORDER_STATUS_PAID;
  order->payment_ref = payment_ref;
  order->paid_at_ms  = now_ms;
  ThrowIfDbError(repository_->UpdateOrder(*tx, *order), "mark order " + order_id + " paid");

  tx->Commit();

  SETTLEMENT_LOG_INFO("order settled", {StringField("order_id", order_id), StringField("payment_ref", payment_ref),
                                        AmountField("gross", order->gross_minor), IntField("entries", static_cast<int64_t>(entries.size())),
                                        IntField("available_at_ms", available_at_ms)});
  return SettlementResult{SettlementOutcome::kSettled, order_id, entries.size()};
}

bool SettlementEngine::MarkPaymentFailed(const std::string& order_id, const std::string& payment_ref) {
  if (order_id.empty()) {
    throw util::ValidationError("missing_order_id", "payment failure requires an order id");
  }

  return RetryOnConflict("payment_failed", options_.max_attempts, [&] {
    auto tx    = repository_->Begin();
    auto order = repository_->GetOrderForUpdate(*tx, order_id);
    if (!order) {
      throw util::NotFound("order " + order_id + " not found");
    }
    if (order->status != v1::ORDER_STATUS_UNPAID) {
      tx->Commit();
      return false;
    }

    order->status = v1::ORDER_STATUS_PAYMENT_FAILED;
    ThrowIfDbError(repository_->UpdateOrder(*tx, *order), "mark order " + order_id + " payment failed");
    tx->Commit();

    SETTLEMENT_LOG_INFO("payment failed", {StringField("order_id", order_id), StringField("payment_ref", payment_ref)});
    return true;
  });
}

} // namespace settlement::core
