#include "dispute_handler.hpp"

#include "internal/core/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace settlement::core {

namespace v1 = settlement::engine::core::v1;

using settlement::observability::IntField;
using settlement::observability::StringField;

DisputeHandler::DisputeHandler(std::shared_ptr<db::Repository> repository, util::NowFn now, uint32_t max_attempts)
    : repository_(std::move(repository)), now_(std::move(now)), max_attempts_(max_attempts) {
}

uint64_t DisputeHandler::OpenDispute(const std::string& payment_ref, const std::string& order_id) {
  if (payment_ref.empty() && order_id.empty()) {
    throw util::ValidationError("missing_order_reference", "chargeback carries neither payment reference nor order id");
  }

  return RetryOnConflict("dispute", max_attempts_, [&] {
    auto tx = repository_->Begin();

    std::optional<db::model::OrderRecord> order;
    if (!payment_ref.empty()) {
      order = repository_->FindOrderByPaymentRef(*tx, payment_ref);
    }
    if (!order && !order_id.empty()) {
      order = repository_->GetOrder(*tx, order_id);
    }
    if (!order) {
      throw util::NotFound("no order for payment '" + payment_ref + "' / order '" + order_id + "'");
    }

    // Serializes with a concurrent settlement of the same order.
    order = repository_->GetOrderForUpdate(*tx, order->id);
    if (!order) {
      throw util::NotFound("order " + order_id + " vanished");
    }

    const int64_t now_ms = util::ToUnixMillis(now_());
    uint64_t      moved  = 0;
    for (auto& entry : repository_->ListLedgerEntriesByOrder(*tx, order->id)) {
      if (entry.state != v1::ENTRY_STATE_HELD && entry.state != v1::ENTRY_STATE_AVAILABLE) {
        continue;
      }
      entry.state         = v1::ENTRY_STATE_DISPUTED;
      entry.updated_at_ms = now_ms;
      ThrowIfDbError(repository_->UpdateLedgerEntry(*tx, entry), "dispute ledger entry " + entry.id);
      ++moved;
    }
    tx->Commit();

    SETTLEMENT_LOG_INFO("chargeback opened", {StringField("order_id", order->id), StringField("payment_ref", payment_ref),
                                              IntField("entries_disputed", static_cast<int64_t>(moved))});
    return moved;
  });
}

} // namespace settlement::core
