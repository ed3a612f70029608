#include "order_registry.hpp"

#include "internal/core/attribution_resolver.hpp"
#include "internal/core/db_errors.hpp"
#include "internal/core/ledger_mapping.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace settlement::core {

namespace v1 = settlement::engine::core::v1;

using settlement::observability::AmountField;
using settlement::observability::StringField;

namespace {

void Validate(const v1::Order& order) {
  if (order.id().empty()) {
    throw util::ValidationError("missing_order_id", "order id is required");
  }
  if (order.payer_id().empty()) {
    throw util::ValidationError("missing_payer", "order " + order.id() + " has no payer");
  }
  if (order.fulfiller_id().empty()) {
    throw util::ValidationError("missing_fulfiller", "order " + order.id() + " has no fulfiller");
  }
  if (order.gross_minor() <= 0 || order.gross_minor() > AttributionResolver::kMaxGrossMinor) {
    throw util::ValidationError("invalid_amount", "order " + order.id() + " gross amount out of range");
  }
  if (order.fulfillment_end_unix_ms() <= 0) {
    throw util::ValidationError("missing_fulfillment_end", "order " + order.id() + " has no fulfillment end time");
  }
  if (order.status() != v1::ORDER_STATUS_UNSPECIFIED && order.status() != v1::ORDER_STATUS_UNPAID) {
    throw util::ValidationError("invalid_status", "order " + order.id() + " must be registered unpaid");
  }
  if (!order.payment_ref().empty()) {
    throw util::ValidationError("unexpected_payment_ref", "order " + order.id() + " cannot carry a payment reference before payment");
  }
}

} // namespace

OrderRegistry::OrderRegistry(std::shared_ptr<db::Repository> repository, util::NowFn now) : repository_(std::move(repository)), now_(std::move(now)) {
}

v1::Order OrderRegistry::Register(const v1::Order& order) {
  Validate(order);

  auto record          = FromProto(order);
  record.status        = v1::ORDER_STATUS_UNPAID;
  record.paid_at_ms    = 0;
  record.created_at_ms = util::ToUnixMillis(now_());

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->InsertOrder(*tx, record), "register order " + record.id);
  tx->Commit();

  SETTLEMENT_LOG_INFO("order registered", {StringField("order_id", record.id), StringField("fulfiller_id", record.fulfiller_id),
                                           AmountField("gross", record.gross_minor)});
  return ToProto(record);
}

v1::Order OrderRegistry::GetOrder(const std::string& order_id) {
  auto tx    = repository_->Begin();
  auto order = repository_->GetOrder(*tx, order_id);
  tx->Commit();
  if (!order) {
    throw util::NotFound("order " + order_id + " not found");
  }
  return ToProto(*order);
}

std::vector<v1::LedgerEntry> OrderRegistry::ListLedger(const std::string& order_id) {
  auto tx      = repository_->Begin();
  auto entries = repository_->ListLedgerEntriesByOrder(*tx, order_id);
  tx->Commit();

  std::vector<v1::LedgerEntry> out;
  out.reserve(entries.size());
  for (const auto& entry : entries) {
    out.push_back(ToProto(entry));
  }
  return out;
}

v1::Balance OrderRegistry::GetBalance(const std::string& beneficiary_id) {
  if (beneficiary_id.empty()) {
    throw util::ValidationError("missing_beneficiary", "balance query requires a beneficiary id");
  }

  auto tx      = repository_->Begin();
  auto summary = repository_->SummarizeBalance(*tx, beneficiary_id);
  tx->Commit();
  return ToProto(beneficiary_id, summary);
}

} // namespace settlement::core
