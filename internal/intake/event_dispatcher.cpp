#include "event_dispatcher.hpp"

#include "internal/observability/logging.hpp"

namespace settlement::intake {

using settlement::observability::StringField;

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

DispatchResult AppliedIf(bool changed) {
  return changed ? DispatchResult::kApplied : DispatchResult::kIgnored;
}

} // namespace

EventDispatcher::EventDispatcher(std::shared_ptr<core::SettlementEngine> settlement, std::shared_ptr<core::PayoutProcessor> payouts,
                                 std::shared_ptr<core::DisputeHandler> disputes)
    : settlement_(std::move(settlement)), payouts_(std::move(payouts)), disputes_(std::move(disputes)) {
}

DispatchResult EventDispatcher::Dispatch(const ProcessorEvent& event) {
  return std::visit(
      Overloaded{
          [&](const PaymentSucceeded& e) {
            const auto result = settlement_->Settle(e.order_id, e.payment_ref);
            return AppliedIf(result.outcome == core::SettlementOutcome::kSettled);
          },
          [&](const PaymentFailed& e) { return AppliedIf(settlement_->MarkPaymentFailed(e.order_id, e.payment_ref)); },
          [&](const TransferSucceeded& e) { return AppliedIf(payouts_->ConfirmTransfer({e.withdrawal_id, e.transfer_id})); },
          [&](const TransferFailed& e) {
            return AppliedIf(payouts_->FailTransfer({e.withdrawal_id, e.transfer_id}, e.failure_message.empty() ? "transfer failed" : e.failure_message));
          },
          [&](const TransferCanceled& e) { return AppliedIf(payouts_->FailTransfer({e.withdrawal_id, e.transfer_id}, "transfer canceled")); },
          [&](const TransferUpdated& e) {
            const core::TransferRef ref{e.withdrawal_id, e.transfer_id};
            if (e.status == "paid" || e.status == "in_transit") {
              return AppliedIf(payouts_->ConfirmTransfer(ref));
            }
            if (e.status == "failed" || e.status == "canceled") {
              return AppliedIf(payouts_->FailTransfer(ref, "transfer " + e.status));
            }
            return DispatchResult::kIgnored;
          },
          [&](const ChargebackOpened& e) { return AppliedIf(disputes_->OpenDispute(e.payment_ref, e.order_id) > 0); },
          [&](const Unhandled& e) {
            SETTLEMENT_LOG_INFO("ignoring unhandled event type", {StringField("event_id", event.event_id), StringField("event_type", e.event_type)});
            return DispatchResult::kIgnored;
          },
      },
      event.body);
}

} // namespace settlement::intake
