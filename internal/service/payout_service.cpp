#include "payout_service.hpp"

#include "internal/core/order_registry.hpp"
#include "internal/core/payout_processor.hpp"
#include "observe_rpc.hpp"

namespace settlement::service {

using namespace settlement::engine::services::v1;

namespace {

WithdrawalStatus ToProto(core::PayoutStatus status) {
  switch (status) {
    case core::PayoutStatus::kPaidOut:
      return WITHDRAWAL_STATUS_PAID_OUT;
    case core::PayoutStatus::kPending:
      return WITHDRAWAL_STATUS_PENDING;
    case core::PayoutStatus::kRejected:
      return WITHDRAWAL_STATUS_REJECTED;
  }
  return WITHDRAWAL_STATUS_UNSPECIFIED;
}

} // namespace

PayoutService::PayoutService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

WithdrawResponse PayoutService::Withdraw(const WithdrawRequest& req) {
  return ObserveRpc("PayoutService.Withdraw", "beneficiary.id", req.beneficiary_id(), [&] {
    const auto result = ctx_.payouts->Withdraw(req.beneficiary_id(), req.amount_minor());
    settlement::observability::Metrics::Instance().RecordPayoutOutcome(core::PayoutStatusName(result.status), result.reason);

    WithdrawResponse resp;
    resp.set_status(ToProto(result.status));
    resp.set_reason(result.reason);
    resp.set_withdrawal_id(result.withdrawal_id);
    resp.set_transfer_id(result.transfer_id);
    return resp;
  });
}

GetBalanceResponse PayoutService::GetBalance(const GetBalanceRequest& req) {
  return ObserveRpc("PayoutService.GetBalance", "beneficiary.id", req.beneficiary_id(), [&] {
    GetBalanceResponse resp;
    *resp.mutable_balance() = ctx_.orders->GetBalance(req.beneficiary_id());
    return resp;
  });
}

} // namespace settlement::service
