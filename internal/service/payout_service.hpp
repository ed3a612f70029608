#pragma once

#include "service_context.hpp"
#include "settlement/engine/services/v1/payout_service.pb.h"

namespace settlement::service {

class PayoutService {
 public:
  explicit PayoutService(ServiceContext ctx);

  settlement::engine::services::v1::WithdrawResponse Withdraw(const settlement::engine::services::v1::WithdrawRequest& req);

  settlement::engine::services::v1::GetBalanceResponse GetBalance(const settlement::engine::services::v1::GetBalanceRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace settlement::service
