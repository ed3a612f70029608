#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/payout_service.hpp"
#include "settlement/engine/services/v1/payout_service.grpc.pb.h"

namespace settlement::grpc {

class PayoutServer final : public settlement::engine::services::v1::PayoutService::Service {
 public:
  explicit PayoutServer(std::shared_ptr<settlement::service::PayoutService> svc);

  ::grpc::Status Withdraw(::grpc::ServerContext*, const settlement::engine::services::v1::WithdrawRequest*,
                          settlement::engine::services::v1::WithdrawResponse*) override;

  ::grpc::Status GetBalance(::grpc::ServerContext*, const settlement::engine::services::v1::GetBalanceRequest*,
                            settlement::engine::services::v1::GetBalanceResponse*) override;

 private:
  std::shared_ptr<settlement::service::PayoutService> service_;
};

} // namespace settlement::grpc
