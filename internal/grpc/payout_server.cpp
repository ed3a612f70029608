#include "payout_server.hpp"

#include "grpc_error.hpp"

namespace settlement::grpc {

using namespace settlement::engine::services::v1;

PayoutServer::PayoutServer(std::shared_ptr<settlement::service::PayoutService> svc) : service_(std::move(svc)) {
}

::grpc::Status PayoutServer::Withdraw(::grpc::ServerContext*, const WithdrawRequest* req, WithdrawResponse* resp) {
  return Invoke([&] { *resp = service_->Withdraw(*req); });
}

::grpc::Status PayoutServer::GetBalance(::grpc::ServerContext*, const GetBalanceRequest* req, GetBalanceResponse* resp) {
  return Invoke([&] { *resp = service_->GetBalance(*req); });
}

} // namespace settlement::grpc
