#pragma once

#include <grpcpp/channel.h>

#include <memory>

#include "internal/transfer/transfer_gateway.hpp"
#include "settlement/engine/transfer/v1/transfer_service.grpc.pb.h"

namespace settlement::transfer {

class GrpcTransferGateway final : public TransferGateway {
 public:
  explicit GrpcTransferGateway(std::shared_ptr<::grpc::Channel> channel);

  TransferResult Submit(const TransferRequest& request, std::chrono::milliseconds timeout) override;

 private:
  std::unique_ptr<settlement::engine::transfer::v1::TransferService::Stub> stub_;
};

} // namespace settlement::transfer
