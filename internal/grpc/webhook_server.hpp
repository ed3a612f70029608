#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/webhook_service.hpp"
#include "settlement/engine/services/v1/webhook_service.grpc.pb.h"

namespace settlement::grpc {

class WebhookServer final : public settlement::engine::services::v1::WebhookService::Service {
 public:
  explicit WebhookServer(std::shared_ptr<settlement::service::WebhookService> svc);

  ::grpc::Status Deliver(::grpc::ServerContext*, const settlement::engine::services::v1::DeliverRequest*,
                         settlement::engine::services::v1::DeliverResponse*) override;

 private:
  std::shared_ptr<settlement::service::WebhookService> service_;
};

} // namespace settlement::grpc
