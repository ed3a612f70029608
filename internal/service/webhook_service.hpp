#pragma once

#include "service_context.hpp"
#include "settlement/engine/services/v1/webhook_service.pb.h"

namespace settlement::service {

class WebhookService {
 public:
  explicit WebhookService(ServiceContext ctx);

  settlement::engine::services::v1::DeliverResponse Deliver(const settlement::engine::services::v1::DeliverRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace settlement::service
