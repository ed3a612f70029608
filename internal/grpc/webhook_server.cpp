#include "webhook_server.hpp"

#include "grpc_error.hpp"

namespace settlement::grpc {

using namespace settlement::engine::services::v1;

WebhookServer::WebhookServer(std::shared_ptr<settlement::service::WebhookService> svc) : service_(std::move(svc)) {
}

::grpc::Status WebhookServer::Deliver(::grpc::ServerContext*, const DeliverRequest* req, DeliverResponse* resp) {
  return Invoke([&] { *resp = service_->Deliver(*req); });
}

} // namespace settlement::grpc
