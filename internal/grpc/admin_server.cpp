#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace settlement::grpc {

using namespace settlement::engine::services::v1;

AdminServer::AdminServer(std::shared_ptr<settlement::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::RegisterOrder(::grpc::ServerContext*, const RegisterOrderRequest* req, RegisterOrderResponse* resp) {
  return Invoke([&] { *resp = service_->RegisterOrder(*req); });
}

::grpc::Status AdminServer::GetOrderLedger(::grpc::ServerContext*, const GetOrderLedgerRequest* req, GetOrderLedgerResponse* resp) {
  return Invoke([&] { *resp = service_->GetOrderLedger(*req); });
}

::grpc::Status AdminServer::ListFailedEvents(::grpc::ServerContext*, const ListFailedEventsRequest* req, ListFailedEventsResponse* resp) {
  return Invoke([&] { *resp = service_->ListFailedEvents(*req); });
}

::grpc::Status AdminServer::ReplayFailedEvent(::grpc::ServerContext*, const ReplayFailedEventRequest* req, ReplayFailedEventResponse* resp) {
  return Invoke([&] { *resp = service_->ReplayFailedEvent(*req); });
}

::grpc::Status AdminServer::ReplayFailedEvents(::grpc::ServerContext*, const ReplayFailedEventsRequest* req, ReplayFailedEventsResponse* resp) {
  return Invoke([&] { *resp = service_->ReplayFailedEvents(*req); });
}

::grpc::Status AdminServer::RunMaturitySweep(::grpc::ServerContext*, const RunMaturitySweepRequest* req, RunMaturitySweepResponse* resp) {
  return Invoke([&] { *resp = service_->RunMaturitySweep(*req); });
}

} // namespace settlement::grpc
