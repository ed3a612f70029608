#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/admin_service.hpp"
#include "settlement/engine/services/v1/admin_service.grpc.pb.h"

namespace settlement::grpc {

class AdminServer final : public settlement::engine::services::v1::AdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<settlement::service::AdminService> svc);

  ::grpc::Status RegisterOrder(::grpc::ServerContext*, const settlement::engine::services::v1::RegisterOrderRequest*,
                               settlement::engine::services::v1::RegisterOrderResponse*) override;

  ::grpc::Status GetOrderLedger(::grpc::ServerContext*, const settlement::engine::services::v1::GetOrderLedgerRequest*,
                                settlement::engine::services::v1::GetOrderLedgerResponse*) override;

  ::grpc::Status ListFailedEvents(::grpc::ServerContext*, const settlement::engine::services::v1::ListFailedEventsRequest*,
                                  settlement::engine::services::v1::ListFailedEventsResponse*) override;

  ::grpc::Status ReplayFailedEvent(::grpc::ServerContext*, const settlement::engine::services::v1::ReplayFailedEventRequest*,
                                   settlement::engine::services::v1::ReplayFailedEventResponse*) override;

  ::grpc::Status ReplayFailedEvents(::grpc::ServerContext*, const settlement::engine::services::v1::ReplayFailedEventsRequest*,
                                    settlement::engine::services::v1::ReplayFailedEventsResponse*) override;

  ::grpc::Status RunMaturitySweep(::grpc::ServerContext*, const settlement::engine::services::v1::RunMaturitySweepRequest*,
                                  settlement::engine::services::v1::RunMaturitySweepResponse*) override;

 private:
  std::shared_ptr<settlement::service::AdminService> service_;
};

} // namespace settlement::grpc
