#pragma once

#include "service_context.hpp"
#include "settlement/engine/services/v1/admin_service.pb.h"

namespace settlement::service {

/*
  Operator surface: order hand-off from the booking flow, ledger
  inspection, dead-letter replay and an on-demand maturity sweep.
*/
class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  settlement::engine::services::v1::RegisterOrderResponse RegisterOrder(const settlement::engine::services::v1::RegisterOrderRequest& req);

  settlement::engine::services::v1::GetOrderLedgerResponse GetOrderLedger(const settlement::engine::services::v1::GetOrderLedgerRequest& req);

  settlement::engine::services::v1::ListFailedEventsResponse ListFailedEvents(const settlement::engine::services::v1::ListFailedEventsRequest& req);

  settlement::engine::services::v1::ReplayFailedEventResponse ReplayFailedEvent(const settlement::engine::services::v1::ReplayFailedEventRequest& req);

  settlement::engine::services::v1::ReplayFailedEventsResponse ReplayFailedEvents(const settlement::engine::services::v1::ReplayFailedEventsRequest& req);

  settlement::engine::services::v1::RunMaturitySweepResponse RunMaturitySweep(const settlement::engine::services::v1::RunMaturitySweepRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace settlement::service
