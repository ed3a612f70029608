#include "admin_service.hpp"

#include <algorithm>

#include "internal/core/ledger_mapping.hpp"
#include "internal/core/maturity_transitioner.hpp"
#include "internal/core/order_registry.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/intake/failed_event_replayer.hpp"
#include "observe_rpc.hpp"

namespace settlement::service {

using namespace settlement::engine::services::v1;

namespace {

constexpr uint32_t kDefaultPageLimit = 100;
constexpr uint32_t kMaxPageLimit     = 1000;

uint32_t PageLimit(uint32_t requested) {
  if (requested == 0) {
    return kDefaultPageLimit;
  }
  return std::min(requested, kMaxPageLimit);
}

} // namespace

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

RegisterOrderResponse AdminService::RegisterOrder(const RegisterOrderRequest& req) {
  return ObserveRpc("AdminService.RegisterOrder", "order.id", req.order().id(), [&] {
    RegisterOrderResponse resp;
    *resp.mutable_order() = ctx_.orders->Register(req.order());
    return resp;
  });
}

GetOrderLedgerResponse AdminService::GetOrderLedger(const GetOrderLedgerRequest& req) {
  return ObserveRpc("AdminService.GetOrderLedger", "order.id", req.order_id(), [&] {
    GetOrderLedgerResponse resp;
    *resp.mutable_order() = ctx_.orders->GetOrder(req.order_id());
    for (auto& entry : ctx_.orders->ListLedger(req.order_id())) {
      *resp.add_entries() = std::move(entry);
    }
    return resp;
  });
}

ListFailedEventsResponse AdminService::ListFailedEvents(const ListFailedEventsRequest& req) {
  return ObserveRpc("AdminService.ListFailedEvents", "", "", [&] {
    auto tx      = ctx_.repository->Begin();
    auto records = ctx_.repository->ListFailedEvents(*tx, req.include_resolved(), PageLimit(req.limit()));
    tx->Commit();

    ListFailedEventsResponse resp;
    for (const auto& record : records) {
      *resp.add_events() = core::ToProto(record);
    }
    return resp;
  });
}

ReplayFailedEventResponse AdminService::ReplayFailedEvent(const ReplayFailedEventRequest& req) {
  return ObserveRpc("AdminService.ReplayFailedEvent", "failed_event.id", req.failed_event_id(), [&] {
    const auto outcome = ctx_.replayer->Replay(req.failed_event_id());

    ReplayFailedEventResponse resp;
    resp.set_resolved(outcome.resolved);
    resp.set_already_resolved(outcome.already_resolved);
    resp.set_error_message(outcome.error_message);
    return resp;
  });
}

ReplayFailedEventsResponse AdminService::ReplayFailedEvents(const ReplayFailedEventsRequest& req) {
  return ObserveRpc("AdminService.ReplayFailedEvents", "", "", [&] {
    const auto batch = ctx_.replayer->ReplayUnresolved(PageLimit(req.limit()));

    ReplayFailedEventsResponse resp;
    resp.set_attempted(batch.attempted);
    resp.set_resolved(batch.resolved);
    resp.set_failed(batch.failed);
    return resp;
  });
}

RunMaturitySweepResponse AdminService::RunMaturitySweep(const RunMaturitySweepRequest&) {
  return ObserveRpc("AdminService.RunMaturitySweep", "", "", [&] {
    RunMaturitySweepResponse resp;
    resp.set_promoted(ctx_.maturity->Sweep());
    return resp;
  });
}

} // namespace settlement::service
