#include "webhook_service.hpp"

#include "internal/intake/event_intake.hpp"
#include "observe_rpc.hpp"

namespace settlement::service {

using namespace settlement::engine::services::v1;

namespace {

IntakeDisposition ToProto(intake::Disposition disposition) {
  switch (disposition) {
    case intake::Disposition::kApplied:
      return INTAKE_DISPOSITION_APPLIED;
    case intake::Disposition::kIgnored:
      return INTAKE_DISPOSITION_IGNORED;
    case intake::Disposition::kQueuedForRetry:
      return INTAKE_DISPOSITION_QUEUED_FOR_RETRY;
    case intake::Disposition::kDeadLettered:
      return INTAKE_DISPOSITION_DEAD_LETTERED;
  }
  return INTAKE_DISPOSITION_UNSPECIFIED;
}

} // namespace

WebhookService::WebhookService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

DeliverResponse WebhookService::Deliver(const DeliverRequest& req) {
  return ObserveRpc("WebhookService.Deliver", "", "", [&] {
    const auto result = ctx_.intake->Handle(req.body(), req.signature());

    DeliverResponse resp;
    resp.set_event_id(result.event_id);
    resp.set_disposition(ToProto(result.disposition));
    resp.set_failed_event_id(result.failed_event_id);
    return resp;
  });
}

} // namespace settlement::service
