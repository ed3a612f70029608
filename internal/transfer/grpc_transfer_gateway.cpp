#include "grpc_transfer_gateway.hpp"

#include <grpcpp/client_context.h>

#include "internal/observability/logging.hpp"

namespace settlement::transfer {

namespace tv1 = settlement::engine::transfer::v1;

using settlement::observability::IntField;
using settlement::observability::StringField;

namespace {

// Statuses after which the provider may or may not have executed the
// transfer.
bool OutcomeUnknown(::grpc::StatusCode code) {
  switch (code) {
    case ::grpc::StatusCode::DEADLINE_EXCEEDED:
    case ::grpc::StatusCode::UNAVAILABLE:
    case ::grpc::StatusCode::CANCELLED:
    case ::grpc::StatusCode::UNKNOWN:
    case ::grpc::StatusCode::INTERNAL:
    case ::grpc::StatusCode::ABORTED:
    case ::grpc::StatusCode::RESOURCE_EXHAUSTED:
      return true;
    default:
      return false;
  }
}

} // namespace

GrpcTransferGateway::GrpcTransferGateway(std::shared_ptr<::grpc::Channel> channel) : stub_(tv1::TransferService::NewStub(channel)) {
}

TransferResult GrpcTransferGateway::Submit(const TransferRequest& request, std::chrono::milliseconds timeout) {
  tv1::SubmitTransferRequest req;
  req.set_idempotency_key(request.idempotency_key);
  req.set_beneficiary_id(request.beneficiary_id);
  req.set_amount_minor(request.amount_minor);
  req.set_description(request.description);

  ::grpc::ClientContext ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + timeout);

  tv1::SubmitTransferResponse resp;
  const auto                  status = stub_->SubmitTransfer(&ctx, req, &resp);

  if (!status.ok()) {
    SETTLEMENT_LOG_WARN("transfer submit failed", {StringField("withdrawal_id", request.idempotency_key),
                                                   IntField("grpc_code", static_cast<int64_t>(status.error_code())),
                                                   StringField("error", status.error_message())});
    if (OutcomeUnknown(status.error_code())) {
      return TransferResult{TransferOutcome::kUnknown, "", status.error_message()};
    }
    return TransferResult{TransferOutcome::kFailed, "", status.error_message()};
  }

  switch (resp.status()) {
    case tv1::TRANSFER_STATUS_SUCCEEDED:
      return TransferResult{TransferOutcome::kSucceeded, resp.transfer_id(), ""};
    case tv1::TRANSFER_STATUS_FAILED:
      return TransferResult{TransferOutcome::kFailed, resp.transfer_id(), resp.failure_message()};
    default:
      return TransferResult{TransferOutcome::kUnknown, resp.transfer_id(), "transfer in flight"};
  }
}

} // namespace settlement::transfer
