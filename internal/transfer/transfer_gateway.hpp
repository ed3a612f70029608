#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace settlement::transfer {

struct TransferRequest {
  // The Withdrawal entry id. Resubmitting the same key never moves
  // money twice.
  std::string idempotency_key;
  std::string beneficiary_id;
  int64_t     amount_minor = 0;
  std::string description;
};

enum class TransferOutcome {
  kSucceeded,
  kFailed,
  // Timed out, unreachable, or accepted but still in flight. The
  // final status arrives later as a processor event.
  kUnknown,
};

struct TransferResult {
  TransferOutcome outcome = TransferOutcome::kUnknown;
  std::string     transfer_id;
  std::string     message;
};

/*
  External transfer API as seen by the payout processor.

  Submit does not throw for transport failures; those are reported as
  kUnknown so the caller never mistakes them for a rejection.
*/
class TransferGateway {
 public:
  virtual ~TransferGateway() = default;

  virtual TransferResult Submit(const TransferRequest& request, std::chrono::milliseconds timeout) = 0;
};

} // namespace settlement::transfer
