#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/transfer/transfer_gateway.hpp"
#include "internal/util/time.hpp"

namespace settlement::core {

struct PayoutOptions {
  int64_t min_withdrawal_minor = 100;
  // Zero disables the upper bound.
  int64_t                   max_withdrawal_minor = 0;
  std::chrono::milliseconds transfer_timeout{5000};
  // Attempts at the balance check + debit when the store reports a conflict.
  uint32_t max_attempts = 3;
};

enum class PayoutStatus {
  kPaidOut,
  kPending,
  kRejected,
};

const char* PayoutStatusName(PayoutStatus status);

struct PayoutResult {
  PayoutStatus status = PayoutStatus::kRejected;
  // Empty for kPaidOut. One of: invalid_amount, below_minimum,
  // above_maximum, insufficient_funds, transfer_failed,
  // confirmation_pending, transfer_outcome_unknown.
  std::string reason;
  std::string withdrawal_id;
  std::string transfer_id;
};

// Locates a Withdrawal from a processor event: by its id (the transfer's
// idempotency key) when known, otherwise by external transfer id.
struct TransferRef {
  std::string withdrawal_id;
  std::string transfer_id;
};

/*
  Withdrawals out of a beneficiary's available balance.

  Withdraw:
    1. one transaction: lock the beneficiary, recompute the available
       balance, append a Withdrawal entry (-amount, available)
    2. submit the transfer outside any transaction, keyed by the
       Withdrawal id
    3. record the outcome: paid_out, failed + Reversal, or
       pending_confirmation when the outcome is unknown

  Validation failures come back as kRejected with a reason, not as
  exceptions. A transfer that left the building is never reported as
  rejected unless the provider said so.

  ConfirmTransfer / FailTransfer apply the asynchronous outcome. Both
  are idempotent; a Withdrawal gets at most one Reversal.
*/
class PayoutProcessor {
 public:
  PayoutProcessor(std::shared_ptr<db::Repository> repository, std::shared_ptr<transfer::TransferGateway> gateway, PayoutOptions options = {},
                  util::NowFn now = util::Now);

  PayoutResult Withdraw(const std::string& beneficiary_id, int64_t amount_minor);

  // Returns false when the Withdrawal was already paid out.
  // Throws util::InvalidState if the Withdrawal already failed.
  bool ConfirmTransfer(const TransferRef& ref);

  // Returns false when the Withdrawal was already reversed.
  bool FailTransfer(const TransferRef& ref, const std::string& failure_message);

 private:
  std::string ReserveFunds(const std::string& beneficiary_id, int64_t amount_minor, std::string& reject_reason);

  void MarkPendingConfirmation(const std::string& withdrawal_id, const std::string& transfer_id);

  // Dead-letters a synchronous success for a Withdrawal that was already
  // failed and reversed.
  void RecordConflictingSuccess(const TransferRef& ref, const std::string& error);

  db::model::LedgerEntryRecord LocateWithdrawal(db::Transaction& tx, const TransferRef& ref);

  // Moves the Withdrawal to failed (unless already paid out) and appends
  // its Reversal inside tx. Returns false if a Reversal already exists.
  bool ReverseWithdrawal(db::Transaction& tx, db::model::LedgerEntryRecord withdrawal, const std::string& failure_message);

  std::shared_ptr<db::Repository>           repository_;
  std::shared_ptr<transfer::TransferGateway> gateway_;
  PayoutOptions                             options_;
  util::NowFn                               now_;
};

} // namespace settlement::core
