#include "payout_processor.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/core/db_errors.hpp"
#include "internal/intake/dead_letter.hpp"
#include "internal/model/entry_state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/money.hpp"
#include "internal/util/uuid.hpp"
#include "settlement/engine/events/v1/envelope.pb.h"

namespace settlement::core {

namespace v1 = settlement::engine::core::v1;

using settlement::observability::AmountField;
using settlement::observability::StringField;

namespace {

constexpr const char* kInvalidAmount     = "invalid_amount";
constexpr const char* kBelowMinimum      = "below_minimum";
constexpr const char* kAboveMaximum      = "above_maximum";
constexpr const char* kInsufficientFunds = "insufficient_funds";
constexpr const char* kTransferFailed    = "transfer_failed";
constexpr const char* kConfirmPending    = "confirmation_pending";
constexpr const char* kOutcomeUnknown    = "transfer_outcome_unknown";

// Same shape as the processor's transfer.succeeded delivery, so an
// operator can replay it once the ledger is repaired.
std::string TransferSucceededEnvelope(const std::string& event_id, const TransferRef& ref) {
  settlement::engine::events::v1::ProcessorEventEnvelope envelope;
  envelope.set_event_id(event_id);
  envelope.set_event_type("transfer.succeeded");
  auto& fields = *envelope.mutable_payload()->mutable_fields();
  fields["withdrawal_id"].set_string_value(ref.withdrawal_id);
  fields["transfer_id"].set_string_value(ref.transfer_id);

  std::string json;
  const auto  status = google::protobuf::util::MessageToJsonString(envelope, &json);
  if (!status.ok()) {
    throw std::runtime_error("encode transfer.succeeded for withdrawal " + ref.withdrawal_id + ": " + std::string(status.message()));
  }
  return json;
}

void RequireTransition(const db::model::LedgerEntryRecord& entry, v1::EntryState to) {
  if (!settlement::model::CanTransition(entry.state, to)) {
    throw util::InvalidState("withdrawal " + entry.id + " cannot move from " + v1::EntryState_Name(entry.state) + " to " + v1::EntryState_Name(to));
  }
}

} // namespace

const char* PayoutStatusName(PayoutStatus status) {
  switch (status) {
    case PayoutStatus::kPaidOut:
      return "paid_out";
    case PayoutStatus::kPending:
      return "pending";
    case PayoutStatus::kRejected:
      return "rejected";
  }
  return "unknown";
}

PayoutProcessor::PayoutProcessor(std::shared_ptr<db::Repository> repository, std::shared_ptr<transfer::TransferGateway> gateway,
                                 PayoutOptions options, util::NowFn now)
    : repository_(std::move(repository)), gateway_(std::move(gateway)), options_(options), now_(std::move(now)) {
}

PayoutResult PayoutProcessor::Withdraw(const std::string& beneficiary_id, int64_t amount_minor) {
  if (beneficiary_id.empty()) {
    throw util::ValidationError("missing_beneficiary", "withdrawal requires a beneficiary id");
  }

  PayoutResult result;
  if (amount_minor <= 0) {
    result.reason = kInvalidAmount;
    return result;
  }
  if (amount_minor < options_.min_withdrawal_minor) {
    result.reason = kBelowMinimum;
    return result;
  }
  if (options_.max_withdrawal_minor > 0 && amount_minor > options_.max_withdrawal_minor) {
    result.reason = kAboveMaximum;
    return result;
  }

  std::string reject_reason;
  result.withdrawal_id = RetryOnConflict("withdraw", options_.max_attempts, [&] { return ReserveFunds(beneficiary_id, amount_minor, reject_reason); });
  if (result.withdrawal_id.empty()) {
    result.reason = reject_reason;
    SETTLEMENT_LOG_INFO("withdrawal rejected",
                        {StringField("beneficiary_id", beneficiary_id), AmountField("amount", amount_minor), StringField("reason", reject_reason)});
    return result;
  }

  transfer::TransferRequest request;
  request.idempotency_key = result.withdrawal_id;
  request.beneficiary_id  = beneficiary_id;
  request.amount_minor    = amount_minor;
  request.description     = "Withdrawal " + result.withdrawal_id;

  const auto transfer  = gateway_->Submit(request, options_.transfer_timeout);
  result.transfer_id   = transfer.transfer_id;
  const TransferRef ref{result.withdrawal_id, transfer.transfer_id};

  try {
    switch (transfer.outcome) {
      case transfer::TransferOutcome::kSucceeded:
        ConfirmTransfer(ref);
        result.status = PayoutStatus::kPaidOut;
        break;
      case transfer::TransferOutcome::kFailed:
        FailTransfer(ref, transfer.message);
        result.status = PayoutStatus::kRejected;
        result.reason = kTransferFailed;
        break;
      case transfer::TransferOutcome::kUnknown:
        MarkPendingConfirmation(result.withdrawal_id, transfer.transfer_id);
        result.status = PayoutStatus::kPending;
        result.reason = kOutcomeUnknown;
        break;
    }
  } catch (const util::InvalidState& e) {
    // The provider paid out a withdrawal the ledger already reversed.
    RecordConflictingSuccess(ref, e.what());
    result.status = PayoutStatus::kPending;
    result.reason = kConfirmPending;
  } catch (const std::exception& e) {
    // The transfer outcome is known to the provider but not recorded
    // here; the processor event will settle it.
    SETTLEMENT_LOG_ERROR("failed to record transfer outcome",
                         {StringField("withdrawal_id", result.withdrawal_id), StringField("transfer_id", transfer.transfer_id),
                          StringField("error", e.what())});
    result.status = PayoutStatus::kPending;
    result.reason = kConfirmPending;
  }

  SETTLEMENT_LOG_INFO("withdrawal processed", {StringField("withdrawal_id", result.withdrawal_id), StringField("beneficiary_id", beneficiary_id),
                                               AmountField("amount", amount_minor), StringField("status", PayoutStatusName(result.status)),
                                               StringField("reason", result.reason)});
  return result;
}

std::string PayoutProcessor::ReserveFunds(const std::string& beneficiary_id, int64_t amount_minor, std::string& reject_reason) {
  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->LockBeneficiary(*tx, beneficiary_id), "lock beneficiary " + beneficiary_id);

  const int64_t available = repository_->SumAvailableBalance(*tx, beneficiary_id);
  if (amount_minor > available) {
    reject_reason = kInsufficientFunds;
    tx->Rollback();
    return {};
  }

  const int64_t now_ms = util::ToUnixMillis(now_());

  db::model::LedgerEntryRecord withdrawal;
  withdrawal.id              = util::NewId();
  withdrawal.beneficiary_id  = beneficiary_id;
  withdrawal.kind            = v1::ENTRY_KIND_WITHDRAWAL;
  withdrawal.state           = v1::ENTRY_STATE_AVAILABLE;
  withdrawal.amount_minor    = -amount_minor;
  withdrawal.available_at_ms = now_ms;
  withdrawal.description     = "Withdrawal of " + util::FormatMinor(amount_minor);
  withdrawal.created_at_ms   = now_ms;
  withdrawal.updated_at_ms   = now_ms;

  ThrowIfDbError(repository_->InsertLedgerEntry(*tx, withdrawal), "insert withdrawal for " + beneficiary_id);
  tx->Commit();
  return withdrawal.id;
}

void PayoutProcessor::RecordConflictingSuccess(const TransferRef& ref, const std::string& error) {
  SETTLEMENT_LOG_ERROR("transfer succeeded after withdrawal was reversed",
                       {StringField("withdrawal_id", ref.withdrawal_id), StringField("transfer_id", ref.transfer_id), StringField("error", error)});
  try {
    const auto record = intake::MakeFailedEvent("withdrawal:" + ref.withdrawal_id + ":submit", "transfer.succeeded",
                                                TransferSucceededEnvelope("withdrawal:" + ref.withdrawal_id + ":submit", ref), "", error,
                                                util::ToUnixMillis(now_()));
    RetryOnConflict("record_transfer_conflict", options_.max_attempts, [&] {
      auto tx = repository_->Begin();
      ThrowIfDbError(repository_->InsertFailedEvent(*tx, record), "dead-letter transfer conflict for withdrawal " + ref.withdrawal_id);
      tx->Commit();
    });
    SETTLEMENT_LOG_WARN("event dead-lettered", {StringField("failed_event_id", record.id), StringField("event_type", record.event_type),
                                                StringField("withdrawal_id", ref.withdrawal_id)});
  } catch (const std::exception& capture_error) {
    SETTLEMENT_LOG_ERROR("failed to dead-letter transfer conflict",
                         {StringField("withdrawal_id", ref.withdrawal_id), StringField("error", capture_error.what())});
  }
}

void PayoutProcessor::MarkPendingConfirmation(const std::string& withdrawal_id, const std::string& transfer_id) {
  RetryOnConflict("withdrawal_pending", options_.max_attempts, [&] {
    auto tx    = repository_->Begin();
    auto entry = repository_->GetLedgerEntry(*tx, withdrawal_id);
    if (!entry) {
      throw util::NotFound("withdrawal " + withdrawal_id + " not found");
    }
    // A processor event may already have settled it.
    if (entry->state != v1::ENTRY_STATE_AVAILABLE) {
      tx->Commit();
      return;
    }

    entry->state = v1::ENTRY_STATE_PENDING_CONFIRMATION;
    if (!transfer_id.empty()) {
      entry->external_payout_ref = transfer_id;
    }
    entry->updated_at_ms = util::ToUnixMillis(now_());
    ThrowIfDbError(repository_->UpdateLedgerEntry(*tx, *entry), "mark withdrawal " + withdrawal_id + " pending");
    tx->Commit();
  });
}

db::model::LedgerEntryRecord PayoutProcessor::LocateWithdrawal(db::Transaction& tx, const TransferRef& ref) {
  std::optional<db::model::LedgerEntryRecord> entry;
  if (!ref.withdrawal_id.empty()) {
    entry = repository_->GetLedgerEntry(tx, ref.withdrawal_id);
  }
  if (!entry && !ref.transfer_id.empty()) {
    entry = repository_->FindLedgerEntryByPayoutRef(tx, ref.transfer_id);
  }
  if (!entry) {
    throw util::NotFound("no withdrawal for withdrawal_id='" + ref.withdrawal_id + "' transfer_id='" + ref.transfer_id + "'");
  }
  if (entry->kind != v1::ENTRY_KIND_WITHDRAWAL) {
    throw util::InvalidState("ledger entry " + entry->id + " is not a withdrawal");
  }
  return *entry;
}

bool PayoutProcessor::ConfirmTransfer(const TransferRef& ref) {
  return RetryOnConflict("transfer_confirm", options_.max_attempts, [&] {
    auto tx    = repository_->Begin();
    auto entry = LocateWithdrawal(*tx, ref);

    if (entry.state == v1::ENTRY_STATE_PAID_OUT) {
      tx->Commit();
      return false;
    }
    if (entry.state == v1::ENTRY_STATE_FAILED || repository_->FindReversalOf(*tx, entry.id)) {
      throw util::InvalidState("transfer succeeded for withdrawal " + entry.id + " after it was reported failed");
    }
    RequireTransition(entry, v1::ENTRY_STATE_PAID_OUT);

    entry.state = v1::ENTRY_STATE_PAID_OUT;
    if (!ref.transfer_id.empty()) {
      entry.external_payout_ref = ref.transfer_id;
    }
    entry.updated_at_ms = util::ToUnixMillis(now_());
    ThrowIfDbError(repository_->UpdateLedgerEntry(*tx, entry), "mark withdrawal " + entry.id + " paid out");
    tx->Commit();

    SETTLEMENT_LOG_INFO("withdrawal paid out", {StringField("withdrawal_id", entry.id), StringField("transfer_id", entry.external_payout_ref)});
    return true;
  });
}

bool PayoutProcessor::FailTransfer(const TransferRef& ref, const std::string& failure_message) {
  return RetryOnConflict("transfer_fail", options_.max_attempts, [&] {
    auto tx       = repository_->Begin();
    auto entry    = LocateWithdrawal(*tx, ref);
    const bool ok = ReverseWithdrawal(*tx, std::move(entry), failure_message);
    tx->Commit();
    return ok;
  });
}

bool PayoutProcessor::ReverseWithdrawal(db::Transaction& tx, db::model::LedgerEntryRecord withdrawal, const std::string& failure_message) {
  if (repository_->FindReversalOf(tx, withdrawal.id)) {
    return false;
  }

  const int64_t now_ms = util::ToUnixMillis(now_());

  // A paid-out withdrawal keeps its state; the Reversal alone restores
  // the balance.
  if (withdrawal.state != v1::ENTRY_STATE_PAID_OUT && withdrawal.state != v1::ENTRY_STATE_FAILED) {
    RequireTransition(withdrawal, v1::ENTRY_STATE_FAILED);
    withdrawal.state         = v1::ENTRY_STATE_FAILED;
    withdrawal.updated_at_ms = now_ms;
    ThrowIfDbError(repository_->UpdateLedgerEntry(tx, withdrawal), "mark withdrawal " + withdrawal.id + " failed");
  }

  db::model::LedgerEntryRecord reversal;
  reversal.id                = util::NewId();
  reversal.beneficiary_id    = withdrawal.beneficiary_id;
  reversal.kind              = v1::ENTRY_KIND_REVERSAL;
  reversal.state             = v1::ENTRY_STATE_AVAILABLE;
  reversal.amount_minor      = -withdrawal.amount_minor;
  reversal.available_at_ms   = now_ms;
  reversal.reverses_entry_id = withdrawal.id;
  reversal.description       = "Reversal of withdrawal " + withdrawal.id + (failure_message.empty() ? "" : ": " + failure_message);
  reversal.created_at_ms     = now_ms;
  reversal.updated_at_ms     = now_ms;

  const auto inserted = repository_->InsertLedgerEntry(tx, reversal);
  if (inserted.code == db::ErrorCode::AlreadyExists) {
    // Lost a race with another failure report; the retry sees its Reversal.
    throw util::Transient("withdrawal " + withdrawal.id + " reversed concurrently");
  }
  ThrowIfDbError(inserted, "insert reversal for withdrawal " + withdrawal.id);

  SETTLEMENT_LOG_INFO("withdrawal reversed", {StringField("withdrawal_id", withdrawal.id), StringField("reversal_id", reversal.id),
                                              StringField("beneficiary_id", withdrawal.beneficiary_id.value_or("")),
                                              AmountField("amount", reversal.amount_minor), StringField("reason", failure_message)});
  return true;
}

} // namespace settlement::core
