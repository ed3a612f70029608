#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/balance_record.hpp"
#include "internal/db/model/failed_event_record.hpp"
#include "internal/db/model/ledger_entry_record.hpp"
#include "internal/db/model/order_record.hpp"
#include "internal/db/model/retry_record.hpp"

namespace settlement::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes require a Transaction
  - Reads inside a transaction see its writes
  - A multi-entry write is visible all together or not at all
  - Ledger entries are append-only: there is no delete

  The DB is the source of truth for:
    orders and their payment status
    the ledger (balances are derived from it, never stored)
    dead-lettered and queued processor events
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Orders
  // ---------------------------------------------------------------------

  virtual Result InsertOrder(Transaction&, const model::OrderRecord&) = 0;

  virtual std::optional<model::OrderRecord> GetOrder(Transaction&, const std::string& id) = 0;

  // Same as GetOrder, and blocks concurrent settlement of the same order
  // until the transaction ends.
  virtual std::optional<model::OrderRecord> GetOrderForUpdate(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::OrderRecord> FindOrderByPaymentRef(Transaction&, const std::string& payment_ref) = 0;

  virtual Result UpdateOrder(Transaction&, const model::OrderRecord&) = 0;

  // ---------------------------------------------------------------------
  // Ledger
  // ---------------------------------------------------------------------

  virtual Result InsertLedgerEntry(Transaction&, const model::LedgerEntryRecord&) = 0;

  virtual std::optional<model::LedgerEntryRecord> GetLedgerEntry(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::LedgerEntryRecord> FindLedgerEntryByPayoutRef(Transaction&, const std::string& external_payout_ref) = 0;

  // The Reversal entry whose reverses_entry_id is entry_id, if any.
  virtual std::optional<model::LedgerEntryRecord> FindReversalOf(Transaction&, const std::string& entry_id) = 0;

  // Ordered by insertion.
  virtual std::vector<model::LedgerEntryRecord> ListLedgerEntriesByOrder(Transaction&, const std::string& order_id) = 0;

  // Persists state, available_at_ms, external_payout_ref and description.
  virtual Result UpdateLedgerEntry(Transaction&, const model::LedgerEntryRecord&) = 0;

  // held -> available for every entry with available_at_ms <= now_ms.
  virtual Result PromoteMaturedEntries(Transaction&, int64_t now_ms, uint64_t& promoted) = 0;

  // ---------------------------------------------------------------------
  // Balances
  // ---------------------------------------------------------------------

  // Serializes withdrawals of one beneficiary until the transaction ends.
  virtual Result LockBeneficiary(Transaction&, const std::string& beneficiary_id) = 0;

  virtual int64_t SumAvailableBalance(Transaction&, const std::string& beneficiary_id) = 0;

  virtual model::BalanceRecord SummarizeBalance(Transaction&, const std::string& beneficiary_id) = 0;

  // ---------------------------------------------------------------------
  // Dead letters
  // ---------------------------------------------------------------------

  virtual Result InsertFailedEvent(Transaction&, const model::FailedEventRecord&) = 0;

  virtual std::optional<model::FailedEventRecord> GetFailedEvent(Transaction&, const std::string& id) = 0;

  // Oldest first.
  virtual std::vector<model::FailedEventRecord> ListFailedEvents(Transaction&, bool include_resolved, uint32_t limit) = 0;

  // Persists error_message, resolved_at_ms and replay_attempts.
  virtual Result UpdateFailedEvent(Transaction&, const model::FailedEventRecord&) = 0;

  // ---------------------------------------------------------------------
  // Retry queue
  // ---------------------------------------------------------------------

  virtual Result EnqueueRetry(Transaction&, const model::RetryRecord&) = 0;

  // Oldest due row that is unleased or whose lease expired; the returned
  // row already carries the new lease.
  virtual std::optional<model::RetryRecord> ClaimNextRetry(Transaction&, const std::string& owner, int64_t now_ms, int64_t lease_ms) = 0;

  // Persists attempts, next_attempt_at_ms, last_error and the lease columns.
  virtual Result UpdateRetry(Transaction&, const model::RetryRecord&) = 0;

  virtual Result DeleteRetry(Transaction&, const std::string& id) = 0;

  virtual uint64_t CountRetries(Transaction&) = 0;
};

} // namespace settlement::db
