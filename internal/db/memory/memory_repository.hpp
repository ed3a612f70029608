#pragma once

#include <cstdint>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace settlement::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                             InsertOrder(Transaction&, const model::OrderRecord&) override;
  std::optional<model::OrderRecord> GetOrder(Transaction&, const std::string&) override;
  std::optional<model::OrderRecord> GetOrderForUpdate(Transaction&, const std::string&) override;
  std::optional<model::OrderRecord> FindOrderByPaymentRef(Transaction&, const std::string&) override;
  Result                             UpdateOrder(Transaction&, const model::OrderRecord&) override;

  Result                                   InsertLedgerEntry(Transaction&, const model::LedgerEntryRecord&) override;
  std::optional<model::LedgerEntryRecord> GetLedgerEntry(Transaction&, const std::string&) override;
  std::optional<model::LedgerEntryRecord> FindLedgerEntryByPayoutRef(Transaction&, const std::string&) override;
  std::optional<model::LedgerEntryRecord> FindReversalOf(Transaction&, const std::string&) override;
  std::vector<model::LedgerEntryRecord>   ListLedgerEntriesByOrder(Transaction&, const std::string&) override;
  Result                                   UpdateLedgerEntry(Transaction&, const model::LedgerEntryRecord&) override;
  Result                                   PromoteMaturedEntries(Transaction&, int64_t now_ms, uint64_t& promoted) override;

  Result               LockBeneficiary(Transaction&, const std::string&) override;
  int64_t              SumAvailableBalance(Transaction&, const std::string&) override;
  model::BalanceRecord SummarizeBalance(Transaction&, const std::string&) override;

  Result                                   InsertFailedEvent(Transaction&, const model::FailedEventRecord&) override;
  std::optional<model::FailedEventRecord> GetFailedEvent(Transaction&, const std::string&) override;
  std::vector<model::FailedEventRecord>   ListFailedEvents(Transaction&, bool include_resolved, uint32_t limit) override;
  Result                                   UpdateFailedEvent(Transaction&, const model::FailedEventRecord&) override;

  Result                             EnqueueRetry(Transaction&, const model::RetryRecord&) override;
  std::optional<model::RetryRecord> ClaimNextRetry(Transaction&, const std::string& owner, int64_t now_ms, int64_t lease_ms) override;
  Result                             UpdateRetry(Transaction&, const model::RetryRecord&) override;
  Result                             DeleteRetry(Transaction&, const std::string&) override;
  uint64_t                           CountRetries(Transaction&) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::OrderRecord> orders;

    // Insertion ordered; entries are never erased.
    std::vector<model::LedgerEntryRecord>    ledger;
    std::unordered_map<std::string, size_t> ledger_index;

    std::vector<model::FailedEventRecord>    failed_events;
    std::unordered_map<std::string, size_t> failed_event_index;

    std::vector<model::RetryRecord> retries;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace settlement::db::memory
