#pragma once

#include <atomic>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/util/errors.hpp"

namespace settlement::testing {

// Forwards to another repository and injects store failures on demand.
class FlakyRepository final : public db::Repository {
 public:
  explicit FlakyRepository(std::shared_ptr<db::Repository> inner) : inner_(std::move(inner)) {
  }

  // The next n locking order reads throw util::Transient.
  void FailOrderLocks(int n) {
    order_lock_failures_ = n;
  }

  void FailCaptureWrites(bool fail) {
    fail_capture_ = fail;
  }

  int OrderLockFailuresLeft() const {
    return order_lock_failures_;
  }

  std::unique_ptr<db::Transaction> Begin() override {
    return inner_->Begin();
  }

  db::Result InsertOrder(db::Transaction& tx, const db::model::OrderRecord& r) override {
    return inner_->InsertOrder(tx, r);
  }
  std::optional<db::model::OrderRecord> GetOrder(db::Transaction& tx, const std::string& id) override {
    return inner_->GetOrder(tx, id);
  }
  std::optional<db::model::OrderRecord> GetOrderForUpdate(db::Transaction& tx, const std::string& id) override {
    if (order_lock_failures_ > 0) {
      --order_lock_failures_;
      throw util::Transient("lock timeout on order " + id);
    }
    return inner_->GetOrderForUpdate(tx, id);
  }
  std::optional<db::model::OrderRecord> FindOrderByPaymentRef(db::Transaction& tx, const std::string& ref) override {
    return inner_->FindOrderByPaymentRef(tx, ref);
  }
  db::Result UpdateOrder(db::Transaction& tx, const db::model::OrderRecord& r) override {
    return inner_->UpdateOrder(tx, r);
  }

  db::Result InsertLedgerEntry(db::Transaction& tx, const db::model::LedgerEntryRecord& r) override {
    return inner_->InsertLedgerEntry(tx, r);
  }
  std::optional<db::model::LedgerEntryRecord> GetLedgerEntry(db::Transaction& tx, const std::string& id) override {
    return inner_->GetLedgerEntry(tx, id);
  }
  std::optional<db::model::LedgerEntryRecord> FindLedgerEntryByPayoutRef(db::Transaction& tx, const std::string& ref) override {
    return inner_->FindLedgerEntryByPayoutRef(tx, ref);
  }
  std::optional<db::model::LedgerEntryRecord> FindReversalOf(db::Transaction& tx, const std::string& id) override {
    return inner_->FindReversalOf(tx, id);
  }
  std::vector<db::model::LedgerEntryRecord> ListLedgerEntriesByOrder(db::Transaction& tx, const std::string& id) override {
    return inner_->ListLedgerEntriesByOrder(tx, id);
  }
  db::Result UpdateLedgerEntry(db::Transaction& tx, const db::model::LedgerEntryRecord& r) override {
    return inner_->UpdateLedgerEntry(tx, r);
  }
  db::Result PromoteMaturedEntries(db::Transaction& tx, int64_t now_ms, uint64_t& promoted) override {
    return inner_->PromoteMaturedEntries(tx, now_ms, promoted);
  }

  db::Result LockBeneficiary(db::Transaction& tx, const std::string& id) override {
    return inner_->LockBeneficiary(tx, id);
  }
  int64_t SumAvailableBalance(db::Transaction& tx, const std::string& id) override {
    return inner_->SumAvailableBalance(tx, id);
  }
  db::model::BalanceRecord SummarizeBalance(db::Transaction& tx, const std::string& id) override {
    return inner_->SummarizeBalance(tx, id);
  }

  db::Result InsertFailedEvent(db::Transaction& tx, const db::model::FailedEventRecord& r) override {
    if (fail_capture_) {
      return db::Result::Err(db::ErrorCode::IOError, "disk full");
    }
    return inner_->InsertFailedEvent(tx, r);
  }
  std::optional<db::model::FailedEventRecord> GetFailedEvent(db::Transaction& tx, const std::string& id) override {
    return inner_->GetFailedEvent(tx, id);
  }
  std::vector<db::model::FailedEventRecord> ListFailedEvents(db::Transaction& tx, bool include_resolved, uint32_t limit) override {
    return inner_->ListFailedEvents(tx, include_resolved, limit);
  }
  db::Result UpdateFailedEvent(db::Transaction& tx, const db::model::FailedEventRecord& r) override {
    return inner_->UpdateFailedEvent(tx, r);
  }

  db::Result EnqueueRetry(db::Transaction& tx, const db::model::RetryRecord& r) override {
    if (fail_capture_) {
      return db::Result::Err(db::ErrorCode::IOError, "disk full");
    }
    return inner_->EnqueueRetry(tx, r);
  }
  std::optional<db::model::RetryRecord> ClaimNextRetry(db::Transaction& tx, const std::string& owner, int64_t now_ms, int64_t lease_ms) override {
    return inner_->ClaimNextRetry(tx, owner, now_ms, lease_ms);
  }
  db::Result UpdateRetry(db::Transaction& tx, const db::model::RetryRecord& r) override {
    return inner_->UpdateRetry(tx, r);
  }
  db::Result DeleteRetry(db::Transaction& tx, const std::string& id) override {
    return inner_->DeleteRetry(tx, id);
  }
  uint64_t CountRetries(db::Transaction& tx) override {
    return inner_->CountRetries(tx);
  }

 private:
  std::shared_ptr<db::Repository> inner_;
  std::atomic<int>                order_lock_failures_{0};
  std::atomic<bool>               fail_capture_{false};
};

} // namespace settlement::testing
