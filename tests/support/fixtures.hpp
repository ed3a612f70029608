#pragma once

#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/transfer/transfer_gateway.hpp"
#include "internal/util/time.hpp"

namespace settlement::testing {

namespace v1 = settlement::engine::core::v1;

// 2023-11-14T22:13:20Z
constexpr int64_t kEpochMs = 1'700'000'000'000;

constexpr int64_t kDayMs = 24LL * 3600 * 1000;

// Clock tests move by hand. Copies share the same time.
class ManualClock {
 public:
  ManualClock() : now_ms_(std::make_shared<int64_t>(kEpochMs)) {
  }

  util::NowFn Fn() const {
    auto now_ms = now_ms_;
    return [now_ms] { return util::FromUnixMillis(*now_ms); };
  }

  int64_t NowMs() const {
    return *now_ms_;
  }

  void Advance(std::chrono::milliseconds by) {
    *now_ms_ += by.count();
  }

 private:
  std::shared_ptr<int64_t> now_ms_;
};

// Replays scripted results; succeeds once the script runs out.
class FakeTransferGateway final : public transfer::TransferGateway {
 public:
  transfer::TransferResult Submit(const transfer::TransferRequest& request, std::chrono::milliseconds) override {
    std::scoped_lock lock(mutex_);
    requests_.push_back(request);
    if (!script_.empty()) {
      auto result = script_.front();
      script_.pop_front();
      return result;
    }
    return {transfer::TransferOutcome::kSucceeded, "tr_" + std::to_string(requests_.size()), {}};
  }

  void Then(transfer::TransferOutcome outcome, std::string transfer_id = {}, std::string message = {}) {
    std::scoped_lock lock(mutex_);
    script_.push_back({outcome, std::move(transfer_id), std::move(message)});
  }

  std::vector<transfer::TransferRequest> Requests() const {
    std::scoped_lock lock(mutex_);
    return requests_;
  }

 private:
  mutable std::mutex                     mutex_;
  std::deque<transfer::TransferResult>   script_;
  std::vector<transfer::TransferRequest> requests_;
};

inline db::model::OrderRecord MakeOrder(const std::string& id, int64_t gross_minor, std::optional<std::string> referrer = std::nullopt,
                                        std::optional<std::string> facilitator = std::nullopt) {
  db::model::OrderRecord order;
  order.id                   = id;
  order.payer_id             = "payer-" + id;
  order.fulfiller_id         = "fulfiller-" + id;
  order.referrer_id          = std::move(referrer);
  order.facilitator_id       = std::move(facilitator);
  order.gross_minor          = gross_minor;
  order.fulfillment_end_ms   = kEpochMs;
  order.status               = v1::ORDER_STATUS_UNPAID;
  order.context.service_name = "Deep tissue massage";
  order.created_at_ms        = kEpochMs;
  return order;
}

inline void InsertOrder(db::Repository& repo, const db::model::OrderRecord& order) {
  auto tx = repo.Begin();
  if (!repo.InsertOrder(*tx, order)) {
    throw std::runtime_error("insert order " + order.id + " failed");
  }
  tx->Commit();
}

inline std::vector<db::model::LedgerEntryRecord> Ledger(db::Repository& repo, const std::string& order_id) {
  auto tx = repo.Begin();
  return repo.ListLedgerEntriesByOrder(*tx, order_id);
}

inline db::model::BalanceRecord Balance(db::Repository& repo, const std::string& beneficiary_id) {
  auto tx = repo.Begin();
  return repo.SummarizeBalance(*tx, beneficiary_id);
}

inline std::optional<db::model::LedgerEntryRecord> Entry(db::Repository& repo, const std::string& id) {
  auto tx = repo.Begin();
  return repo.GetLedgerEntry(*tx, id);
}

inline std::optional<db::model::OrderRecord> Order(db::Repository& repo, const std::string& id) {
  auto tx = repo.Begin();
  return repo.GetOrder(*tx, id);
}

// Credits an available earning straight into the ledger.
inline void SeedAvailable(db::Repository& repo, const std::string& beneficiary_id, int64_t amount_minor, const std::string& order_id = "seed") {
  db::model::LedgerEntryRecord entry;
  entry.id              = "seed-" + beneficiary_id + "-" + std::to_string(amount_minor) + "-" + order_id;
  entry.order_id        = order_id;
  entry.beneficiary_id  = beneficiary_id;
  entry.kind            = v1::ENTRY_KIND_FULFILLER_PAYOUT;
  entry.state           = v1::ENTRY_STATE_AVAILABLE;
  entry.amount_minor    = amount_minor;
  entry.available_at_ms = kEpochMs;
  entry.created_at_ms   = kEpochMs;

  auto tx = repo.Begin();
  if (!repo.InsertLedgerEntry(*tx, entry)) {
    throw std::runtime_error("seed ledger entry failed");
  }
  tx->Commit();
}

} // namespace settlement::testing
