#include "memory_repository.hpp"

#include <algorithm>

#include "internal/model/entry_state_machine.hpp"
#include "memory_tx.hpp"

namespace settlement::db::memory {

namespace v1 = settlement::engine::core::v1;

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Orders
// ------------------------------------------------------------------

Result MemoryRepository::InsertOrder(Transaction& t, const model::OrderRecord& r) {
  if (TX(t).View().orders.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "order " + r.id);
  TX(t).Mutable().orders[r.id] = r;
  return Result::Ok();
}

std::optional<model::OrderRecord> MemoryRepository::GetOrder(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.orders.find(id);
  if (it == s.orders.end()) return std::nullopt;
  return it->second;
}

std::optional<model::OrderRecord> MemoryRepository::GetOrderForUpdate(Transaction& t, const std::string& id) {
  // Exclusivity comes from the commit-time version check.
  return GetOrder(t, id);
}

std::optional<model::OrderRecord> MemoryRepository::FindOrderByPaymentRef(Transaction& t, const std::string& payment_ref) {
  if (payment_ref.empty()) return std::nullopt;
  for (const auto& [_, order] : TX(t).View().orders) {
    if (order.payment_ref == payment_ref) return order;
  }
  return std::nullopt;
}

Result MemoryRepository::UpdateOrder(Transaction& t, const model::OrderRecord& r) {
  const auto& view = TX(t).View();
  if (!view.orders.contains(r.id)) return Result::Err(ErrorCode::NotFound, "order " + r.id);
  if (!r.payment_ref.empty()) {
    for (const auto& [id, order] : view.orders) {
      if (id != r.id && order.payment_ref == r.payment_ref) {
        return Result::Err(ErrorCode::AlreadyExists, "payment_ref already used by order " + id);
      }
    }
  }
  TX(t).Mutable().orders[r.id] = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Ledger
// ------------------------------------------------------------------

Result MemoryRepository::InsertLedgerEntry(Transaction& t, const model::LedgerEntryRecord& r) {
  const auto& view = TX(t).View();
  if (view.ledger_index.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "ledger entry " + r.id);
  if (!r.reverses_entry_id.empty()) {
    for (const auto& e : view.ledger) {
      if (e.reverses_entry_id == r.reverses_entry_id) {
        return Result::Err(ErrorCode::AlreadyExists, "entry " + r.reverses_entry_id + " already reversed");
      }
    }
  }

  auto& s = TX(t).Mutable();
  s.ledger_index[r.id] = s.ledger.size();
  s.ledger.push_back(r);
  return Result::Ok();
}

std::optional<model::LedgerEntryRecord> MemoryRepository::GetLedgerEntry(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.ledger_index.find(id);
  if (it == s.ledger_index.end()) return std::nullopt;
  return s.ledger[it->second];
}

std::optional<model::LedgerEntryRecord> MemoryRepository::FindLedgerEntryByPayoutRef(Transaction& t, const std::string& ref) {
  if (ref.empty()) return std::nullopt;
  for (const auto& e : TX(t).View().ledger) {
    if (e.external_payout_ref == ref) return e;
  }
  return std::nullopt;
}

std::optional<model::LedgerEntryRecord> MemoryRepository::FindReversalOf(Transaction& t, const std::string& entry_id) {
  for (const auto& e : TX(t).View().ledger) {
    if (e.reverses_entry_id == entry_id) return e;
  }
  return std::nullopt;
}

std::vector<model::LedgerEntryRecord> MemoryRepository::ListLedgerEntriesByOrder(Transaction& t, const std::string& order_id) {
  std::vector<model::LedgerEntryRecord> out;
  for (const auto& e : TX(t).View().ledger)
    if (e.order_id == order_id) out.push_back(e);
  return out;
}

Result MemoryRepository::UpdateLedgerEntry(Transaction& t, const model::LedgerEntryRecord& r) {
  auto it = TX(t).View().ledger_index.find(r.id);
  if (it == TX(t).View().ledger_index.end()) return Result::Err(ErrorCode::NotFound, "ledger entry " + r.id);

  auto& stored               = TX(t).Mutable().ledger[it->second];
  stored.state               = r.state;
  stored.available_at_ms     = r.available_at_ms;
  stored.external_payout_ref = r.external_payout_ref;
  stored.description         = r.description;
  stored.updated_at_ms       = r.updated_at_ms;
  return Result::Ok();
}

Result MemoryRepository::PromoteMaturedEntries(Transaction& t, int64_t now_ms, uint64_t& promoted) {
  promoted = 0;
  const auto matured = [now_ms](const model::LedgerEntryRecord& e) {
    return e.state == v1::ENTRY_STATE_HELD && e.available_at_ms && *e.available_at_ms <= now_ms;
  };

  const auto& view = TX(t).View().ledger;
  if (std::none_of(view.begin(), view.end(), matured)) return Result::Ok();

  for (auto& e : TX(t).Mutable().ledger) {
    if (!matured(e)) continue;
    e.state         = v1::ENTRY_STATE_AVAILABLE;
    e.updated_at_ms = now_ms;
    ++promoted;
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Balances
// ------------------------------------------------------------------

Result MemoryRepository::LockBeneficiary(Transaction&, const std::string&) {
  // Concurrent writers are serialized by the commit-time version check.
  return Result::Ok();
}

int64_t MemoryRepository::SumAvailableBalance(Transaction& t, const std::string& beneficiary_id) {
  int64_t total = 0;
  for (const auto& e : TX(t).View().ledger) {
    if (e.beneficiary_id == beneficiary_id && settlement::model::CountsTowardAvailable(e.kind, e.state)) total += e.amount_minor;
  }
  return total;
}

model::BalanceRecord MemoryRepository::SummarizeBalance(Transaction& t, const std::string& beneficiary_id) {
  model::BalanceRecord balance;
  for (const auto& e : TX(t).View().ledger) {
    if (e.beneficiary_id != beneficiary_id || !settlement::model::IsBalanceKind(e.kind)) continue;

    if (settlement::model::CountsTowardAvailable(e.kind, e.state)) balance.available_minor += e.amount_minor;
    if (e.state == v1::ENTRY_STATE_HELD) balance.held_minor += e.amount_minor;
    if (e.state == v1::ENTRY_STATE_DISPUTED) balance.disputed_minor += e.amount_minor;
    if (settlement::model::IsEarningKind(e.kind) && e.amount_minor > 0) balance.lifetime_total_minor += e.amount_minor;
  }
  return balance;
}

// ------------------------------------------------------------------
// Dead letters
// ------------------------------------------------------------------

Result MemoryRepository::InsertFailedEvent(Transaction& t, const model::FailedEventRecord& r) {
  if (TX(t).View().failed_event_index.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "failed event " + r.id);
  auto& s                   = TX(t).Mutable();
  s.failed_event_index[r.id] = s.failed_events.size();
  s.failed_events.push_back(r);
  return Result::Ok();
}

std::optional<model::FailedEventRecord> MemoryRepository::GetFailedEvent(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.failed_event_index.find(id);
  if (it == s.failed_event_index.end()) return std::nullopt;
  return s.failed_events[it->second];
}

std::vector<model::FailedEventRecord> MemoryRepository::ListFailedEvents(Transaction& t, bool include_resolved, uint32_t limit) {
  std::vector<model::FailedEventRecord> out;
  for (const auto& e : TX(t).View().failed_events) {
    if (limit > 0 && out.size() >= limit) break;
    if (!include_resolved && e.resolved_at_ms) continue;
    out.push_back(e);
  }
  return out;
}

Result MemoryRepository::UpdateFailedEvent(Transaction& t, const model::FailedEventRecord& r) {
  auto it = TX(t).View().failed_event_index.find(r.id);
  if (it == TX(t).View().failed_event_index.end()) return Result::Err(ErrorCode::NotFound, "failed event " + r.id);

  auto& stored           = TX(t).Mutable().failed_events[it->second];
  stored.error_message   = r.error_message;
  stored.resolved_at_ms  = r.resolved_at_ms;
  stored.replay_attempts = r.replay_attempts;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Retry queue
// ------------------------------------------------------------------

Result MemoryRepository::EnqueueRetry(Transaction& t, const model::RetryRecord& r) {
  for (const auto& existing : TX(t).View().retries) {
    if (existing.id == r.id) return Result::Err(ErrorCode::AlreadyExists, "retry " + r.id);
  }
  TX(t).Mutable().retries.push_back(r);
  return Result::Ok();
}

std::optional<model::RetryRecord> MemoryRepository::ClaimNextRetry(Transaction& t, const std::string& owner, int64_t now_ms, int64_t lease_ms) {
  const auto& view = TX(t).View().retries;
  auto        it   = std::find_if(view.begin(), view.end(), [now_ms](const model::RetryRecord& r) {
    return r.next_attempt_at_ms <= now_ms && (r.lease_owner.empty() || r.lease_expires_at_ms <= now_ms);
  });
  if (it == view.end()) return std::nullopt;

  auto& claimed               = TX(t).Mutable().retries[static_cast<size_t>(it - view.begin())];
  claimed.lease_owner         = owner;
  claimed.lease_expires_at_ms = now_ms + lease_ms;
  return claimed;
}

Result MemoryRepository::UpdateRetry(Transaction& t, const model::RetryRecord& r) {
  const auto& view = TX(t).View().retries;
  auto it = std::find_if(view.begin(), view.end(), [&](const model::RetryRecord& e) { return e.id == r.id; });
  if (it == view.end()) return Result::Err(ErrorCode::NotFound, "retry " + r.id);

  auto& stored               = TX(t).Mutable().retries[static_cast<size_t>(it - view.begin())];
  stored.attempts            = r.attempts;
  stored.next_attempt_at_ms  = r.next_attempt_at_ms;
  stored.last_error          = r.last_error;
  stored.lease_owner         = r.lease_owner;
  stored.lease_expires_at_ms = r.lease_expires_at_ms;
  return Result::Ok();
}

Result MemoryRepository::DeleteRetry(Transaction& t, const std::string& id) {
  auto& retries = TX(t).Mutable().retries;
  std::erase_if(retries, [&](const model::RetryRecord& r) { return r.id == id; });
  return Result::Ok();
}

uint64_t MemoryRepository::CountRetries(Transaction& t) {
  return TX(t).View().retries.size();
}

} // namespace settlement::db::memory
