#include "pg_repository.hpp"

#include "internal/db/sql/balance_sql.hpp"
#include "internal/util/errors.hpp"

namespace settlement::db::postgres {

namespace v1 = settlement::engine::core::v1;

namespace {

constexpr const char* kOrderColumns =
    "id,payer_id,fulfiller_id,referrer_id,facilitator_id,gross_minor,payment_ref,fulfillment_end_ms,status,paid_at_ms,"
    "service_name,subject,payer_name,fulfiller_name,facilitator_name,created_at_ms";

constexpr const char* kEntryColumns =
    "id,order_id,beneficiary_id,kind,amount_minor,state,available_at_ms,external_payout_ref,reverses_entry_id,description,"
    "service_name,subject,payer_name,fulfiller_name,facilitator_name,created_at_ms,updated_at_ms";

constexpr const char* kFailedEventColumns = "id,event_id,event_type,raw_payload,error_message,order_id,created_at_ms,resolved_at_ms,replay_attempts";

constexpr const char* kRetryColumns =
    "id,event_id,event_type,raw_payload,order_id,attempts,next_attempt_at_ms,last_error,lease_owner,lease_expires_at_ms,created_at_ms";

bool IsRetryableSqlState(const std::string& state) {
  // serialization_failure, deadlock_detected, lock_not_available, query_canceled (lock_timeout)
  return state == "40001" || state == "40P01" || state == "55P03" || state == "57014";
}

// Reads have no Result channel: lock waits and serialization failures
// surface as util::Transient, everything else as-is.
template <typename Fn>
auto Guard(Fn&& fn) {
  try {
    return fn();
  } catch (const pqxx::sql_error& e) {
    if (IsRetryableSqlState(e.sqlstate())) throw util::Transient(std::string("postgres: ") + e.what());
    throw;
  } catch (const pqxx::broken_connection& e) {
    throw util::Transient(std::string("postgres connection: ") + e.what());
  }
}

std::optional<std::string> NullIfEmpty(const std::string& s) {
  if (s.empty()) return std::nullopt;
  return s;
}

std::string Text(const pqxx::field& f) {
  return f.is_null() ? std::string() : std::string(f.c_str());
}

std::optional<std::string> OptText(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return std::string(f.c_str());
}

std::optional<int64_t> OptI64(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return f.as<int64_t>();
}

model::OrderRecord ReadOrder(const pqxx::row& row) {
  model::OrderRecord r;
  r.id                       = row[0].c_str();
  r.payer_id                 = row[1].c_str();
  r.fulfiller_id             = row[2].c_str();
  r.referrer_id              = OptText(row[3]);
  r.facilitator_id           = OptText(row[4]);
  r.gross_minor              = row[5].as<int64_t>();
  r.payment_ref              = Text(row[6]);
  r.fulfillment_end_ms       = row[7].as<int64_t>();
  r.status                   = static_cast<v1::OrderStatus>(row[8].as<int>());
  r.paid_at_ms               = row[9].as<int64_t>();
  r.context.service_name     = Text(row[10]);
  r.context.subject          = Text(row[11]);
  r.context.payer_name       = Text(row[12]);
  r.context.fulfiller_name   = Text(row[13]);
  r.context.facilitator_name = Text(row[14]);
  r.created_at_ms            = row[15].as<int64_t>();
  return r;
}

model::LedgerEntryRecord ReadEntry(const pqxx::row& row) {
  model::LedgerEntryRecord r;
  r.id                       = row[0].c_str();
  r.order_id                 = Text(row[1]);
  r.beneficiary_id           = OptText(row[2]);
  r.kind                     = static_cast<v1::EntryKind>(row[3].as<int>());
  r.amount_minor             = row[4].as<int64_t>();
  r.state                    = static_cast<v1::EntryState>(row[5].as<int>());
  r.available_at_ms          = OptI64(row[6]);
  r.external_payout_ref      = Text(row[7]);
  r.reverses_entry_id        = Text(row[8]);
  r.description              = Text(row[9]);
  r.context.service_name     = Text(row[10]);
  r.context.subject          = Text(row[11]);
  r.context.payer_name       = Text(row[12]);
  r.context.fulfiller_name   = Text(row[13]);
  r.context.facilitator_name = Text(row[14]);
  r.created_at_ms            = row[15].as<int64_t>();
  r.updated_at_ms            = row[16].as<int64_t>();
  return r;
}

model::FailedEventRecord ReadFailedEvent(const pqxx::row& row) {
  model::FailedEventRecord r;
  r.id              = row[0].c_str();
  r.event_id        = Text(row[1]);
  r.event_type      = Text(row[2]);
  r.raw_payload     = Text(row[3]);
  r.error_message   = Text(row[4]);
  r.order_id        = Text(row[5]);
  r.created_at_ms   = row[6].as<int64_t>();
  r.resolved_at_ms  = OptI64(row[7]);
  r.replay_attempts = row[8].as<uint32_t>();
  return r;
}

model::RetryRecord ReadRetry(const pqxx::row& row) {
  model::RetryRecord r;
  r.id                  = row[0].c_str();
  r.event_id            = Text(row[1]);
  r.event_type          = Text(row[2]);
  r.raw_payload         = Text(row[3]);
  r.order_id            = Text(row[4]);
  r.attempts            = row[5].as<uint32_t>();
  r.next_attempt_at_ms  = row[6].as<int64_t>();
  r.last_error          = Text(row[7]);
  r.lease_owner         = Text(row[8]);
  r.lease_expires_at_ms = row[9].as<int64_t>();
  r.created_at_ms       = row[10].as<int64_t>();
  return r;
}

template <typename Record, typename ReadFn>
std::optional<Record> First(const pqxx::result& res, ReadFn&& read) {
  if (res.empty()) return std::nullopt;
  return read(res[0]);
}

template <typename Record, typename ReadFn>
std::vector<Record> All(const pqxx::result& res, ReadFn&& read) {
  std::vector<Record> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(read(row));
  return out;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return Guard([&]() -> std::unique_ptr<db::Transaction> { return std::make_unique<PgTransaction>(pool_); });
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (const auto* sql_error = dynamic_cast<const pqxx::sql_error*>(&e)) {
    const auto& state = sql_error->sqlstate();
    if (state == "23505") return Result::Err(ErrorCode::AlreadyExists, e.what());
    if (state.rfind("23", 0) == 0) return Result::Err(ErrorCode::ConstraintViolation, e.what());
    if (state == "40001") return Result::Err(ErrorCode::SerializationFailure, e.what());
    if (state == "40P01") return Result::Err(ErrorCode::Conflict, e.what());
    if (state == "55P03" || state == "57014") return Result::Err(ErrorCode::Busy, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Orders
// ------------------------------------------------------------------

Result PgRepository::InsertOrder(Transaction& t, const model::OrderRecord& r) {
  try {
    TX(t).Work().exec_params(std::string("INSERT INTO orders(") + kOrderColumns +
                                 ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16)",
                             r.id, r.payer_id, r.fulfiller_id, r.referrer_id, r.facilitator_id, r.gross_minor, NullIfEmpty(r.payment_ref),
                             r.fulfillment_end_ms, static_cast<int>(r.status), r.paid_at_ms, r.context.service_name, r.context.subject,
                             r.context.payer_name, r.context.fulfiller_name, r.context.facilitator_name, r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::OrderRecord> PgRepository::GetOrder(Transaction& t, const std::string& id) {
  return Guard([&] {
    auto res = TX(t).Work().exec_params(std::string("SELECT ") + kOrderColumns + " FROM orders WHERE id=$1", id);
    return First<model::OrderRecord>(res, ReadOrder);
  });
}

std::optional<model::OrderRecord> PgRepository::GetOrderForUpdate(Transaction& t, const std::string& id) {
  return Guard([&] { return First<model::OrderRecord>(TX(t).Work().exec_prepared("get_order_for_update", id), ReadOrder); });
}

std::optional<model::OrderRecord> PgRepository::FindOrderByPaymentRef(Transaction& t, const std::string& payment_ref) {
  if (payment_ref.empty()) return std::nullopt;
  return Guard([&] {
    auto res = TX(t).Work().exec_params(std::string("SELECT ") + kOrderColumns + " FROM orders WHERE payment_ref=$1", payment_ref);
    return First<model::OrderRecord>(res, ReadOrder);
  });
}

Result PgRepository::UpdateOrder(Transaction& t, const model::OrderRecord& r) {
  try {
    auto res = TX(t).Work().exec_params("UPDATE orders SET payment_ref=$2,status=$3,paid_at_ms=$4 WHERE id=$1", r.id, NullIfEmpty(r.payment_ref),
                                        static_cast<int>(r.status), r.paid_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "order " + r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Ledger
// ------------------------------------------------------------------

Result PgRepository::InsertLedgerEntry(Transaction& t, const model::LedgerEntryRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_ledger_entry", r.id, NullIfEmpty(r.order_id), r.beneficiary_id, static_cast<int>(r.kind), r.amount_minor,
                               static_cast<int>(r.state), r.available_at_ms, NullIfEmpty(r.external_payout_ref), NullIfEmpty(r.reverses_entry_id),
                               r.description, r.context.service_name, r.context.subject, r.context.payer_name, r.context.fulfiller_name,
                               r.context.facilitator_name, r.created_at_ms, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::LedgerEntryRecord> PgRepository::GetLedgerEntry(Transaction& t, const std::string& id) {
  return Guard([&] {
    auto res = TX(t).Work().exec_params(std::string("SELECT ") + kEntryColumns + " FROM ledger_entries WHERE id=$1", id);
    return First<model::LedgerEntryRecord>(res, ReadEntry);
  });
}

std::optional<model::LedgerEntryRecord> PgRepository::FindLedgerEntryByPayoutRef(Transaction& t, const std::string& ref) {
  if (ref.empty()) return std::nullopt;
  return Guard([&] {
    auto res =
        TX(t).Work().exec_params(std::string("SELECT ") + kEntryColumns + " FROM ledger_entries WHERE external_payout_ref=$1 ORDER BY seq LIMIT 1", ref);
    return First<model::LedgerEntryRecord>(res, ReadEntry);
  });
}

std::optional<model::LedgerEntryRecord> PgRepository::FindReversalOf(Transaction& t, const std::string& entry_id) {
  return Guard([&] {
    auto res = TX(t).Work().exec_params(std::string("SELECT ") + kEntryColumns + " FROM ledger_entries WHERE reverses_entry_id=$1", entry_id);
    return First<model::LedgerEntryRecord>(res, ReadEntry);
  });
}

std::vector<model::LedgerEntryRecord> PgRepository::ListLedgerEntriesByOrder(Transaction& t, const std::string& order_id) {
  return Guard([&] {
    auto res = TX(t).Work().exec_params(std::string("SELECT ") + kEntryColumns + " FROM ledger_entries WHERE order_id=$1 ORDER BY seq", order_id);
    return All<model::LedgerEntryRecord>(res, ReadEntry);
  });
}

Result PgRepository::UpdateLedgerEntry(Transaction& t, const model::LedgerEntryRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE ledger_entries SET state=$2,available_at_ms=$3,external_payout_ref=$4,description=$5,updated_at_ms=$6 WHERE id=$1", r.id,
        static_cast<int>(r.state), r.available_at_ms, NullIfEmpty(r.external_payout_ref), r.description, r.updated_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "ledger entry " + r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::PromoteMaturedEntries(Transaction& t, int64_t now_ms, uint64_t& promoted) {
  promoted = 0;
  try {
    auto res = TX(t).Work().exec_prepared("promote_matured", static_cast<int>(v1::ENTRY_STATE_AVAILABLE), now_ms, static_cast<int>(v1::ENTRY_STATE_HELD));
    promoted = static_cast<uint64_t>(res.affected_rows());
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Balances
// ------------------------------------------------------------------

Result PgRepository::LockBeneficiary(Transaction& t, const std::string& beneficiary_id) {
  try {
    TX(t).Work().exec_prepared("lock_beneficiary", beneficiary_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

int64_t PgRepository::SumAvailableBalance(Transaction& t, const std::string& beneficiary_id) {
  return Guard([&] {
    auto res = TX(t).Work().exec_params(sql::SelectAvailableBalance() + "FROM ledger_entries WHERE beneficiary_id=$1", beneficiary_id);
    return res.empty() ? int64_t{0} : res[0][0].as<int64_t>();
  });
}

model::BalanceRecord PgRepository::SummarizeBalance(Transaction& t, const std::string& beneficiary_id) {
  return Guard([&] {
    auto res = TX(t).Work().exec_params(sql::SelectBalanceSummary() + "FROM ledger_entries WHERE beneficiary_id=$1", beneficiary_id);

    model::BalanceRecord balance;
    if (!res.empty()) {
      balance.available_minor      = res[0][0].as<int64_t>();
      balance.held_minor           = res[0][1].as<int64_t>();
      balance.disputed_minor       = res[0][2].as<int64_t>();
      balance.lifetime_total_minor = res[0][3].as<int64_t>();
    }
    return balance;
  });
}

// ------------------------------------------------------------------
// Dead letters
// ------------------------------------------------------------------

Result PgRepository::InsertFailedEvent(Transaction& t, const model::FailedEventRecord& r) {
  try {
    TX(t).Work().exec_params(std::string("INSERT INTO failed_events(") + kFailedEventColumns + ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9)", r.id,
                             r.event_id, r.event_type, r.raw_payload, r.error_message, r.order_id, r.created_at_ms, r.resolved_at_ms,
                             static_cast<int64_t>(r.replay_attempts));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::FailedEventRecord> PgRepository::GetFailedEvent(Transaction& t, const std::string& id) {
  return Guard([&] {
    auto res = TX(t).Work().exec_params(std::string("SELECT ") + kFailedEventColumns + " FROM failed_events WHERE id=$1", id);
    return First<model::FailedEventRecord>(res, ReadFailedEvent);
  });
}

std::vector<model::FailedEventRecord> PgRepository::ListFailedEvents(Transaction& t, bool include_resolved, uint32_t limit) {
  std::string sql = std::string("SELECT ") + kFailedEventColumns + " FROM failed_events";
  if (!include_resolved) sql += " WHERE resolved_at_ms IS NULL";
  sql += " ORDER BY seq";
  if (limit > 0) sql += " LIMIT " + std::to_string(limit);

  return Guard([&] { return All<model::FailedEventRecord>(TX(t).Work().exec(sql), ReadFailedEvent); });
}

Result PgRepository::UpdateFailedEvent(Transaction& t, const model::FailedEventRecord& r) {
  try {
    auto res = TX(t).Work().exec_params("UPDATE failed_events SET error_message=$2,resolved_at_ms=$3,replay_attempts=$4 WHERE id=$1", r.id,
                                        r.error_message, r.resolved_at_ms, static_cast<int64_t>(r.replay_attempts));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "failed event " + r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Retry queue
// ------------------------------------------------------------------

Result PgRepository::EnqueueRetry(Transaction& t, const model::RetryRecord& r) {
  try {
    TX(t).Work().exec_params(std::string("INSERT INTO event_retry_queue(") + kRetryColumns + ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11)", r.id,
                             r.event_id, r.event_type, r.raw_payload, r.order_id, static_cast<int64_t>(r.attempts), r.next_attempt_at_ms,
                             r.last_error, r.lease_owner, r.lease_expires_at_ms, r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::RetryRecord> PgRepository::ClaimNextRetry(Transaction& t, const std::string& owner, int64_t now_ms, int64_t lease_ms) {
  return Guard([&] {
    auto res = TX(t).Work().exec_params(
        std::string("UPDATE event_retry_queue SET lease_owner=$1,lease_expires_at_ms=$3 WHERE id=(SELECT id FROM event_retry_queue "
                    "WHERE next_attempt_at_ms<=$2 AND (lease_owner IS NULL OR lease_owner='' OR lease_expires_at_ms<=$2) "
                    "ORDER BY seq LIMIT 1 FOR UPDATE SKIP LOCKED) RETURNING ") +
            kRetryColumns,
        owner, now_ms, now_ms + lease_ms);
    return First<model::RetryRecord>(res, ReadRetry);
  });
}

Result PgRepository::UpdateRetry(Transaction& t, const model::RetryRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE event_retry_queue SET attempts=$2,next_attempt_at_ms=$3,last_error=$4,lease_owner=$5,lease_expires_at_ms=$6 WHERE id=$1", r.id,
        static_cast<int64_t>(r.attempts), r.next_attempt_at_ms, r.last_error, r.lease_owner, r.lease_expires_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "retry " + r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteRetry(Transaction& t, const std::string& id) {
  try {
    TX(t).Work().exec_params("DELETE FROM event_retry_queue WHERE id=$1", id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

uint64_t PgRepository::CountRetries(Transaction& t) {
  return Guard([&] { return TX(t).Work().exec("SELECT COUNT(*) FROM event_retry_queue").one_row()[0].as<uint64_t>(); });
}

} // namespace settlement::db::postgres
