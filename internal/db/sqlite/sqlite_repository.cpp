#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/balance_sql.hpp"
#include "internal/util/errors.hpp"

namespace settlement::db::sqlite {

using settlement::db::ErrorCode;
using settlement::db::Result;

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

// Finalizes on scope exit.
struct Stmt {
  sqlite3_stmt* st = nullptr;
  ~Stmt() {
    sqlite3_finalize(st);
  }
};

// Reads have no Result channel; failures surface as exceptions.
void Check(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_ROW || rc == SQLITE_DONE) return;
  if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) throw util::Transient(std::string("sqlite busy: ") + sqlite3_errmsg(db));
  throw std::runtime_error(std::string("sqlite: ") + sqlite3_errmsg(db));
}

void Prepare(sqlite3* db, const std::string& sql, Stmt& stmt) {
  Check(db, sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt.st, nullptr));
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

// Empty string stored as NULL so partial unique indexes ignore it.
void BindTextOrNull(sqlite3_stmt* st, int idx, const std::string& s) {
  if (s.empty()) {
    sqlite3_bind_null(st, idx);
  } else {
    BindText(st, idx, s);
  }
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptI64(sqlite3_stmt* st, int idx, const std::optional<int64_t>& v) {
  if (v) {
    BindI64(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

std::optional<int64_t> ColOptI64(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColI64(st, col);
}

void BindOrder(sqlite3_stmt* st, const model::OrderRecord& r) {
  BindText(st, 1, r.id);
  BindText(st, 2, r.payer_id);
  BindText(st, 3, r.fulfiller_id);
  BindOptText(st, 4, r.referrer_id);
  BindOptText(st, 5, r.facilitator_id);
  BindI64(st, 6, r.gross_minor);
  BindTextOrNull(st, 7, r.payment_ref);
  BindI64(st, 8, r.fulfillment_end_ms);
  BindI64(st, 9, static_cast<int64_t>(r.status));
  BindI64(st, 10, r.paid_at_ms);
  BindText(st, 11, r.context.service_name);
  BindText(st, 12, r.context.subject);
  BindText(st, 13, r.context.payer_name);
  BindText(st, 14, r.context.fulfiller_name);
  BindText(st, 15, r.context.facilitator_name);
  BindI64(st, 16, r.created_at_ms);
}

model::OrderRecord ReadOrder(sqlite3_stmt* st) {
  model::OrderRecord r;
  r.id                       = ColText(st, 0);
  r.payer_id                 = ColText(st, 1);
  r.fulfiller_id             = ColText(st, 2);
  r.referrer_id              = ColOptText(st, 3);
  r.facilitator_id           = ColOptText(st, 4);
  r.gross_minor              = ColI64(st, 5);
  r.payment_ref              = ColText(st, 6);
  r.fulfillment_end_ms       = ColI64(st, 7);
  r.status                   = static_cast<v1::OrderStatus>(ColI64(st, 8));
  r.paid_at_ms               = ColI64(st, 9);
  r.context.service_name     = ColText(st, 10);
  r.context.subject          = ColText(st, 11);
  r.context.payer_name       = ColText(st, 12);
  r.context.fulfiller_name   = ColText(st, 13);
  r.context.facilitator_name = ColText(st, 14);
  r.created_at_ms            = ColI64(st, 15);
  return r;
}

model::LedgerEntryRecord ReadEntry(sqlite3_stmt* st) {
  model::LedgerEntryRecord r;
  r.id                       = ColText(st, 0);
  r.order_id                 = ColText(st, 1);
  r.beneficiary_id           = ColOptText(st, 2);
  r.kind                     = static_cast<v1::EntryKind>(ColI64(st, 3));
  r.amount_minor             = ColI64(st, 4);
  r.state                    = static_cast<v1::EntryState>(ColI64(st, 5));
  r.available_at_ms          = ColOptI64(st, 6);
  r.external_payout_ref      = ColText(st, 7);
  r.reverses_entry_id        = ColText(st, 8);
  r.description              = ColText(st, 9);
  r.context.service_name     = ColText(st, 10);
  r.context.subject          = ColText(st, 11);
  r.context.payer_name       = ColText(st, 12);
  r.context.fulfiller_name   = ColText(st, 13);
  r.context.facilitator_name = ColText(st, 14);
  r.created_at_ms            = ColI64(st, 15);
  r.updated_at_ms            = ColI64(st, 16);
  return r;
}

model::FailedEventRecord ReadFailedEvent(sqlite3_stmt* st) {
  model::FailedEventRecord r;
  r.id              = ColText(st, 0);
  r.event_id        = ColText(st, 1);
  r.event_type      = ColText(st, 2);
  r.raw_payload     = ColText(st, 3);
  r.error_message   = ColText(st, 4);
  r.order_id        = ColText(st, 5);
  r.created_at_ms   = ColI64(st, 6);
  r.resolved_at_ms  = ColOptI64(st, 7);
  r.replay_attempts = static_cast<uint32_t>(ColI64(st, 8));
  return r;
}

model::RetryRecord ReadRetry(sqlite3_stmt* st) {
  model::RetryRecord r;
  r.id                  = ColText(st, 0);
  r.event_id            = ColText(st, 1);
  r.event_type          = ColText(st, 2);
  r.raw_payload         = ColText(st, 3);
  r.order_id            = ColText(st, 4);
  r.attempts            = static_cast<uint32_t>(ColI64(st, 5));
  r.next_attempt_at_ms  = ColI64(st, 6);
  r.last_error          = ColText(st, 7);
  r.lease_owner         = ColText(st, 8);
  r.lease_expires_at_ms = ColI64(st, 9);
  r.created_at_ms       = ColI64(st, 10);
  return r;
}

template <typename Record, typename BindFn, typename ReadFn>
std::vector<Record> QueryAll(sqlite3* db, const std::string& sql, BindFn&& bind, ReadFn&& read) {
  Stmt stmt;
  Prepare(db, sql, stmt);
  bind(stmt.st);

  std::vector<Record> out;
  int                 rc = SQLITE_OK;
  while ((rc = sqlite3_step(stmt.st)) == SQLITE_ROW) {
    out.push_back(read(stmt.st));
  }
  Check(db, rc);
  return out;
}

template <typename Record, typename BindFn, typename ReadFn>
std::optional<Record> QueryOne(sqlite3* db, const std::string& sql, BindFn&& bind, ReadFn&& read) {
  auto rows = QueryAll<Record>(db, sql, std::forward<BindFn>(bind), std::forward<ReadFn>(read));
  if (rows.empty()) return std::nullopt;
  return std::move(rows.front());
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT: {
      const int extended = sqlite3_extended_errcode(db);
      if (extended == SQLITE_CONSTRAINT_PRIMARYKEY || extended == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    }
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Orders
// ------------------------------------------------------------------

Result SqliteRepository::InsertOrder(Transaction& t, const model::OrderRecord& r) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("INSERT INTO orders(") + kOrderColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

  Stmt stmt;
  int  rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt.st, nullptr);
  if (rc != SQLITE_OK) return Translate(db, rc);

  BindOrder(stmt.st, r);
  return Translate(db, sqlite3_step(stmt.st));
}

std::optional<model::OrderRecord> SqliteRepository::GetOrder(Transaction& t, const std::string& id) {
  return QueryOne<model::OrderRecord>(
      TX(t).Handle(), std::string("SELECT ") + kOrderColumns + " FROM orders WHERE id=?;", [&](sqlite3_stmt* st) { BindText(st, 1, id); }, ReadOrder);
}

std::optional<model::OrderRecord> SqliteRepository::GetOrderForUpdate(Transaction& t, const std::string& id) {
  // BEGIN IMMEDIATE already holds the database write lock.
  return GetOrder(t, id);
}

std::optional<model::OrderRecord> SqliteRepository::FindOrderByPaymentRef(Transaction& t, const std::string& payment_ref) {
  if (payment_ref.empty()) return std::nullopt;
  return QueryOne<model::OrderRecord>(
      TX(t).Handle(), std::string("SELECT ") + kOrderColumns + " FROM orders WHERE payment_ref=?;",
      [&](sqlite3_stmt* st) { BindText(st, 1, payment_ref); }, ReadOrder);
}

Result SqliteRepository::UpdateOrder(Transaction& t, const model::OrderRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql = "UPDATE orders SET payment_ref=?,status=?,paid_at_ms=? WHERE id=?;";

  Stmt stmt;
  int  rc = sqlite3_prepare_v2(db, sql, -1, &stmt.st, nullptr);
  if (rc != SQLITE_OK) return Translate(db, rc);

  BindTextOrNull(stmt.st, 1, r.payment_ref);
  BindI64(stmt.st, 2, static_cast<int64_t>(r.status));
  BindI64(stmt.st, 3, r.paid_at_ms);
  BindText(stmt.st, 4, r.id);

  rc = sqlite3_step(stmt.st);
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "order " + r.id);
  return Translate(db, rc);
}

// ------------------------------------------------------------------
// Ledger
// ------------------------------------------------------------------

Result SqliteRepository::InsertLedgerEntry(Transaction& t, const model::LedgerEntryRecord& r) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("INSERT INTO ledger_entries(") + kEntryColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

  Stmt stmt;
  int  rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt.st, nullptr);
  if (rc != SQLITE_OK) return Translate(db, rc);

  auto* st = stmt.st;
  BindText(st, 1, r.id);
  BindTextOrNull(st, 2, r.order_id);
  BindOptText(st, 3, r.beneficiary_id);
  BindI64(st, 4, static_cast<int64_t>(r.kind));
  BindI64(st, 5, r.amount_minor);
  BindI64(st, 6, static_cast<int64_t>(r.state));
  BindOptI64(st, 7, r.available_at_ms);
  BindTextOrNull(st, 8, r.external_payout_ref);
  BindTextOrNull(st, 9, r.reverses_entry_id);
  BindText(st, 10, r.description);
  BindText(st, 11, r.context.service_name);
  BindText(st, 12, r.context.subject);
  BindText(st, 13, r.context.payer_name);
  BindText(st, 14, r.context.fulfiller_name);
  BindText(st, 15, r.context.facilitator_name);
  BindI64(st, 16, r.created_at_ms);
  BindI64(st, 17, r.updated_at_ms);

  return Translate(db, sqlite3_step(st));
}

std::optional<model::LedgerEntryRecord> SqliteRepository::GetLedgerEntry(Transaction& t, const std::string& id) {
  return QueryOne<model::LedgerEntryRecord>(
      TX(t).Handle(), std::string("SELECT ") + kEntryColumns + " FROM ledger_entries WHERE id=?;", [&](sqlite3_stmt* st) { BindText(st, 1, id); },
      ReadEntry);
}

std::optional<model::LedgerEntryRecord> SqliteRepository::FindLedgerEntryByPayoutRef(Transaction& t, const std::string& ref) {
  if (ref.empty()) return std::nullopt;
  return QueryOne<model::LedgerEntryRecord>(
      TX(t).Handle(), std::string("SELECT ") + kEntryColumns + " FROM ledger_entries WHERE external_payout_ref=? ORDER BY seq LIMIT 1;",
      [&](sqlite3_stmt* st) { BindText(st, 1, ref); }, ReadEntry);
}

std::optional<model::LedgerEntryRecord> SqliteRepository::FindReversalOf(Transaction& t, const std::string& entry_id) {
  return QueryOne<model::LedgerEntryRecord>(
      TX(t).Handle(), std::string("SELECT ") + kEntryColumns + " FROM ledger_entries WHERE reverses_entry_id=?;",
      [&](sqlite3_stmt* st) { BindText(st, 1, entry_id); }, ReadEntry);
}

std::vector<model::LedgerEntryRecord> SqliteRepository::ListLedgerEntriesByOrder(Transaction& t, const std::string& order_id) {
  return QueryAll<model::LedgerEntryRecord>(
      TX(t).Handle(), std::string("SELECT ") + kEntryColumns + " FROM ledger_entries WHERE order_id=? ORDER BY seq;",
      [&](sqlite3_stmt* st) { BindText(st, 1, order_id); }, ReadEntry);
}

Result SqliteRepository::UpdateLedgerEntry(Transaction& t, const model::LedgerEntryRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql = "UPDATE ledger_entries SET state=?,available_at_ms=?,external_payout_ref=?,description=?,updated_at_ms=? WHERE id=?;";

  Stmt stmt;
  int  rc = sqlite3_prepare_v2(db, sql, -1, &stmt.st, nullptr);
  if (rc != SQLITE_OK) return Translate(db, rc);

  BindI64(stmt.st, 1, static_cast<int64_t>(r.state));
  BindOptI64(stmt.st, 2, r.available_at_ms);
  BindTextOrNull(stmt.st, 3, r.external_payout_ref);
  BindText(stmt.st, 4, r.description);
  BindI64(stmt.st, 5, r.updated_at_ms);
  BindText(stmt.st, 6, r.id);

  rc = sqlite3_step(stmt.st);
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "ledger entry " + r.id);
  return Translate(db, rc);
}

Result SqliteRepository::PromoteMaturedEntries(Transaction& t, int64_t now_ms, uint64_t& promoted) {
  auto* db = TX(t).Handle();
  promoted = 0;

  const char* sql = "UPDATE ledger_entries SET state=?,updated_at_ms=? WHERE state=? AND available_at_ms IS NOT NULL AND available_at_ms<=?;";

  Stmt stmt;
  int  rc = sqlite3_prepare_v2(db, sql, -1, &stmt.st, nullptr);
  if (rc != SQLITE_OK) return Translate(db, rc);

  BindI64(stmt.st, 1, v1::ENTRY_STATE_AVAILABLE);
  BindI64(stmt.st, 2, now_ms);
  BindI64(stmt.st, 3, v1::ENTRY_STATE_HELD);
  BindI64(stmt.st, 4, now_ms);

  rc = sqlite3_step(stmt.st);
  if (rc == SQLITE_DONE) promoted = static_cast<uint64_t>(sqlite3_changes(db));
  return Translate(db, rc);
}

// ------------------------------------------------------------------
// Balances
// ------------------------------------------------------------------

Result SqliteRepository::LockBeneficiary(Transaction&, const std::string&) {
  // BEGIN IMMEDIATE serializes all writers already.
  return Result::Ok();
}

int64_t SqliteRepository::SumAvailableBalance(Transaction& t, const std::string& beneficiary_id) {
  auto*      db  = TX(t).Handle();
  const auto sql = sql::SelectAvailableBalance() + "FROM ledger_entries WHERE beneficiary_id=?;";

  Stmt stmt;
  Prepare(db, sql, stmt);
  BindText(stmt.st, 1, beneficiary_id);

  const int rc = sqlite3_step(stmt.st);
  Check(db, rc);
  return rc == SQLITE_ROW ? ColI64(stmt.st, 0) : 0;
}

model::BalanceRecord SqliteRepository::SummarizeBalance(Transaction& t, const std::string& beneficiary_id) {
  auto*      db  = TX(t).Handle();
  const auto sql = sql::SelectBalanceSummary() + "FROM ledger_entries WHERE beneficiary_id=?;";

  Stmt stmt;
  Prepare(db, sql, stmt);
  BindText(stmt.st, 1, beneficiary_id);

  model::BalanceRecord balance;
  const int            rc = sqlite3_step(stmt.st);
  Check(db, rc);
  if (rc == SQLITE_ROW) {
    balance.available_minor      = ColI64(stmt.st, 0);
    balance.held_minor           = ColI64(stmt.st, 1);
    balance.disputed_minor       = ColI64(stmt.st, 2);
    balance.lifetime_total_minor = ColI64(stmt.st, 3);
  }
  return balance;
}

// ------------------------------------------------------------------
// Dead letters
// ------------------------------------------------------------------

Result SqliteRepository::InsertFailedEvent(Transaction& t, const model::FailedEventRecord& r) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("INSERT INTO failed_events(") + kFailedEventColumns + ") VALUES(?,?,?,?,?,?,?,?,?);";

  Stmt stmt;
  int  rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt.st, nullptr);
  if (rc != SQLITE_OK) return Translate(db, rc);

  BindText(stmt.st, 1, r.id);
  BindText(stmt.st, 2, r.event_id);
  BindText(stmt.st, 3, r.event_type);
  BindText(stmt.st, 4, r.raw_payload);
  BindText(stmt.st, 5, r.error_message);
  BindText(stmt.st, 6, r.order_id);
  BindI64(stmt.st, 7, r.created_at_ms);
  BindOptI64(stmt.st, 8, r.resolved_at_ms);
  BindI64(stmt.st, 9, r.replay_attempts);

  return Translate(db, sqlite3_step(stmt.st));
}

std::optional<model::FailedEventRecord> SqliteRepository::GetFailedEvent(Transaction& t, const std::string& id) {
  return QueryOne<model::FailedEventRecord>(
      TX(t).Handle(), std::string("SELECT ") + kFailedEventColumns + " FROM failed_events WHERE id=?;",
      [&](sqlite3_stmt* st) { BindText(st, 1, id); }, ReadFailedEvent);
}

std::vector<model::FailedEventRecord> SqliteRepository::ListFailedEvents(Transaction& t, bool include_resolved, uint32_t limit) {
  std::string sql = std::string("SELECT ") + kFailedEventColumns + " FROM failed_events";
  if (!include_resolved) sql += " WHERE resolved_at_ms IS NULL";
  sql += " ORDER BY seq LIMIT ?;";

  return QueryAll<model::FailedEventRecord>(
      TX(t).Handle(), sql, [&](sqlite3_stmt* st) { BindI64(st, 1, limit == 0 ? -1 : static_cast<int64_t>(limit)); }, ReadFailedEvent);
}

Result SqliteRepository::UpdateFailedEvent(Transaction& t, const model::FailedEventRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql = "UPDATE failed_events SET error_message=?,resolved_at_ms=?,replay_attempts=? WHERE id=?;";

  Stmt stmt;
  int  rc = sqlite3_prepare_v2(db, sql, -1, &stmt.st, nullptr);
  if (rc != SQLITE_OK) return Translate(db, rc);

  BindText(stmt.st, 1, r.error_message);
  BindOptI64(stmt.st, 2, r.resolved_at_ms);
  BindI64(stmt.st, 3, r.replay_attempts);
  BindText(stmt.st, 4, r.id);

  rc = sqlite3_step(stmt.st);
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "failed event " + r.id);
  return Translate(db, rc);
}

// ------------------------------------------------------------------
// Retry queue
// ------------------------------------------------------------------

Result SqliteRepository::EnqueueRetry(Transaction& t, const model::RetryRecord& r) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("INSERT INTO event_retry_queue(") + kRetryColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?);";

  Stmt stmt;
  int  rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt.st, nullptr);
  if (rc != SQLITE_OK) return Translate(db, rc);

  BindText(stmt.st, 1, r.id);
  BindText(stmt.st, 2, r.event_id);
  BindText(stmt.st, 3, r.event_type);
  BindText(stmt.st, 4, r.raw_payload);
  BindText(stmt.st, 5, r.order_id);
  BindI64(stmt.st, 6, r.attempts);
  BindI64(stmt.st, 7, r.next_attempt_at_ms);
  BindText(stmt.st, 8, r.last_error);
  BindText(stmt.st, 9, r.lease_owner);
  BindI64(stmt.st, 10, r.lease_expires_at_ms);
  BindI64(stmt.st, 11, r.created_at_ms);

  return Translate(db, sqlite3_step(stmt.st));
}

std::optional<model::RetryRecord> SqliteRepository::ClaimNextRetry(Transaction& t, const std::string& owner, int64_t now_ms, int64_t lease_ms) {
  auto claimed = QueryOne<model::RetryRecord>(
      TX(t).Handle(),
      std::string("SELECT ") + kRetryColumns +
          " FROM event_retry_queue WHERE next_attempt_at_ms<=? AND (lease_owner IS NULL OR lease_owner='' OR lease_expires_at_ms<=?) "
          "ORDER BY seq LIMIT 1;",
      [&](sqlite3_stmt* st) {
        BindI64(st, 1, now_ms);
        BindI64(st, 2, now_ms);
      },
      ReadRetry);
  if (!claimed) return std::nullopt;

  claimed->lease_owner         = owner;
  claimed->lease_expires_at_ms = now_ms + lease_ms;

  auto result = UpdateRetry(t, *claimed);
  if (!result) throw std::runtime_error("claim retry " + claimed->id + ": " + result.message);
  return claimed;
}

Result SqliteRepository::UpdateRetry(Transaction& t, const model::RetryRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql = "UPDATE event_retry_queue SET attempts=?,next_attempt_at_ms=?,last_error=?,lease_owner=?,lease_expires_at_ms=? WHERE id=?;";

  Stmt stmt;
  int  rc = sqlite3_prepare_v2(db, sql, -1, &stmt.st, nullptr);
  if (rc != SQLITE_OK) return Translate(db, rc);

  BindI64(stmt.st, 1, r.attempts);
  BindI64(stmt.st, 2, r.next_attempt_at_ms);
  BindText(stmt.st, 3, r.last_error);
  BindText(stmt.st, 4, r.lease_owner);
  BindI64(stmt.st, 5, r.lease_expires_at_ms);
  BindText(stmt.st, 6, r.id);

  rc = sqlite3_step(stmt.st);
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "retry " + r.id);
  return Translate(db, rc);
}

Result SqliteRepository::DeleteRetry(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Stmt stmt;
  int  rc = sqlite3_prepare_v2(db, "DELETE FROM event_retry_queue WHERE id=?;", -1, &stmt.st, nullptr);
  if (rc != SQLITE_OK) return Translate(db, rc);

  BindText(stmt.st, 1, id);
  return Translate(db, sqlite3_step(stmt.st));
}

uint64_t SqliteRepository::CountRetries(Transaction& t) {
  auto* db = TX(t).Handle();

  Stmt stmt;
  Prepare(db, "SELECT COUNT(*) FROM event_retry_queue;", stmt);
  const int rc = sqlite3_step(stmt.st);
  Check(db, rc);
  return rc == SQLITE_ROW ? static_cast<uint64_t>(ColI64(stmt.st, 0)) : 0;
}

} // namespace settlement::db::sqlite
