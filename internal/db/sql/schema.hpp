#pragma once

#include <string>
#include <vector>

namespace settlement::db::sql {

/*
  Idempotent DDL, applied at startup by the factory.

  ledger_entries has no DELETE path anywhere in the code base.
*/

// Bump together with any DDL change below.
inline constexpr int kSchemaVersion = 1;

inline const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kStatements = {
      "CREATE TABLE IF NOT EXISTS orders (id TEXT PRIMARY KEY, payer_id TEXT NOT NULL, fulfiller_id TEXT NOT NULL, referrer_id TEXT, facilitator_id TEXT, "
      "gross_minor INTEGER NOT NULL, payment_ref TEXT, fulfillment_end_ms INTEGER NOT NULL, status INTEGER NOT NULL, paid_at_ms INTEGER NOT NULL DEFAULT 0, "
      "service_name TEXT, subject TEXT, payer_name TEXT, fulfiller_name TEXT, facilitator_name TEXT, created_at_ms INTEGER NOT NULL);",
      "CREATE UNIQUE INDEX IF NOT EXISTS orders_payment_ref_idx ON orders(payment_ref) WHERE payment_ref IS NOT NULL;",
      "CREATE TABLE IF NOT EXISTS ledger_entries (seq INTEGER PRIMARY KEY AUTOINCREMENT, id TEXT NOT NULL UNIQUE, order_id TEXT, beneficiary_id TEXT, "
      "kind INTEGER NOT NULL, amount_minor INTEGER NOT NULL, state INTEGER NOT NULL, available_at_ms INTEGER, external_payout_ref TEXT, "
      "reverses_entry_id TEXT, description TEXT, service_name TEXT, subject TEXT, payer_name TEXT, fulfiller_name TEXT, facilitator_name TEXT, "
      "created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS ledger_entries_order_idx ON ledger_entries(order_id);",
      "CREATE INDEX IF NOT EXISTS ledger_entries_beneficiary_idx ON ledger_entries(beneficiary_id);",
      "CREATE INDEX IF NOT EXISTS ledger_entries_maturity_idx ON ledger_entries(state, available_at_ms);",
      "CREATE INDEX IF NOT EXISTS ledger_entries_payout_ref_idx ON ledger_entries(external_payout_ref);",
      "CREATE UNIQUE INDEX IF NOT EXISTS ledger_entries_reversal_idx ON ledger_entries(reverses_entry_id) WHERE reverses_entry_id IS NOT NULL;",
      "CREATE TABLE IF NOT EXISTS failed_events (seq INTEGER PRIMARY KEY AUTOINCREMENT, id TEXT NOT NULL UNIQUE, event_id TEXT, event_type TEXT, "
      "raw_payload TEXT NOT NULL, error_message TEXT, order_id TEXT, created_at_ms INTEGER NOT NULL, resolved_at_ms INTEGER, "
      "replay_attempts INTEGER NOT NULL DEFAULT 0);",
      "CREATE TABLE IF NOT EXISTS event_retry_queue (seq INTEGER PRIMARY KEY AUTOINCREMENT, id TEXT NOT NULL UNIQUE, event_id TEXT, event_type TEXT, "
      "raw_payload TEXT NOT NULL, order_id TEXT, attempts INTEGER NOT NULL DEFAULT 0, next_attempt_at_ms INTEGER NOT NULL, last_error TEXT, "
      "lease_owner TEXT, lease_expires_at_ms INTEGER NOT NULL DEFAULT 0, created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS event_retry_queue_due_idx ON event_retry_queue(next_attempt_at_ms);"};
  return kStatements;
}

inline const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kStatements = {
      "CREATE TABLE IF NOT EXISTS orders (id TEXT PRIMARY KEY, payer_id TEXT NOT NULL, fulfiller_id TEXT NOT NULL, referrer_id TEXT, facilitator_id TEXT, "
      "gross_minor BIGINT NOT NULL, payment_ref TEXT, fulfillment_end_ms BIGINT NOT NULL, status SMALLINT NOT NULL, paid_at_ms BIGINT NOT NULL DEFAULT 0, "
      "service_name TEXT, subject TEXT, payer_name TEXT, fulfiller_name TEXT, facilitator_name TEXT, created_at_ms BIGINT NOT NULL);",
      "CREATE UNIQUE INDEX IF NOT EXISTS orders_payment_ref_idx ON orders(payment_ref) WHERE payment_ref IS NOT NULL;",
      "CREATE TABLE IF NOT EXISTS ledger_entries (seq BIGSERIAL PRIMARY KEY, id TEXT NOT NULL UNIQUE, order_id TEXT, beneficiary_id TEXT, "
      "kind SMALLINT NOT NULL, amount_minor BIGINT NOT NULL, state SMALLINT NOT NULL, available_at_ms BIGINT, external_payout_ref TEXT, "
      "reverses_entry_id TEXT, description TEXT, service_name TEXT, subject TEXT, payer_name TEXT, fulfiller_name TEXT, facilitator_name TEXT, "
      "created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS ledger_entries_order_idx ON ledger_entries(order_id);",
      "CREATE INDEX IF NOT EXISTS ledger_entries_beneficiary_idx ON ledger_entries(beneficiary_id);",
      "CREATE INDEX IF NOT EXISTS ledger_entries_maturity_idx ON ledger_entries(state, available_at_ms);",
      "CREATE INDEX IF NOT EXISTS ledger_entries_payout_ref_idx ON ledger_entries(external_payout_ref);",
      "CREATE UNIQUE INDEX IF NOT EXISTS ledger_entries_reversal_idx ON ledger_entries(reverses_entry_id) WHERE reverses_entry_id IS NOT NULL;",
      "CREATE TABLE IF NOT EXISTS failed_events (seq BIGSERIAL PRIMARY KEY, id TEXT NOT NULL UNIQUE, event_id TEXT, event_type TEXT, "
      "raw_payload TEXT NOT NULL, error_message TEXT, order_id TEXT, created_at_ms BIGINT NOT NULL, resolved_at_ms BIGINT, "
      "replay_attempts INTEGER NOT NULL DEFAULT 0);",
      "CREATE TABLE IF NOT EXISTS event_retry_queue (seq BIGSERIAL PRIMARY KEY, id TEXT NOT NULL UNIQUE, event_id TEXT, event_type TEXT, "
      "raw_payload TEXT NOT NULL, order_id TEXT, attempts INTEGER NOT NULL DEFAULT 0, next_attempt_at_ms BIGINT NOT NULL, last_error TEXT, "
      "lease_owner TEXT, lease_expires_at_ms BIGINT NOT NULL DEFAULT 0, created_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS event_retry_queue_due_idx ON event_retry_queue(next_attempt_at_ms);"};
  return kStatements;
}

} // namespace settlement::db::sql
