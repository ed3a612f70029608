#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace settlement::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TransactionMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;

  char* err = nullptr;
  if (sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
    SETTLEMENT_LOG_WARN("sqlite rollback failed", {settlement::observability::StringField("error", err ? err : "unknown")});
  }
  sqlite3_free(err);
}

void SqliteTransaction::Commit() {
  // A failed COMMIT leaves the transaction open; the destructor rolls it back.
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
  lock_.unlock();
}

void SqliteTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  try {
    db_->Exec("ROLLBACK;");
  } catch (...) {
    lock_.unlock();
    throw;
  }
  lock_.unlock();
}

} // namespace settlement::db::sqlite
