#include "pg_tx.hpp"

#include "internal/util/errors.hpp"

namespace settlement::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) {
  conn_ = pool->Acquire();
  tx_   = std::make_unique<pqxx::work>(*conn_);
  tx_->exec("SET LOCAL lock_timeout = '" + std::to_string(pool->LockTimeout().count()) + "ms'");
}

// pqxx::work aborts an open transaction in its own destructor.
PgTransaction::~PgTransaction() = default;

void PgTransaction::Commit() {
  try {
    tx_->commit();
  } catch (const pqxx::serialization_failure& e) {
    throw util::Transient(std::string("postgres commit: ") + e.what());
  } catch (const pqxx::deadlock_detected& e) {
    throw util::Transient(std::string("postgres commit: ") + e.what());
  }
  committed_ = true;
  Release();
}

void PgTransaction::Rollback() {
  if (!tx_) return;
  tx_->abort();
  Release();
}

// Returns the connection to the pool as soon as the transaction ends.
void PgTransaction::Release() {
  tx_.reset();
  conn_.reset();
}

} // namespace settlement::db::postgres
