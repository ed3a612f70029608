#include "pg_pool.hpp"

namespace settlement::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections, std::chrono::milliseconds lock_timeout)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections), lock_timeout_(lock_timeout) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        std::unique_ptr<pqxx::connection> conn;
        try {
          conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
        } catch (const std::exception&) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
        return Wrap(conn.release());
      }

      cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_order_for_update",
               "SELECT id,payer_id,fulfiller_id,referrer_id,facilitator_id,gross_minor,payment_ref,fulfillment_end_ms,status,paid_at_ms,"
               "service_name,subject,payer_name,fulfiller_name,facilitator_name,created_at_ms "
               "FROM orders WHERE id=$1 FOR UPDATE");

  conn.prepare("insert_ledger_entry",
               "INSERT INTO ledger_entries(id,order_id,beneficiary_id,kind,amount_minor,state,available_at_ms,external_payout_ref,"
               "reverses_entry_id,description,service_name,subject,payer_name,fulfiller_name,facilitator_name,created_at_ms,updated_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16,$17)");

  conn.prepare("lock_beneficiary", "SELECT pg_advisory_xact_lock(hashtext($1))");

  conn.prepare("promote_matured",
               "UPDATE ledger_entries SET state=$1,updated_at_ms=$2 WHERE state=$3 AND available_at_ms IS NOT NULL AND available_at_ms<=$2");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (!conn->is_open()) {
      --live_connections_;
      delete conn;
      cv_.notify_one();
      return;
    }
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace settlement::db::postgres
