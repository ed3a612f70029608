#include "factory.hpp"

#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <stdexcept>
#include <string>

#include "internal/core/attribution_resolver.hpp"
#include "internal/core/dispute_handler.hpp"
#include "internal/core/maturity_transitioner.hpp"
#include "internal/core/order_registry.hpp"
#include "internal/core/payout_processor.hpp"
#include "internal/core/settlement_engine.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/payout_server.hpp"
#include "internal/grpc/webhook_server.hpp"
#include "internal/intake/event_dispatcher.hpp"
#include "internal/intake/event_intake.hpp"
#include "internal/intake/failed_event_replayer.hpp"
#include "internal/intake/signature_verifier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/retry/retry_queue_worker.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/payout_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/webhook_service.hpp"
#include "internal/transfer/grpc_transfer_gateway.hpp"
#include "internal/util/time.hpp"
#if SETTLEMENT_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if SETTLEMENT_DB_POSTGRES
#include <pqxx/pqxx>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace settlement::factory {

using settlement::observability::StringField;
using settlement::runtime::config::RuntimeConfig;

namespace {

using std::chrono::milliseconds;

#if SETTLEMENT_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  sqlite_db->ApplySchema(db::sql::SqliteSchema(), db::sql::kSchemaVersion);
}
#endif

#if SETTLEMENT_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);
  for (const auto& sql : db::sql::PostgresSchema()) {
    tx.exec(sql);
  }
  tx.commit();
}
#endif

core::CommissionRates ToRates(const settlement::runtime::config::CommissionConfig& config) {
  core::CommissionRates rates;
  if (config.has_platform_fee_permille()) rates.platform_fee_permille = config.platform_fee_permille();
  if (config.has_referral_permille()) rates.referral_permille = config.referral_permille();
  if (config.has_facilitator_permille()) rates.facilitator_permille = config.facilitator_permille();
  return rates;
}

std::shared_ptr<transfer::TransferGateway> BuildTransferGateway(const settlement::runtime::config::TransferGatewayConfig& config) {
  if (config.target().empty()) {
    throw std::runtime_error("payout.gateway.target is required");
  }
  auto credentials = config.insecure() ? ::grpc::InsecureChannelCredentials() : ::grpc::SslCredentials(::grpc::SslCredentialsOptions());
  return std::make_shared<transfer::GrpcTransferGateway>(::grpc::CreateChannel(config.target(), credentials));
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if SETTLEMENT_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    BootstrapSqliteSchema(sqlite_db);
    SETTLEMENT_LOG_INFO("ledger store ready", {StringField("backend", "sqlite"), StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if SETTLEMENT_DB_POSTGRES
    const auto& pg   = database.postgres();
    auto        pool = std::make_shared<db::postgres::PgPool>(pg.connection_uri(), pg.max_connections() > 0 ? pg.max_connections() : 16,
                                                              util::ToMillis(pg.lock_timeout(), milliseconds(5000)));
    BootstrapPostgresSchema(pool);
    SETTLEMENT_LOG_INFO("ledger store ready", {StringField("backend", "postgres")});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  SETTLEMENT_LOG_WARN("using in-memory ledger store; nothing survives a restart");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Store
  // ------------------------------------------------------------------
  auto repository = BuildRepository(config);
  app.repository  = repository;

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  core::SettlementOptions settlement_options;
  settlement_options.hold_period  = util::ToMillis(config.settlement().hold_period(), settlement_options.hold_period);
  settlement_options.max_attempts = config.settlement().max_attempts() > 0 ? config.settlement().max_attempts() : settlement_options.max_attempts;

  core::PayoutOptions payout_options;
  const auto&         payout    = config.payout();
  payout_options.min_withdrawal_minor = payout.min_withdrawal_minor() > 0 ? payout.min_withdrawal_minor() : payout_options.min_withdrawal_minor;
  payout_options.max_withdrawal_minor = payout.max_withdrawal_minor();
  payout_options.transfer_timeout     = util::ToMillis(payout.transfer_timeout(), payout_options.transfer_timeout);
  payout_options.max_attempts         = payout.max_attempts() > 0 ? payout.max_attempts() : payout_options.max_attempts;

  auto settlement = std::make_shared<core::SettlementEngine>(repository, core::AttributionResolver(ToRates(config.commission())), settlement_options);
  auto payouts    = std::make_shared<core::PayoutProcessor>(repository, BuildTransferGateway(payout.gateway()), payout_options);
  auto disputes   = std::make_shared<core::DisputeHandler>(repository, util::Now, settlement_options.max_attempts);
  auto maturity   = std::make_shared<core::MaturityTransitioner>(repository);
  auto orders     = std::make_shared<core::OrderRegistry>(repository);

  // ------------------------------------------------------------------
  // Event intake
  // ------------------------------------------------------------------
  const auto& intake_config = config.intake();
  auto        verifier      = std::make_shared<intake::SignatureVerifier>(
      intake_config.webhook_secret(),
      std::chrono::duration_cast<std::chrono::seconds>(util::ToMillis(intake_config.signature_tolerance(), std::chrono::seconds(300))));
  auto dispatcher = std::make_shared<intake::EventDispatcher>(settlement, payouts, disputes);

  const auto&       retry_config = config.retry_queue();
  intake::IntakeOptions intake_options;
  intake_options.max_inline_attempts = intake_config.max_inline_attempts() > 0 ? intake_config.max_inline_attempts() : intake_options.max_inline_attempts;
  intake_options.inline_backoff      = util::ToMillis(intake_config.inline_backoff(), intake_options.inline_backoff);
  intake_options.event_deadline      = util::ToMillis(intake_config.event_deadline(), intake_options.event_deadline);
  intake_options.retry_delay         = util::ToMillis(retry_config.base_backoff(), intake_options.retry_delay);

  auto event_intake = std::make_shared<intake::EventIntake>(repository, verifier, dispatcher, intake_options);
  auto replayer     = std::make_shared<intake::FailedEventReplayer>(repository, dispatcher);

  // ------------------------------------------------------------------
  // Background workers
  // ------------------------------------------------------------------
  retry::RetryQueueOptions retry_options;
  retry_options.lease        = util::ToMillis(retry_config.lease(), retry_options.lease);
  retry_options.max_attempts = retry_config.max_attempts() > 0 ? retry_config.max_attempts() : retry_options.max_attempts;
  retry_options.base_backoff = util::ToMillis(retry_config.base_backoff(), retry_options.base_backoff);
  retry_options.batch_size   = retry_config.batch_size() > 0 ? retry_config.batch_size() : retry_options.batch_size;
  auto retry_worker          = std::make_shared<retry::RetryQueueWorker>(repository, dispatcher, retry_options);

  app.background_workers.push_back(std::make_shared<scheduler::PeriodicWorker>(
      "maturity-sweep", util::ToMillis(config.maturity().sweep_interval(), milliseconds(60000)), [maturity] { maturity->Sweep(); }));
  app.background_workers.push_back(std::make_shared<scheduler::PeriodicWorker>(
      "retry-queue", util::ToMillis(retry_config.poll_interval(), milliseconds(5000)), [retry_worker] { retry_worker->DrainOnce(); }));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository = repository;
  ctx.orders     = orders;
  ctx.payouts    = payouts;
  ctx.maturity   = maturity;
  ctx.intake     = event_intake;
  ctx.replayer   = replayer;

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::WebhookServer>(std::make_shared<service::WebhookService>(ctx)));
  app.grpc_services.push_back(std::make_unique<grpc::PayoutServer>(std::make_shared<service::PayoutService>(ctx)));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(std::make_shared<service::AdminService>(ctx)));

  return app;
}

} // namespace settlement::factory
