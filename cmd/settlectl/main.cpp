#include <grpcpp/grpcpp.h>

#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "internal/intake/signature_verifier.hpp"
#include "internal/util/money.hpp"
#include "settlement/engine/v1.hpp"

using namespace settlement::engine::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  settlectl <addr> withdraw <beneficiary_id> <amount>\n"
            << "  settlectl <addr> balance <beneficiary_id>\n"
            << "  settlectl <addr> ledger <order_id>\n"
            << "  settlectl <addr> register-order <order_id> <payer_id> <fulfiller_id> <gross> <fulfillment_end_unix_ms> [key=value...]\n"
            << "      keys: referrer, facilitator, service, subject\n"
            << "  settlectl <addr> failed-events [all]\n"
            << "  settlectl <addr> replay <failed_event_id>\n"
            << "  settlectl <addr> replay-all [limit]\n"
            << "  settlectl <addr> sweep\n"
            << "  settlectl <addr> deliver-signed <secret> <event.json>\n"
            << "\n"
            << "Amounts are decimal (\"12.50\").\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << "error(" << status.error_code() << "): " << status.error_message();
  if (!status.error_details().empty()) std::cerr << " [" << status.error_details() << "]";
  std::cerr << "\n";
  return 2;
}

static const char* StateName(EntryState state) {
  switch (state) {
    case ENTRY_STATE_HELD:
      return "held";
    case ENTRY_STATE_AVAILABLE:
      return "available";
    case ENTRY_STATE_PAID_OUT:
      return "paid_out";
    case ENTRY_STATE_DISPUTED:
      return "disputed";
    case ENTRY_STATE_REVERSED:
      return "reversed";
    case ENTRY_STATE_PENDING_CONFIRMATION:
      return "pending_confirmation";
    case ENTRY_STATE_FAILED:
      return "failed";
    default:
      return "unspecified";
  }
}

static const char* KindName(EntryKind kind) {
  switch (kind) {
    case ENTRY_KIND_PAYMENT:
      return "payment";
    case ENTRY_KIND_FULFILLER_PAYOUT:
      return "fulfiller_payout";
    case ENTRY_KIND_REFERRAL_COMMISSION:
      return "referral_commission";
    case ENTRY_KIND_FACILITATOR_COMMISSION:
      return "facilitator_commission";
    case ENTRY_KIND_PLATFORM_FEE:
      return "platform_fee";
    case ENTRY_KIND_WITHDRAWAL:
      return "withdrawal";
    case ENTRY_KIND_REVERSAL:
      return "reversal";
    default:
      return "unspecified";
  }
}

static const char* DispositionName(IntakeDisposition disposition) {
  switch (disposition) {
    case INTAKE_DISPOSITION_APPLIED:
      return "applied";
    case INTAKE_DISPOSITION_IGNORED:
      return "ignored";
    case INTAKE_DISPOSITION_QUEUED_FOR_RETRY:
      return "queued_for_retry";
    case INTAKE_DISPOSITION_DEAD_LETTERED:
      return "dead_lettered";
    default:
      return "unspecified";
  }
}

static std::string ReadFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw std::runtime_error("cannot open " + path);
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

static int Run(int argc, char** argv) {
  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto payout_stub  = PayoutService::NewStub(channel);
  auto admin_stub   = AdminService::NewStub(channel);
  auto webhook_stub = WebhookService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "withdraw") {
    if (argc < 5) return 1;

    WithdrawRequest req;
    req.set_beneficiary_id(argv[3]);
    req.set_amount_minor(settlement::util::ParseMinor(argv[4]));

    WithdrawResponse resp;
    auto             status = payout_stub->Withdraw(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "status=" << WithdrawalStatus_Name(resp.status()) << " withdrawal=" << resp.withdrawal_id();
    if (!resp.reason().empty()) std::cout << " reason=" << resp.reason();
    if (!resp.transfer_id().empty()) std::cout << " transfer=" << resp.transfer_id();
    std::cout << "\n";
    return resp.status() == WITHDRAWAL_STATUS_REJECTED ? 3 : 0;
  }

  // ------------------------------------------------------------

  if (cmd == "balance") {
    if (argc < 4) return 1;

    GetBalanceRequest req;
    req.set_beneficiary_id(argv[3]);

    GetBalanceResponse resp;
    auto               status = payout_stub->GetBalance(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    const auto& balance = resp.balance();
    std::cout << "available=" << settlement::util::FormatMinor(balance.available_minor()) << "\n"
              << "held=" << settlement::util::FormatMinor(balance.held_minor()) << "\n"
              << "disputed=" << settlement::util::FormatMinor(balance.disputed_minor()) << "\n"
              << "lifetime_total=" << settlement::util::FormatMinor(balance.lifetime_total_minor()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "ledger") {
    if (argc < 4) return 1;

    GetOrderLedgerRequest req;
    req.set_order_id(argv[3]);

    GetOrderLedgerResponse resp;
    auto                   status = admin_stub->GetOrderLedger(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "order=" << resp.order().id() << " status=" << OrderStatus_Name(resp.order().status())
              << " gross=" << settlement::util::FormatMinor(resp.order().gross_minor()) << "\n";
    for (const auto& entry : resp.entries()) {
      std::cout << entry.id() << "  " << KindName(entry.kind()) << "  " << (entry.beneficiary_id().empty() ? "-" : entry.beneficiary_id()) << "  "
                << settlement::util::FormatMinor(entry.amount_minor()) << "  " << StateName(entry.state()) << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "register-order") {
    if (argc < 8) return 1;

    RegisterOrderRequest req;
    auto*                order = req.mutable_order();
    order->set_id(argv[3]);
    order->set_payer_id(argv[4]);
    order->set_fulfiller_id(argv[5]);
    order->set_gross_minor(settlement::util::ParseMinor(argv[6]));
    order->set_fulfillment_end_unix_ms(std::stoll(argv[7]));

    for (int i = 8; i < argc; ++i) {
      std::string arg = argv[i];
      auto        eq  = arg.find('=');
      if (eq == std::string::npos) {
        std::cerr << "expected key=value, got '" << arg << "'\n";
        return 1;
      }
      auto key   = arg.substr(0, eq);
      auto value = arg.substr(eq + 1);
      if (key == "referrer") {
        order->set_referrer_id(value);
      } else if (key == "facilitator") {
        order->set_facilitator_id(value);
      } else if (key == "service") {
        order->mutable_context()->set_service_name(value);
      } else if (key == "subject") {
        order->mutable_context()->set_subject(value);
      } else {
        std::cerr << "unknown key: " << key << "\n";
        return 1;
      }
    }

    RegisterOrderResponse resp;
    auto                  status = admin_stub->RegisterOrder(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "registered " << resp.order().id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "failed-events") {
    ListFailedEventsRequest req;
    req.set_include_resolved(argc >= 4 && std::string(argv[3]) == "all");

    ListFailedEventsResponse resp;
    auto                     status = admin_stub->ListFailedEvents(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& event : resp.events()) {
      std::cout << event.id() << "  " << event.event_type() << "  event=" << event.event_id() << "  replays=" << event.replay_attempts()
                << (event.resolved_at_unix_ms() > 0 ? "  resolved" : "") << "  " << event.error_message() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "replay") {
    if (argc < 4) return 1;

    ReplayFailedEventRequest req;
    req.set_failed_event_id(argv[3]);

    ReplayFailedEventResponse resp;
    auto                      status = admin_stub->ReplayFailedEvent(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    if (resp.already_resolved()) {
      std::cout << "already resolved\n";
    } else if (resp.resolved()) {
      std::cout << "resolved\n";
    } else {
      std::cout << "failed: " << resp.error_message() << "\n";
      return 3;
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "replay-all") {
    ReplayFailedEventsRequest req;
    if (argc >= 4) req.set_limit(static_cast<uint32_t>(std::stoul(argv[3])));

    ReplayFailedEventsResponse resp;
    auto                       status = admin_stub->ReplayFailedEvents(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "attempted=" << resp.attempted() << " resolved=" << resp.resolved() << " failed=" << resp.failed() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "sweep") {
    RunMaturitySweepRequest  req;
    RunMaturitySweepResponse resp;
    auto                     status = admin_stub->RunMaturitySweep(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "promoted=" << resp.promoted() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "deliver-signed") {
    if (argc < 5) return 1;

    const std::string body = ReadFile(argv[4]);
    const auto        now_s =
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();

    DeliverRequest req;
    req.set_body(body);
    req.set_signature(settlement::intake::SignatureVerifier::Sign(argv[3], body, now_s));

    DeliverResponse resp;
    auto            status = webhook_stub->Deliver(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "event=" << resp.event_id() << " disposition=" << DispositionName(resp.disposition());
    if (!resp.failed_event_id().empty()) std::cout << " failed_event=" << resp.failed_event_id();
    std::cout << "\n";
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  try {
    return Run(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}
