#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using settlement::config::ConfigLoader;

constexpr const char* kMinimal = R"(payout:
  gateway:
    target: "transfers.internal:443"
intake:
  webhook_secret: "whsec_minimal"
)";

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "settlement_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejected(const std::string& yaml, const std::string& expected_fragment) {
  try {
    ConfigLoader::LoadFromYamlString(yaml);
  } catch (const std::runtime_error& e) {
    return std::string(e.what()).find(expected_fragment) != std::string::npos;
  }
  return false;
}

void TestMinimalConfigGetsDefaults() {
  const auto config = ConfigLoader::LoadFromYamlString(kMinimal);

  assert(config.server().bind_address() == "0.0.0.0:50051");
  assert(config.database().has_memory());
  assert(config.commission().platform_fee_permille() == 100);
  assert(config.commission().referral_permille() == 100);
  assert(config.commission().facilitator_permille() == 200);
  assert(config.settlement().hold_period().seconds() == 7 * 24 * 3600);
  assert(config.payout().min_withdrawal_minor() == 100);
  assert(config.payout().max_withdrawal_minor() == 0);
  assert(config.payout().transfer_timeout().seconds() == 5);
  assert(config.payout().gateway().target() == "transfers.internal:443");
  assert(!config.payout().gateway().insecure());
  assert(config.intake().signature_tolerance().seconds() == 300);
  assert(config.intake().inline_backoff().nanos() == 100'000'000);
  assert(config.retry_queue().lease().seconds() == 30);
  assert(config.retry_queue().batch_size() == 50);
  assert(config.maturity().sweep_interval().seconds() == 60);
}

void TestFullConfig() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(server:
  bind_address: "127.0.0.1:7000"
database:
  sqlite:
    path: /var/lib/settlement/ledger.db
commission:
  platform_fee_permille: 50
  referral_permille: 0
  facilitator_permille: 125
settlement:
  hold_period: 86400s
payout:
  min_withdrawal_minor: 500
  max_withdrawal_minor: 1000000
  transfer_timeout: 2.5s
  gateway:
    target: localhost:6000
    insecure: true
intake:
  webhook_secret: whsec_full
  event_deadline: 3s
  inline_backoff: 0.25s
retry_queue:
  max_attempts: 8
  batch_size: 10
)");

  assert(config.server().bind_address() == "127.0.0.1:7000");
  assert(config.database().sqlite().path() == "/var/lib/settlement/ledger.db");
  assert(config.commission().platform_fee_permille() == 50);
  // Explicit zero is kept, not defaulted.
  assert(config.commission().has_referral_permille());
  assert(config.commission().referral_permille() == 0);
  assert(config.commission().facilitator_permille() == 125);
  assert(config.settlement().hold_period().seconds() == 86400);
  assert(config.payout().min_withdrawal_minor() == 500);
  assert(config.payout().max_withdrawal_minor() == 1000000);
  assert(config.payout().transfer_timeout().seconds() == 2);
  assert(config.payout().transfer_timeout().nanos() == 500'000'000);
  assert(config.payout().gateway().insecure());
  assert(config.intake().event_deadline().seconds() == 3);
  assert(config.intake().inline_backoff().nanos() == 250'000'000);
  assert(config.retry_queue().max_attempts() == 8);
  assert(config.retry_queue().batch_size() == 10);
}

void TestQuotedNumbersStayStrings() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(payout:
  gateway:
    target: "10.0.0.7:443"
intake:
  webhook_secret: "12345"
)");

  assert(config.intake().webhook_secret() == "12345");
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash", std::string(kMinimal) + R"(database:
  sqlite:
    path: "C:\\settlement\\\"quoted\"\\ledger.db"
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\settlement\\\"quoted\"\\ledger.db");
}

void TestScalarEscapingForNewlineAndUnicode() {
  const auto config = ConfigLoader::LoadFromYamlString(std::string(kMinimal) + R"(server:
  bind_address: "line1\nline2☃"
)");

  assert(config.server().bind_address() == std::string("line1\nline2☃"));
}

void TestUnknownFieldsAreRejected() {
  assert(Rejected(std::string(kMinimal) + "unknown_field: 123\n", "Invalid configuration"));
  assert(Rejected(std::string(kMinimal) + "commission:\n  referal_permille: 10\n", "Invalid configuration"));
}

void TestInvalidValuesAreRejected() {
  assert(Rejected(std::string(kMinimal) + "commission:\n  platform_fee_permille: 500\n  referral_permille: 300\n  facilitator_permille: 200\n",
                  "commission"));
  assert(Rejected(std::string(kMinimal) + "database:\n  sqlite:\n    path: \"\"\n", "database.sqlite.path"));
  assert(Rejected(std::string(kMinimal) + "database:\n  postgres:\n    max_connections: 4\n", "database.postgres.connection_uri"));
  assert(Rejected(R"(payout:
  min_withdrawal_minor: 1000
  max_withdrawal_minor: 500
  gateway:
    target: localhost:6000
intake:
  webhook_secret: s
)",
                  "payout.max_withdrawal_minor"));
  assert(Rejected("intake:\n  webhook_secret: s\n", "payout.gateway.target"));
  assert(Rejected("payout:\n  gateway:\n    target: localhost:6000\n", "intake.webhook_secret"));
}

void TestEmptyDocumentNeedsSecretAndGateway() {
  assert(Rejected("", "Invalid configuration"));
}

void TestSecretFromEnvironment() {
  setenv("SETTLEMENT_WEBHOOK_SECRET", "whsec_env", 1);
  const auto from_env = ConfigLoader::LoadFromYamlString("payout:\n  gateway:\n    target: localhost:6000\n");
  assert(from_env.intake().webhook_secret() == "whsec_env");

  // Environment wins over the file.
  const auto overridden = ConfigLoader::LoadFromYamlString(kMinimal);
  assert(overridden.intake().webhook_secret() == "whsec_env");
  unsetenv("SETTLEMENT_WEBHOOK_SECRET");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    ConfigLoader::LoadFromYaml("/nonexistent/settlement/config.yaml");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("Failed to load YAML config") != std::string::npos;
  }
  assert(threw);
}

} // namespace

int main() {
  unsetenv("SETTLEMENT_WEBHOOK_SECRET");

  TestMinimalConfigGetsDefaults();
  TestFullConfig();
  TestQuotedNumbersStayStrings();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestUnknownFieldsAreRejected();
  TestInvalidValuesAreRejected();
  TestEmptyDocumentNeedsSecretAndGateway();
  TestSecretFromEnvironment();
  TestMissingFileIsReported();

  std::cout << "settlement_unit_config_loader: pass\n";
  return 0;
}
