#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace settlement::config {

using settlement::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("12345" as a secret)
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  RuntimeConfig config;

  // empty document: all defaults
  if (yaml.IsNull()) {
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

static void SetDurationIfUnset(google::protobuf::Duration* duration, int64_t seconds, int32_t nanos = 0) {
  if (duration->seconds() == 0 && duration->nanos() == 0) {
    duration->set_seconds(seconds);
    duration->set_nanos(nanos);
  }
}

static void ApplyEnvironmentOverrides(RuntimeConfig& config) {
  if (const char* secret = std::getenv("SETTLEMENT_WEBHOOK_SECRET")) {
    config.mutable_intake()->set_webhook_secret(secret);
  }
}

static RuntimeConfig Finish(RuntimeConfig config) {
  ApplyEnvironmentOverrides(config);
  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  return Finish(ParseYaml(yaml));
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  return Finish(ParseYaml(yaml));
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address("0.0.0.0:50051");
  }

  if (config.database().backend_case() == settlement::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    config.mutable_database()->mutable_memory();
  }

  auto* commission = config.mutable_commission();
  if (!commission->has_platform_fee_permille()) commission->set_platform_fee_permille(100);
  if (!commission->has_referral_permille()) commission->set_referral_permille(100);
  if (!commission->has_facilitator_permille()) commission->set_facilitator_permille(200);

  auto* settlement = config.mutable_settlement();
  SetDurationIfUnset(settlement->mutable_hold_period(), 7 * 24 * 3600);
  if (settlement->max_attempts() == 0) settlement->set_max_attempts(3);

  auto* payout = config.mutable_payout();
  if (payout->min_withdrawal_minor() == 0) payout->set_min_withdrawal_minor(100);
  SetDurationIfUnset(payout->mutable_transfer_timeout(), 5);
  if (payout->max_attempts() == 0) payout->set_max_attempts(3);

  auto* intake = config.mutable_intake();
  SetDurationIfUnset(intake->mutable_signature_tolerance(), 300);
  SetDurationIfUnset(intake->mutable_event_deadline(), 10);
  if (intake->max_inline_attempts() == 0) intake->set_max_inline_attempts(3);
  SetDurationIfUnset(intake->mutable_inline_backoff(), 0, 100'000'000);

  auto* retry = config.mutable_retry_queue();
  SetDurationIfUnset(retry->mutable_poll_interval(), 5);
  SetDurationIfUnset(retry->mutable_lease(), 30);
  if (retry->max_attempts() == 0) retry->set_max_attempts(5);
  SetDurationIfUnset(retry->mutable_base_backoff(), 1);
  if (retry->batch_size() == 0) retry->set_batch_size(50);

  SetDurationIfUnset(config.mutable_maturity()->mutable_sweep_interval(), 60);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& commission = config.commission();
  if (commission.platform_fee_permille() + commission.referral_permille() + commission.facilitator_permille() >= 1000) {
    throw std::runtime_error("Invalid configuration: commission rates must sum below 1000 permille");
  }

  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
  if (config.database().has_postgres() && config.database().postgres().connection_uri().empty()) {
    throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is required");
  }

  const auto& payout = config.payout();
  if (payout.min_withdrawal_minor() < 0) {
    throw std::runtime_error("Invalid configuration: payout.min_withdrawal_minor must not be negative");
  }
  if (payout.max_withdrawal_minor() < 0 || (payout.max_withdrawal_minor() > 0 && payout.max_withdrawal_minor() < payout.min_withdrawal_minor())) {
    throw std::runtime_error("Invalid configuration: payout.max_withdrawal_minor must be 0 or at least min_withdrawal_minor");
  }
  if (payout.gateway().target().empty()) {
    throw std::runtime_error("Invalid configuration: payout.gateway.target is required");
  }

  if (config.intake().webhook_secret().empty()) {
    throw std::runtime_error("Invalid configuration: intake.webhook_secret is required (or set SETTLEMENT_WEBHOOK_SECRET)");
  }
}

} // namespace settlement::config
