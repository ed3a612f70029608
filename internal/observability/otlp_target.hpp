#pragma once

#include <cctype>
#include <cstdlib>
#include <string>
#include <string_view>

#include "config/config.pb.h"

namespace settlement::observability {

// Where one OTLP signal (traces, metrics) is exported.
struct OtlpTarget {
  std::string endpoint;
  std::string service_name{"settlement-engine"};
  bool        http     = false;
  bool        insecure = true;
};

// Endpoint precedence: config file, OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT,
// OTEL_EXPORTER_OTLP_ENDPOINT, then the collector's default port.
inline OtlpTarget ResolveOtlpTarget(const settlement::runtime::config::ObservabilityConfig& config, std::string_view signal) {
  OtlpTarget target;
  target.http     = config.transport() == settlement::runtime::config::OTLP_TRANSPORT_HTTP;
  target.endpoint = config.otlp_endpoint();
  if (!target.endpoint.empty()) return target;

  std::string signal_var = "OTEL_EXPORTER_OTLP_";
  for (char c : signal) signal_var.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  signal_var += "_ENDPOINT";

  if (const char* value = std::getenv(signal_var.c_str())) {
    target.endpoint = value;
  } else if (const char* shared = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    target.endpoint = shared;
  } else {
    target.endpoint = target.http ? "http://localhost:4318/v1/" + std::string(signal) : "localhost:4317";
  }
  return target;
}

} // namespace settlement::observability
