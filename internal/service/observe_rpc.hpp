#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace settlement::service {

/*
  Wraps one service call: span, request count and latency, and an
  error log line. Exceptions are rethrown for the transport to map.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view key, std::string_view value, Fn&& fn) {
  settlement::observability::SpanScope span(route);
  if (!key.empty()) {
    span.SetAttribute(key, value);
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto finish     = [&](bool success) {
    settlement::observability::Metrics::Instance().RecordRequest(route, success);
    settlement::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      finish(true);
      return;
    } else {
      auto result = fn();
      finish(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    SETTLEMENT_LOG_ERROR("RPC failed", {settlement::observability::StringField("route", route), settlement::observability::StringField("error", ex.what()),
                                        settlement::observability::StringField(key.empty() ? "subject" : key, value)});
    finish(false);
    throw;
  }
}

} // namespace settlement::service
