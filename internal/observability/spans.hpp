#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace settlement::runtime::config {
class RuntimeConfig;
}

namespace settlement::observability {

// Both return false when the build has no OpenTelemetry or the signal is
// disabled in config. Shutdown flushes pending exports.
bool InitializeTracing(const settlement::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const settlement::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

// Active span for the enclosing scope; a no-op without a tracer.
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  // disposition: applied | ignored | queued_for_retry | dead_lettered
  void RecordEventOutcome(std::string_view event_type, std::string_view disposition);
  void RecordPayoutOutcome(std::string_view status, std::string_view reason);
  void AddMaturedEntries(std::uint64_t count);
  void SetRetryQueueDepth(std::uint64_t depth);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const settlement::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const settlement::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordEventOutcome(std::string_view, std::string_view) {
}

inline void Metrics::RecordPayoutOutcome(std::string_view, std::string_view) {
}

inline void Metrics::AddMaturedEntries(std::uint64_t) {
}

inline void Metrics::SetRetryQueueDepth(std::uint64_t) {
}
#endif

} // namespace settlement::observability
