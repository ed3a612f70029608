#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/otlp_target.hpp"

namespace settlement::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

struct MetricsOptions {
  bool         request_metrics_enabled{true};
  bool         event_metrics_enabled{true};
  bool         payout_metrics_enabled{true};
  bool         request_latency_histograms_enabled{true};
  bool         route_labels_enabled{true};
  std::uint32_t interval_ms{1000};
  std::uint32_t export_timeout_ms{0};
};

MetricsOptions g_metrics_options;

std::unique_ptr<sdkmetrics::PushMetricExporter> BuildExporter(const OtlpTarget& target) {
  if (target.http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = target.endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = target.endpoint;
  options.use_ssl_credentials = !target.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

bool Install(const OtlpTarget& target) {
  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(g_metrics_options.interval_ms);
  if (g_metrics_options.export_timeout_ms > 0) {
    reader_options.export_timeout_millis = std::chrono::milliseconds(g_metrics_options.export_timeout_ms);
  }
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(BuildExporter(target), reader_options);

  auto res   = resource::Resource::Create({{"service.name", target.service_name}});
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), res);
  g_provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

// The Record/Add signatures with an explicit context differ across SDK releases.
template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> event_outcomes;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> payout_outcomes;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> matured_entries;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   retry_queue_depth_gauge;

  std::atomic<std::int64_t> retry_queue_depth{0};
};

bool InitializeMetrics(const settlement::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto& metric_config = observability.metrics();
  const auto  configured_ms = metric_config.collection_interval_ms() > 0 ? metric_config.collection_interval_ms() : 1000U;

  g_metrics_options.request_metrics_enabled            = metric_config.request_metrics_enabled();
  g_metrics_options.event_metrics_enabled              = metric_config.event_metrics_enabled();
  g_metrics_options.payout_metrics_enabled             = metric_config.payout_metrics_enabled();
  g_metrics_options.request_latency_histograms_enabled = metric_config.request_latency_histograms_enabled();
  g_metrics_options.route_labels_enabled               = metric_config.route_labels_enabled();
  g_metrics_options.interval_ms                        = std::max(metric_config.min_collection_interval_ms(), configured_ms);
  g_metrics_options.export_timeout_ms                  = metric_config.export_timeout_ms();

  return Install(ResolveOtlpTarget(observability, "metrics"));
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("settlement-engine", "1.0.0");

  impl_->request_count      = impl_->meter->CreateUInt64Counter("settlement.request.count", "Total number of service requests", "1");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("settlement.request.latency_ms", "End-to-end request latency", "ms");
  impl_->event_outcomes     = impl_->meter->CreateUInt64Counter("settlement.events.processed", "Processor events by type and disposition", "1");
  impl_->payout_outcomes    = impl_->meter->CreateUInt64Counter("settlement.payouts", "Withdrawal requests by outcome", "1");
  impl_->matured_entries    = impl_->meter->CreateUInt64Counter("settlement.ledger.matured", "Ledger entries promoted from held to available", "1");

  impl_->retry_queue_depth_gauge = impl_->meter->CreateInt64ObservableGauge("settlement.retry_queue.depth", "Events waiting for retry", "1");
  impl_->retry_queue_depth_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl       = static_cast<Impl*>(state);
        auto  int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        int_result->Observe(impl->retry_queue_depth.load());
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_ || !impl_->request_count || !g_metrics_options.request_metrics_enabled) {
    return;
  }

  const std::string route_label(route);
  if (g_metrics_options.route_labels_enabled) {
    const std::initializer_list<AttributePair> attributes = {{"route", route_label}, {"success", success}};
    AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"success", success}};
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms || !g_metrics_options.request_metrics_enabled || !g_metrics_options.request_latency_histograms_enabled) {
    return;
  }

  const std::string route_label(route);
  if (g_metrics_options.route_labels_enabled) {
    const std::initializer_list<AttributePair> attributes = {{"route", route_label}};
    RecordWithAttributes(impl_->request_latency_ms, latency_ms, attributes);
    return;
  }

  RecordWithAttributes(impl_->request_latency_ms, latency_ms, std::initializer_list<AttributePair>{});
}

void Metrics::RecordEventOutcome(std::string_view event_type, std::string_view disposition) {
  if (!impl_ || !impl_->event_outcomes || !g_metrics_options.event_metrics_enabled) {
    return;
  }

  const std::string                          type_label(event_type);
  const std::string                          disposition_label(disposition);
  const std::initializer_list<AttributePair> attributes = {{"event_type", type_label}, {"disposition", disposition_label}};
  AddWithAttributes(impl_->event_outcomes, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordPayoutOutcome(std::string_view status, std::string_view reason) {
  if (!impl_ || !impl_->payout_outcomes || !g_metrics_options.payout_metrics_enabled) {
    return;
  }

  const std::string                          status_label(status);
  const std::string                          reason_label(reason);
  const std::initializer_list<AttributePair> attributes = {{"status", status_label}, {"reason", reason_label}};
  AddWithAttributes(impl_->payout_outcomes, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::AddMaturedEntries(std::uint64_t count) {
  if (!impl_ || !impl_->matured_entries || count == 0) {
    return;
  }
  AddWithAttributes(impl_->matured_entries, count, std::initializer_list<AttributePair>{});
}

void Metrics::SetRetryQueueDepth(std::uint64_t depth) {
  if (!impl_) {
    return;
  }
  impl_->retry_queue_depth.store(static_cast<std::int64_t>(depth));
}

} // namespace settlement::observability

#endif
