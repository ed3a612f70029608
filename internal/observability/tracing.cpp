#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/samplers/always_off_factory.h>
#include <opentelemetry/sdk/trace/samplers/always_on_factory.h>
#include <opentelemetry/sdk/trace/simple_processor_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <chrono>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/otlp_target.hpp"

namespace settlement::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

using TracingConfig = settlement::runtime::config::ObservabilityConfig_TracingConfig;

namespace {
constexpr const char* kTracerName    = "settlement-engine";
constexpr const char* kTracerVersion = "1.0.0";

std::shared_ptr<sdktrace::TracerProvider>           g_sdk_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

std::unique_ptr<sdktrace::SpanExporter> BuildExporter(const OtlpTarget& target) {
  if (target.http) {
    otlp::OtlpHttpExporterOptions options;
    options.url = target.endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }

  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = target.endpoint;
  options.use_ssl_credentials = !target.insecure;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

std::unique_ptr<sdktrace::SpanProcessor> BuildProcessor(std::unique_ptr<sdktrace::SpanExporter> exporter, const TracingConfig& tracing) {
  if (tracing.processor() == TracingConfig::TRACE_PROCESSOR_SIMPLE) {
    return sdktrace::SimpleSpanProcessorFactory::Create(std::move(exporter));
  }

  sdktrace::BatchSpanProcessorOptions batch_options;
  const auto&                         batch = tracing.batch();
  if (batch.max_queue_size() > 0) batch_options.max_queue_size = batch.max_queue_size();
  if (batch.max_export_batch_size() > 0) batch_options.max_export_batch_size = batch.max_export_batch_size();
  if (batch.schedule_delay_ms() > 0) batch_options.schedule_delay_millis = std::chrono::milliseconds(batch.schedule_delay_ms());
  return sdktrace::BatchSpanProcessorFactory::Create(std::move(exporter), batch_options);
}

// nullptr keeps the SDK's parent-based default
std::unique_ptr<sdktrace::Sampler> BuildSampler(const TracingConfig& tracing) {
  switch (tracing.trace_hint()) {
    case TracingConfig::TRACE_HINT_ALWAYS:
      return sdktrace::AlwaysOnSamplerFactory::Create();
    case TracingConfig::TRACE_HINT_NEVER:
      return sdktrace::AlwaysOffSamplerFactory::Create();
    default:
      return nullptr;
  }
}

bool Install(const OtlpTarget& target, const TracingConfig& tracing) {
  auto processor = BuildProcessor(BuildExporter(target), tracing);
  auto sampler   = BuildSampler(tracing);
  auto res       = resource::Resource::Create({{"service.name", target.service_name}});

  std::unique_ptr<sdktrace::TracerProvider> provider =
      sampler ? sdktrace::TracerProviderFactory::Create(std::move(processor), res, std::move(sampler))
              : sdktrace::TracerProviderFactory::Create(std::move(processor), res);

  g_sdk_provider = std::shared_ptr<sdktrace::TracerProvider>(std::move(provider));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_sdk_provider));
  g_tracer = g_sdk_provider->GetTracer(kTracerName, kTracerVersion);
  return static_cast<bool>(g_tracer);
}

} // namespace

bool InitializeTracing(const settlement::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  return Install(ResolveOtlpTarget(observability, "traces"), observability.tracing());
}

void ShutdownTracing() {
  if (g_sdk_provider) {
    g_sdk_provider->ForceFlush();
    g_sdk_provider->Shutdown();
  }
  g_sdk_provider.reset();
  g_tracer = nullptr;
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>()) {
  if (!g_tracer) {
    auto provider = trace_api::Provider::GetTracerProvider();
    if (provider) {
      g_tracer = provider->GetTracer(kTracerName, kTracerVersion);
    }
  }

  if (!g_tracer) {
    return;
  }

  impl_->span  = g_tracer->StartSpan(std::string(name));
  impl_->scope = std::make_unique<trace_api::Scope>(g_tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (impl_ && impl_->span) {
    impl_->span->End();
  }
}

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_ && impl_->span) {
    impl_->span->SetAttribute(std::string(key), std::string(value));
  }
}

void SpanScope::RecordException(std::string_view description) {
  if (impl_ && impl_->span) {
    impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
    impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
  }
}

} // namespace settlement::observability

#endif
