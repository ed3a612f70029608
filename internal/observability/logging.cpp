#include "internal/observability/logging.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdlib>
#include <iterator>
#include <string>

#include "config/config.pb.h"
#include "internal/util/money.hpp"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace settlement::observability {
namespace {

constexpr const char* kLoggerName     = "settlement-engine";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

// Raw processor bodies are logged for triage only; the dead-letter row
// keeps the full copy.
constexpr std::size_t kMaxValueBytes = 256;

struct LogSettings {
  std::string level{"info"};
  std::string pattern{kDefaultPattern};
  bool        include_trace_context{false};
};

// Environment wins over the file so operators can raise verbosity
// without editing config.
LogSettings ResolveSettings(const settlement::runtime::config::RuntimeConfig& config) {
  LogSettings settings;
  const auto& logging = config.logging();

  if (const char* level = std::getenv("SETTLEMENT_LOG_LEVEL")) {
    settings.level = level;
  } else if (!logging.level().empty()) {
    settings.level = logging.level();
  }

  if (const char* pattern = std::getenv("SETTLEMENT_LOG_PATTERN")) {
    settings.pattern = pattern;
  } else if (!logging.pattern().empty()) {
    settings.pattern = logging.pattern();
  }

  if (const char* include_trace = std::getenv("SETTLEMENT_LOG_INCLUDE_TRACE_CONTEXT")) {
    const std::string value(include_trace);
    settings.include_trace_context = value == "1" || value == "true";
  } else {
    settings.include_trace_context = logging.include_trace_context();
  }
  return settings;
}

std::atomic<bool> g_include_trace_context{false};

enum class Treatment {
  kPlain,
  kRedacted,
  kTruncated,
};

// Webhook secrets and signature headers never reach the sink.
Treatment TreatmentFor(const std::string& key) {
  if (key.find("secret") != std::string::npos || key.find("signature") != std::string::npos) {
    return Treatment::kRedacted;
  }
  if (key.find("payload") != std::string::npos || key == "body") {
    return Treatment::kTruncated;
  }
  return Treatment::kPlain;
}

void AppendValue(fmt::memory_buffer& out, const std::string& value, Treatment treatment) {
  if (treatment == Treatment::kRedacted) {
    fmt::format_to(std::back_inserter(out), "<redacted>");
    return;
  }

  std::string_view shown(value);
  const bool       truncated = treatment == Treatment::kTruncated && shown.size() > kMaxValueBytes;
  if (truncated) {
    shown = shown.substr(0, kMaxValueBytes);
  }

  const bool quote = shown.empty() || shown.find_first_of(" \t\"=") != std::string_view::npos;
  if (!quote) {
    fmt::format_to(std::back_inserter(out), "{}", shown);
  } else {
    out.push_back('"');
    for (const char c : shown) {
      if (c == '"' || c == '\\') {
        out.push_back('\\');
      }
      out.push_back(c);
    }
    out.push_back('"');
  }
  if (truncated) {
    fmt::format_to(std::back_inserter(out), "...({} bytes)", value.size());
  }
}

#ifdef ENABLE_OTEL
void AppendHex(fmt::memory_buffer& out, const uint8_t* data, std::size_t size) {
  for (std::size_t i = 0; i < size; ++i) {
    fmt::format_to(std::back_inserter(out), "{:02x}", data[i]);
  }
}

void AppendTraceContext(fmt::memory_buffer& out) {
  if (!g_include_trace_context.load(std::memory_order_relaxed)) {
    return;
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span || !span->GetContext().IsValid()) {
    return;
  }

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  span->GetContext().trace_id().CopyBytesTo(trace_bytes);
  span->GetContext().span_id().CopyBytesTo(span_bytes);

  fmt::format_to(std::back_inserter(out), " trace_id=");
  AppendHex(out, trace_bytes, sizeof(trace_bytes));
  fmt::format_to(std::back_inserter(out), " span_id=");
  AppendHex(out, span_bytes, sizeof(span_bytes));
}
#else
void AppendTraceContext(fmt::memory_buffer&) {
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField AmountField(std::string_view key, std::int64_t minor) {
  return {std::string(key), settlement::util::FormatMinor(minor)};
}

void InitializeLogging(const settlement::runtime::config::RuntimeConfig& config) {
  const auto settings = ResolveSettings(config);

  // Re-initialization replaces the registered logger.
  spdlog::drop(kLoggerName);
  auto logger = spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern(settings.pattern);
  logger->set_level(spdlog::level::from_str(settings.level));
  spdlog::set_default_logger(std::move(logger));
  // Money movements are logged at info; flush those promptly too.
  spdlog::flush_on(spdlog::level::info);
  g_include_trace_context.store(settings.include_trace_context, std::memory_order_relaxed);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }

  fmt::memory_buffer line;
  fmt::format_to(std::back_inserter(line), "{}", message);
  for (const auto& field : fields) {
    fmt::format_to(std::back_inserter(line), " {}=", field.key);
    AppendValue(line, field.value, TreatmentFor(field.key));
  }
  AppendTraceContext(line);

  spdlog::log(level, "{}", std::string_view(line.data(), line.size()));
}

} // namespace settlement::observability
