#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace settlement::runtime::config {
class RuntimeConfig;
}

namespace settlement::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
// Minor units rendered as a decimal amount, "amount=12.50".
LogField AmountField(std::string_view key, std::int64_t minor);

void InitializeLogging(const settlement::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace settlement::observability

#define SETTLEMENT_LOG_INFO(message, ...) ::settlement::observability::LogInfo((message), ##__VA_ARGS__)
#define SETTLEMENT_LOG_WARN(message, ...) ::settlement::observability::LogWarn((message), ##__VA_ARGS__)
#define SETTLEMENT_LOG_ERROR(message, ...) ::settlement::observability::LogError((message), ##__VA_ARGS__)
