#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace weave::runtime::config {
class RuntimeConfig;
}

namespace weave::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

enum class ConsoleTarget { kStdout, kStderr, kNone };

// Effective sink setup. WEAVE_LOG_LEVEL, WEAVE_LOG_PATTERN and WEAVE_LOG_FILE
// take precedence over the config file.
struct LogSettings {
  spdlog::level::level_enum level{spdlog::level::info};
  spdlog::level::level_enum flush_level{spdlog::level::warn};
  std::string               pattern{"%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%t] %v"};
  ConsoleTarget             console{ConsoleTarget::kStdout};
  std::string               file;
};

// Throws std::invalid_argument on an unknown level or console target.
LogSettings ResolveLogSettings(const weave::runtime::config::RuntimeConfig& config);

void InitializeLogging(const LogSettings& settings);
void InitializeLogging(const weave::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

// "message k=v k2=\"v with spaces\""; values with blanks, quotes or '=' are quoted.
std::string FormatRecord(std::string_view message, std::initializer_list<LogField> fields);

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace weave::observability

#define WEAVE_LOG_DEBUG(message, ...) ::weave::observability::LogDebug((message), ##__VA_ARGS__)
#define WEAVE_LOG_INFO(message, ...) ::weave::observability::LogInfo((message), ##__VA_ARGS__)
#define WEAVE_LOG_WARN(message, ...) ::weave::observability::LogWarn((message), ##__VA_ARGS__)
#define WEAVE_LOG_ERROR(message, ...) ::weave::observability::LogError((message), ##__VA_ARGS__)
