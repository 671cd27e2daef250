#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace weave::observability {
namespace {

constexpr const char* kLoggerName = "weave";

std::string Pick(const char* env_name, const std::string& configured) {
  if (const char* value = std::getenv(env_name)) {
    return value;
  }
  return configured;
}

spdlog::level::level_enum ParseLevel(const std::string& name, spdlog::level::level_enum fallback) {
  if (name.empty()) {
    return fallback;
  }
  const auto level = spdlog::level::from_str(name);
  // from_str maps anything it does not know to off.
  if (level == spdlog::level::off && name != "off") {
    throw std::invalid_argument("unknown log level: " + name);
  }
  return level;
}

ConsoleTarget ParseConsole(const std::string& name) {
  if (name.empty() || name == "stdout") return ConsoleTarget::kStdout;
  if (name == "stderr") return ConsoleTarget::kStderr;
  if (name == "none") return ConsoleTarget::kNone;
  throw std::invalid_argument("unknown log console target: " + name);
}

bool NeedsQuotes(const std::string& value) {
  if (value.empty()) {
    return true;
  }
  for (char c : value) {
    if (c == ' ' || c == '\t' || c == '\n' || c == '"' || c == '=') {
      return true;
    }
  }
  return false;
}

void AppendValue(std::string& out, const std::string& value) {
  if (!NeedsQuotes(value)) {
    out += value;
    return;
  }
  out += '"';
  for (char c : value) {
    if (c == '"' || c == '\\') {
      out += '\\';
      out += c;
    } else if (c == '\n') {
      out += "\\n";
    } else {
      out += c;
    }
  }
  out += '"';
}

std::vector<spdlog::sink_ptr> BuildSinks(const LogSettings& settings) {
  std::vector<spdlog::sink_ptr> sinks;
  switch (settings.console) {
    case ConsoleTarget::kStdout:
      sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
      break;
    case ConsoleTarget::kStderr:
      sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
      break;
    case ConsoleTarget::kNone:
      break;
  }
  if (!settings.file.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(settings.file, /*truncate=*/false));
  }
  return sinks;
}

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

LogSettings ResolveLogSettings(const weave::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  LogSettings settings;
  settings.level       = ParseLevel(Pick("WEAVE_LOG_LEVEL", logging.level()), settings.level);
  settings.flush_level = ParseLevel(logging.flush_level(), settings.flush_level);
  settings.console     = ParseConsole(logging.console());
  settings.file        = Pick("WEAVE_LOG_FILE", logging.file());

  const auto pattern = Pick("WEAVE_LOG_PATTERN", logging.pattern());
  if (!pattern.empty()) {
    settings.pattern = pattern;
  }
  return settings;
}

void InitializeLogging(const LogSettings& settings) {
  auto sinks  = BuildSinks(settings);
  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(settings.pattern);
  logger->set_level(settings.level);
  logger->flush_on(settings.flush_level);

  spdlog::drop(kLoggerName);
  spdlog::set_default_logger(std::move(logger));
}

void InitializeLogging(const weave::runtime::config::RuntimeConfig& config) {
  InitializeLogging(ResolveLogSettings(config));
}

void ShutdownLogging() {
  spdlog::shutdown();
}

std::string FormatRecord(std::string_view message, std::initializer_list<LogField> fields) {
  std::string out(message);
  for (const auto& field : fields) {
    out += ' ';
    out += field.key;
    out += '=';
    AppendValue(out, field.value);
  }
  return out;
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }
  spdlog::log(level, "{}", FormatRecord(message, fields));
}

} // namespace weave::observability
