#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace taskengine::observability {
namespace {

constexpr const char* kLoggerName     = "task-engine";
constexpr const char* kDefaultLevel   = "info";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

// Environment first, then config, then the built-in default.
std::string Resolve(const char* env_var, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env_var); value != nullptr && *value != '\0') {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

// Error messages and paths carry spaces; quote them so a line stays
// splittable on ' ' and '='.
void AppendValue(std::string& out, const std::string& value) {
  if (!value.empty() && value.find_first_of(" \"=") == std::string::npos) {
    out += value;
    return;
  }

  out += '"';
  for (const char c : value) {
    if (c == '"' || c == '\\') out += '\\';
    out += c;
  }
  out += '"';
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::string out;
  for (const auto& field : fields) {
    if (!out.empty()) out += ' ';
    out += field.key;
    out += '=';
    AppendValue(out, field.value);
  }
  return out;
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

LogField UintField(std::string_view key, std::uint64_t value) {
  return {std::string(key), std::to_string(value)};
}

void InitializeLogging(const taskengine::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }
  logger->set_pattern(Resolve("TASKENGINE_LOG_PATTERN", config.logging().pattern(), kDefaultPattern));
  logger->set_level(spdlog::level::from_str(Resolve("TASKENGINE_LOG_LEVEL", config.logging().level(), kDefaultLevel)));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void InitializeDefaultLogging() {
  InitializeLogging(taskengine::runtime::config::RuntimeConfig{});
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (fields.size() == 0) {
    spdlog::log(level, "{}", message);
    return;
  }
  spdlog::log(level, "{} {}", message, SerializeFields(fields));
}

} // namespace taskengine::observability
