#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace taskengine::runtime::config {
class RuntimeConfig;
}

namespace taskengine::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField UintField(std::string_view key, std::uint64_t value);

void InitializeLogging(const taskengine::runtime::config::RuntimeConfig& config);

// Default logger for tools and tests that run without a config file.
void InitializeDefaultLogging();
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

} // namespace taskengine::observability

#define TASKENGINE_LOG_INFO(message, ...) ::taskengine::observability::LogInfo((message), ##__VA_ARGS__)
#define TASKENGINE_LOG_WARN(message, ...) ::taskengine::observability::LogWarn((message), ##__VA_ARGS__)
#define TASKENGINE_LOG_ERROR(message, ...) ::taskengine::observability::LogError((message), ##__VA_ARGS__)
