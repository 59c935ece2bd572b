#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace jobstore::runtime::config {
class RuntimeConfig;
}

namespace jobstore::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DoubleField(std::string_view key, double value);

void InitializeLogging(const jobstore::runtime::config::RuntimeConfig& config);

// Console logger with defaults; used by tools that run before config is loaded.
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

} // namespace jobstore::observability

#define JOBSTORE_LOG_INFO(message, ...) ::jobstore::observability::LogInfo((message), ##__VA_ARGS__)
#define JOBSTORE_LOG_WARN(message, ...) ::jobstore::observability::LogWarn((message), ##__VA_ARGS__)
#define JOBSTORE_LOG_ERROR(message, ...) ::jobstore::observability::LogError((message), ##__VA_ARGS__)
