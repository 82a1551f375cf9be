#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

#include "internal/observability/routes.hpp"

namespace narrative::runtime::config {
class RuntimeConfig;
}

namespace narrative::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
// rpc.method=<CurationService method>
LogField RouteField(Route route);

void InitializeLogging(const narrative::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

// Fields render as key=value; values containing spaces are quoted.
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

} // namespace narrative::observability

#define NARRATIVE_LOG_INFO(message, ...) ::narrative::observability::LogInfo((message), ##__VA_ARGS__)
#define NARRATIVE_LOG_WARN(message, ...) ::narrative::observability::LogWarn((message), ##__VA_ARGS__)
#define NARRATIVE_LOG_ERROR(message, ...) ::narrative::observability::LogError((message), ##__VA_ARGS__)
