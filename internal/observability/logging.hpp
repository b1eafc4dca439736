#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace rowsweep::runtime::config {
class RuntimeConfig;
}

namespace rowsweep::observability {

/*
  Structured fields appended to the message as key=value pairs:

      page failed, stopping page=5 committed_pages=4 total_pages=10 error="page 5: Busy: injected failure"

  Values holding spaces, quotes or '=' are double-quoted so a line
  splits back into the same pairs. Sweep lines carry page= and
  committed_pages=; retries add attempt= and backoff_ms=.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField UintField(std::string_view key, std::uint64_t value);
LogField DoubleField(std::string_view key, double value);
LogField BoolField(std::string_view key, bool value);

std::string FormatFields(std::initializer_list<LogField> fields);

// Logs go to stderr; stdout is reserved for the progress line.
void InitializeLogging(const rowsweep::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

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

} // namespace rowsweep::observability

#define ROWSWEEP_LOG_DEBUG(message, ...) ::rowsweep::observability::LogDebug((message), ##__VA_ARGS__)
#define ROWSWEEP_LOG_INFO(message, ...) ::rowsweep::observability::LogInfo((message), ##__VA_ARGS__)
#define ROWSWEEP_LOG_WARN(message, ...) ::rowsweep::observability::LogWarn((message), ##__VA_ARGS__)
#define ROWSWEEP_LOG_ERROR(message, ...) ::rowsweep::observability::LogError((message), ##__VA_ARGS__)
