#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace llrp::runtime::config {
class RuntimeConfig;
}

namespace llrp::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

void InitializeLogging(const llrp::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

/*
  Tags every line logged on the calling thread with reader=<label> until the
  scope ends. Scopes nest; the previous label is restored on exit. An empty
  label suppresses the field.
*/
class ReaderLogScope {
 public:
  explicit ReaderLogScope(std::string label);
  ~ReaderLogScope();

  ReaderLogScope(const ReaderLogScope&)            = delete;
  ReaderLogScope& operator=(const ReaderLogScope&) = delete;

 private:
  std::string previous_;
};

// Label of the innermost ReaderLogScope on this thread, empty outside one.
const std::string& CurrentReaderLabel();

// Message followed by the reader label and the key=value fields.
std::string FormatLogLine(std::string_view message, std::initializer_list<LogField> fields);

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

} // namespace llrp::observability

#define LLRP_LOG_DEBUG(message, ...) ::llrp::observability::LogDebug((message), ##__VA_ARGS__)
#define LLRP_LOG_INFO(message, ...) ::llrp::observability::LogInfo((message), ##__VA_ARGS__)
#define LLRP_LOG_WARN(message, ...) ::llrp::observability::LogWarn((message), ##__VA_ARGS__)
#define LLRP_LOG_ERROR(message, ...) ::llrp::observability::LogError((message), ##__VA_ARGS__)
