#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace llrp::observability {
namespace {

constexpr const char* kLoggerName = "llrp-engine";

thread_local std::string reader_label;

std::string ResolveLevel(const llrp::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("LLRP_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  return "info";
}

std::string ResolvePattern(const llrp::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("LLRP_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
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

void InitializeLogging(const llrp::runtime::config::RuntimeConfig& config) {
  spdlog::drop(kLoggerName);
  auto logger = spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(spdlog::level::from_str(ResolveLevel(config)));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

ReaderLogScope::ReaderLogScope(std::string label) : previous_(std::exchange(reader_label, std::move(label))) {
}

ReaderLogScope::~ReaderLogScope() {
  reader_label = std::move(previous_);
}

const std::string& CurrentReaderLabel() {
  return reader_label;
}

std::string FormatLogLine(std::string_view message, std::initializer_list<LogField> fields) {
  std::ostringstream out;
  out << message;
  if (!reader_label.empty()) {
    out << " reader=" << reader_label;
  }
  for (const auto& field : fields) {
    out << ' ' << field.key << '=' << field.value;
  }
  return out.str();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }
  spdlog::log(level, "{}", FormatLogLine(message, fields));
}

} // namespace llrp::observability
