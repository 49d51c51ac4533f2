#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace lending::observability {
namespace {

constexpr const char* kLoggerName     = "lending-ledger";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::string FromEnvOr(const char* name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(name)) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

bool NeedsQuoting(const std::string& value) {
  return value.empty() || value.find_first_of(" \"=") != std::string::npos;
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool               first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=';
    if (!NeedsQuoting(field.value)) {
      out << field.value;
      continue;
    }
    out << '"';
    for (char c : field.value) {
      if (c == '"' || c == '\\') out << '\\';
      out << c;
    }
    out << '"';
  }
  return out.str();
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField UintField(std::string_view key, std::uint64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const lending::runtime::config::RuntimeConfig& config) {
  const auto level_name = FromEnvOr("LENDING_LOG_LEVEL", config.logging().level(), "info");
  const auto pattern    = FromEnvOr("LENDING_LOG_PATTERN", config.logging().pattern(), kDefaultPattern);
  const auto file       = FromEnvOr("LENDING_LOG_FILE", config.logging().file(), "");

  std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::stdout_color_sink_mt>()};
  if (!file.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file));
  }

  // spdlog maps unknown names to "off".
  auto level   = spdlog::level::from_str(level_name);
  bool unknown = level == spdlog::level::off && level_name != "off";
  if (unknown) level = spdlog::level::info;

  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(pattern);
  logger->set_level(level);

  spdlog::drop(kLoggerName);
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  if (unknown) {
    LogWarn("Unknown log level, using info", {StringField("level", level_name)});
  }
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto serialized_fields = SerializeFields(fields);
  if (serialized_fields.empty()) {
    spdlog::log(level, "{}", message);
    return;
  }
  spdlog::log(level, "{} {}", message, serialized_fields);
}

} // namespace lending::observability
