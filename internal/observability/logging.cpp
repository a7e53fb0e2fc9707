#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace docrev::observability {
namespace {

std::string ResolveLevel(const docrev::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("DOCREV_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  return "warn";
}

// spdlog::level::from_str maps unknown names to "off", which would hide
// every warning; reject typos instead.
spdlog::level::level_enum ParseLevel(const std::string& name) {
  static constexpr const char* kNames[] = {"trace", "debug", "info", "warn", "warning",
                                           "err",   "error", "critical", "off"};
  for (const char* known : kNames) {
    if (name == known) {
      return spdlog::level::from_str(name);
    }
  }
  throw util::InvalidArgument("unknown log level: " + name);
}

std::string ResolvePattern(const docrev::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("DOCREV_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=' << field.value;
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

void InitializeLogging(const docrev::runtime::config::RuntimeConfig& config) {
  // stderr keeps stdout free for JSON output of the CLI
  auto logger = spdlog::get("docrev");
  if (!logger) {
    logger = spdlog::stderr_color_mt("docrev");
  }
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(ParseLevel(ResolveLevel(config)));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto serialized_fields = SerializeFields(fields);

  if (!serialized_fields.empty()) {
    spdlog::log(level, "{} {}", message, serialized_fields);
    return;
  }
  spdlog::log(level, "{}", message);
}

} // namespace docrev::observability
