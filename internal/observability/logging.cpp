#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace chadoxml::observability {
namespace {

std::string ResolveLevel(const chadoxml::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("CHADOXML_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  return "info";
}

std::string ResolvePattern(const chadoxml::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("CHADOXML_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

bool g_nested_prefix{true};
int  g_depth{0};

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

std::string Indent() {
  if (!g_nested_prefix || g_depth <= 0) {
    return {};
  }
  return std::string(static_cast<std::size_t>(g_depth) * 2, ' ');
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

void InitializeLogging(const chadoxml::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::get("chadoxml");
  if (!logger) {
    logger = spdlog::stderr_color_mt("chadoxml");
  }
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(spdlog::level::from_str(ResolveLevel(config)));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  g_nested_prefix = !config.logging().has_nested_prefix() || config.logging().nested_prefix();
  g_depth         = 0;
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto serialized_fields = SerializeFields(fields);
  auto indent            = Indent();

  if (!serialized_fields.empty()) {
    spdlog::log(level, "{}{} {}", indent, message, serialized_fields);
    return;
  }
  spdlog::log(level, "{}{}", indent, message);
}

void LogBegin(std::string_view message, spdlog::level::level_enum level) {
  Log(level, message);
  ++g_depth;
}

void LogEnd(std::string_view message, spdlog::level::level_enum level, std::initializer_list<LogField> fields) {
  if (g_depth > 0) {
    --g_depth;
  }
  Log(level, message, fields);
}

int NestingDepth() {
  return g_depth;
}

} // namespace chadoxml::observability
