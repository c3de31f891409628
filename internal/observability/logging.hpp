#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace chadoxml::runtime::config {
class RuntimeConfig;
}

namespace chadoxml::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField UintField(std::string_view key, std::uint64_t value);
LogField BoolField(std::string_view key, bool value);

// Logger writes to stderr; stdout is reserved for the document.
void InitializeLogging(const chadoxml::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

/*
  Nested progress logging.

      LogBegin("Reading experiment...");
        ...messages here are indented one level...
      LogEnd("Done.");

  Indentation only shows when the nested prefix is enabled. Unbalanced
  LogEnd calls clamp at depth zero.
*/
void LogBegin(std::string_view message, spdlog::level::level_enum level = spdlog::level::info);
void LogEnd(std::string_view message, spdlog::level::level_enum level = spdlog::level::info,
            std::initializer_list<LogField> fields = {});

int NestingDepth();

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

} // namespace chadoxml::observability

#define CHADOXML_LOG_DEBUG(message, ...) ::chadoxml::observability::LogDebug((message), ##__VA_ARGS__)
#define CHADOXML_LOG_INFO(message, ...) ::chadoxml::observability::LogInfo((message), ##__VA_ARGS__)
#define CHADOXML_LOG_WARN(message, ...) ::chadoxml::observability::LogWarn((message), ##__VA_ARGS__)
#define CHADOXML_LOG_ERROR(message, ...) ::chadoxml::observability::LogError((message), ##__VA_ARGS__)
