#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace crosslane::observability {

struct LogField {
    std::string key;
    std::string value;
};

struct LoggingConfig {
    std::string level;
    std::string pattern;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField UIntField(std::string_view key, std::uint64_t value);
LogField BoolField(std::string_view key, bool value);

// Level and pattern fall back to CROSSLANE_LOG_LEVEL / CROSSLANE_LOG_PATTERN,
// then to built-in defaults.
void InitializeLogging(const LoggingConfig& config);
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

} // namespace crosslane::observability

#define CROSSLANE_LOG_DEBUG(message, ...) ::crosslane::observability::LogDebug((message), ##__VA_ARGS__)
#define CROSSLANE_LOG_INFO(message, ...) ::crosslane::observability::LogInfo((message), ##__VA_ARGS__)
#define CROSSLANE_LOG_WARN(message, ...) ::crosslane::observability::LogWarn((message), ##__VA_ARGS__)
#define CROSSLANE_LOG_ERROR(message, ...) ::crosslane::observability::LogError((message), ##__VA_ARGS__)
