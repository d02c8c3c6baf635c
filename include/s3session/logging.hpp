#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace s3session {

struct Config;

namespace logging {

struct LogField {
    std::string key;
    std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Accepts spdlog level names (trace, debug, info, warn, warning, err,
// error, critical, off). Returns false for anything else.
bool ParseLogLevel(std::string_view name, spdlog::level::level_enum* level);

// Installs the "s3session" stdout logger. Level comes from cfg.log_level,
// then S3S_LOG_LEVEL, then "info". An unknown name falls back to "info".
// Safe to call more than once.
void InitializeLogging(const Config& cfg);
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

} // namespace logging
} // namespace s3session

#define S3SESSION_LOG_DEBUG(message, ...) ::s3session::logging::LogDebug((message), ##__VA_ARGS__)
#define S3SESSION_LOG_INFO(message, ...) ::s3session::logging::LogInfo((message), ##__VA_ARGS__)
#define S3SESSION_LOG_WARN(message, ...) ::s3session::logging::LogWarn((message), ##__VA_ARGS__)
#define S3SESSION_LOG_ERROR(message, ...) ::s3session::logging::LogError((message), ##__VA_ARGS__)
