#include "s3session/logging.hpp"
#include "s3session/types.hpp"

#include <cstdlib>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace s3session {
namespace logging {
namespace {

constexpr char kLoggerName[] = "s3session";
constexpr char kPattern[] = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::string ResolveLevel(const Config& cfg) {
    if (!cfg.log_level.empty()) {
        return cfg.log_level;
    }

    if (const char* level = std::getenv("S3S_LOG_LEVEL")) {
        return level;
    }

    return "info";
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

std::mutex g_logger_mutex;

std::shared_ptr<spdlog::logger> Logger() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    auto logger = spdlog::get(kLoggerName);
    if (!logger) {
        // Logging before InitializeLogging() still goes somewhere.
        logger = spdlog::stdout_color_mt(kLoggerName);
        logger->set_pattern(kPattern);
    }
    return logger;
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

bool ParseLogLevel(std::string_view name, spdlog::level::level_enum* level) {
    // from_str maps unknown names to off.
    const auto parsed = spdlog::level::from_str(std::string(name));
    if (parsed == spdlog::level::off && name != "off") {
        return false;
    }
    if (level != nullptr) {
        *level = parsed;
    }
    return true;
}

void InitializeLogging(const Config& cfg) {
    auto logger = Logger();
    logger->set_pattern(kPattern);
    spdlog::level::level_enum level = spdlog::level::info;
    if (!ParseLogLevel(ResolveLevel(cfg), &level)) {
        level = spdlog::level::info;
    }
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

void ShutdownLogging() {
    if (auto logger = spdlog::get(kLoggerName)) {
        logger->flush();
    }
    spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
    auto logger = Logger();
    if (!logger->should_log(level)) {
        return;
    }

    const std::string serialized = SerializeFields(fields);
    if (serialized.empty()) {
        logger->log(level, "{}", message);
    } else {
        logger->log(level, "{} {}", message, serialized);
    }
}

} // namespace logging
} // namespace s3session
