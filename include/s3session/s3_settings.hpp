#pragma once

#include "types.hpp"
#include <cstdint>
#include <cstdlib>
#include <string>

namespace s3session {

namespace s3_defaults {
    constexpr char kEndpoint[] = "http://localhost";
    constexpr char kRegion[] = "us-east-1";
    constexpr char kBucket[] = "mybucket";
    constexpr char kAccessKeyId[] = "FAKEACCESS";
    constexpr char kSecretAccessKey[] = "FAKESECRET";
    constexpr bool kUsePathStyle = true;
    constexpr char kOutputDir[] = ".";
    constexpr char kDownloadPrefix[] = "downloaded_";
    constexpr std::uint32_t kDeleteConcurrency = 1;
    constexpr char kLogLevel[] = "info";
}

inline std::string GetEnv(const char* name, const std::string& defaultValue) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : defaultValue;
}

inline bool GetEnvBool(const char* name, bool defaultValue) {
    const char* value = std::getenv(name);
    if (!value) return defaultValue;
    return std::string(value) == "1" || std::string(value) == "true" || std::string(value) == "TRUE";
}

// Throws std::runtime_error when the variable is set but is not a
// non-negative integer.
std::uint32_t GetEnvUint(const char* name, std::uint32_t defaultValue);

/**
 * @brief Loads KEY=VALUE lines from a dotenv file into the process environment.
 *
 * Spacing around '=' is free. Blank lines, '#' comments and lines without '='
 * are skipped. Variables already present in the environment win.
 *
 * @param path File to read.
 * @return Number of variables set, or -1 when the file cannot be opened.
 */
int LoadEnvFile(const std::string& path);

// Fills every empty field of `cfg` from S3S_* environment variables, falling
// back to s3_defaults. Fields already set by the caller are kept.
void ApplyConfigDefaults(Config& cfg);

} // namespace s3session
