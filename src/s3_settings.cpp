#include "s3session/s3_settings.hpp"

#include <cctype>
#include <fstream>
#include <stdexcept>

namespace s3session {

namespace {

std::string Trim(const std::string& s) {
    std::string::size_type begin = 0;
    std::string::size_type end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

} // namespace

std::uint32_t GetEnvUint(const char* name, std::uint32_t defaultValue) {
    const char* value = std::getenv(name);
    if (!value) return defaultValue;

    std::string text = Trim(value);
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw std::runtime_error(std::string(name) + " must be a non-negative integer, got '" + value + "'");
    }
    unsigned long parsed = 0;
    try {
        parsed = std::stoul(text);
    } catch (const std::out_of_range&) {
        throw std::runtime_error(std::string(name) + " is out of range: '" + value + "'");
    }
    if (parsed > UINT32_MAX) {
        throw std::runtime_error(std::string(name) + " is out of range: '" + value + "'");
    }
    return static_cast<std::uint32_t>(parsed);
}

int LoadEnvFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return -1;
    }

    int loaded = 0;
    std::string line;
    while (std::getline(in, line)) {
        std::string trimmed = Trim(line);
        if (trimmed.empty() || trimmed[0] == '#') continue;

        std::string::size_type eq = trimmed.find('=');
        if (eq == std::string::npos) continue;

        std::string key = Trim(trimmed.substr(0, eq));
        std::string value = Trim(trimmed.substr(eq + 1));
        if (key.empty()) continue;

        // overwrite = 0: the real environment takes precedence
        if (std::getenv(key.c_str()) == nullptr && ::setenv(key.c_str(), value.c_str(), 0) == 0) {
            ++loaded;
        }
    }
    return loaded;
}

void ApplyConfigDefaults(Config& cfg) {
    if (cfg.endpoint.empty())
        cfg.endpoint = GetEnv("S3S_ENDPOINT", s3_defaults::kEndpoint);
    if (cfg.region.empty())
        cfg.region = GetEnv("S3S_REGION", s3_defaults::kRegion);
    if (cfg.bucket.empty())
        cfg.bucket = GetEnv("S3S_BUCKET", s3_defaults::kBucket);
    if (cfg.access_key_id.empty())
        cfg.access_key_id = GetEnv("S3S_ACCESS_KEY", s3_defaults::kAccessKeyId);
    if (cfg.secret_access_key.empty())
        cfg.secret_access_key = GetEnv("S3S_SECRET_KEY", s3_defaults::kSecretAccessKey);
    if (cfg.output_dir.empty())
        cfg.output_dir = GetEnv("S3S_OUTPUT_DIR", s3_defaults::kOutputDir);
    if (!cfg.download_prefix)
        cfg.download_prefix = GetEnv("S3S_DOWNLOAD_PREFIX", s3_defaults::kDownloadPrefix);
    if (cfg.delete_concurrency == 0)
        cfg.delete_concurrency = GetEnvUint("S3S_DELETE_CONCURRENCY", s3_defaults::kDeleteConcurrency);
    if (cfg.delete_concurrency == 0)
        cfg.delete_concurrency = s3_defaults::kDeleteConcurrency;
    if (cfg.log_level.empty())
        cfg.log_level = GetEnv("S3S_LOG_LEVEL", s3_defaults::kLogLevel);

    // Path style has no "unset" value; the environment only overrides it.
    if (std::getenv("S3S_USE_PATH_STYLE")) {
        cfg.use_path_style = GetEnvBool("S3S_USE_PATH_STYLE", s3_defaults::kUsePathStyle);
    }
}

} // namespace s3session
