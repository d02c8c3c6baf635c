#include "s3session/logging.hpp"
#include "s3session/memory_client.hpp"
#include "s3session/s3_client.hpp"
#include "s3session/s3_settings.hpp"
#include "s3session/session.hpp"
#include <cxxopts.hpp>
#include <cstdint>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr int kExitUsage = 2;

std::vector<s3session::PayloadSpec> DefaultPayloads() {
    return {
        s3session::PayloadSpec::FromText("hello.txt", "Hello World from C++"),
        s3session::PayloadSpec::FromFile("sample.png"),
        s3session::PayloadSpec::FromFile("sample.jpg"),
    };
}

// NAME=CONTENT
s3session::PayloadSpec ParseTextPayload(const std::string& arg) {
    std::string::size_type eq = arg.find('=');
    if (eq == std::string::npos || eq == 0) {
        throw std::invalid_argument("--text expects NAME=CONTENT, got '" + arg + "'");
    }
    return s3session::PayloadSpec::FromText(arg.substr(0, eq), arg.substr(eq + 1));
}

void PrintSummary(const s3session::RunReport& report) {
    std::cout << "----------- Session -----------" << std::endl;
    std::cout << "Bucket: " << report.bucket.name << " (" << s3session::ToString(report.bucket.state) << ")" << std::endl;
    for (const auto& phase : report.phases) {
        std::cout << s3session::ToString(phase.phase) << ": " << s3session::ToString(phase.outcome);
        for (const auto& transfer : phase.transfers) {
            if (!transfer.ok() && transfer.status.code != s3session::StorageErrorCode::kAlreadyExists) {
                std::cout << " [" << s3session::ToString(transfer.status.code);
                if (!transfer.key.empty()) std::cout << " " << transfer.key;
                std::cout << "]";
            }
        }
        std::cout << std::endl;
    }
    std::cout << "Final state: " << s3session::ToString(report.state) << std::endl;
    if (report.aborted_in) {
        std::cout << "aborted in phase " << s3session::ToString(*report.aborted_in) << std::endl;
    }
    std::cout << "-------------------------------" << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    cxxopts::Options options("s3session", "Round-trips payloads through an S3-compatible bucket");
    options.add_options()
        ("b,bucket", "Bucket name", cxxopts::value<std::string>())
        ("e,endpoint", "S3 endpoint URL", cxxopts::value<std::string>())
        ("r,region", "Region", cxxopts::value<std::string>())
        ("access-key", "Access key id", cxxopts::value<std::string>())
        ("secret-key", "Secret access key", cxxopts::value<std::string>())
        ("path-style", "Use path-style addressing", cxxopts::value<bool>())
        ("env-file", "dotenv file to load", cxxopts::value<std::string>()->default_value(".env"))
        ("o,output-dir", "Directory downloads are written to", cxxopts::value<std::string>())
        ("download-prefix", "Prefix of downloaded file names", cxxopts::value<std::string>())
        ("j,delete-concurrency", "Parallel object deletes", cxxopts::value<std::uint32_t>())
        ("backend", "Storage backend: s3 or memory", cxxopts::value<std::string>()->default_value("s3"))
        ("t,text", "Inline payload NAME=CONTENT (repeatable)", cxxopts::value<std::vector<std::string>>())
        ("l,log-level", "trace, debug, info, warn, err, critical, off", cxxopts::value<std::string>())
        ("files", "Local files to upload", cxxopts::value<std::vector<std::string>>())
        ("h,help", "Print usage");
    options.parse_positional({"files"});
    options.positional_help("[files...]");

    s3session::Config cfg;
    std::vector<s3session::PayloadSpec> payloads;
    std::string backend;

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }

        // A missing default .env is fine; an explicitly named one is not.
        const std::string env_file = result["env-file"].as<std::string>();
        if (s3session::LoadEnvFile(env_file) < 0 && result.count("env-file")) {
            std::cerr << "Cannot read env file '" << env_file << "'" << std::endl;
            return kExitUsage;
        }

        if (result.count("bucket")) cfg.bucket = result["bucket"].as<std::string>();
        if (result.count("endpoint")) cfg.endpoint = result["endpoint"].as<std::string>();
        if (result.count("region")) cfg.region = result["region"].as<std::string>();
        if (result.count("access-key")) cfg.access_key_id = result["access-key"].as<std::string>();
        if (result.count("secret-key")) cfg.secret_access_key = result["secret-key"].as<std::string>();
        if (result.count("output-dir")) cfg.output_dir = result["output-dir"].as<std::string>();
        if (result.count("download-prefix")) cfg.download_prefix = result["download-prefix"].as<std::string>();
        if (result.count("delete-concurrency")) cfg.delete_concurrency = result["delete-concurrency"].as<std::uint32_t>();
        if (result.count("log-level")) cfg.log_level = result["log-level"].as<std::string>();

        s3session::ApplyConfigDefaults(cfg);
        if (result.count("path-style")) cfg.use_path_style = result["path-style"].as<bool>();
        if (!s3session::logging::ParseLogLevel(cfg.log_level, nullptr)) {
            throw std::invalid_argument("--log-level must be one of trace, debug, info, warn, err, critical, off, got '" +
                                        cfg.log_level + "'");
        }

        if (result.count("text")) {
            for (const auto& text : result["text"].as<std::vector<std::string>>()) {
                payloads.push_back(ParseTextPayload(text));
            }
        }
        if (result.count("files")) {
            for (const auto& path : result["files"].as<std::vector<std::string>>()) {
                payloads.push_back(s3session::PayloadSpec::FromFile(path));
            }
        }
        if (payloads.empty()) {
            payloads = DefaultPayloads();
        }

        backend = result["backend"].as<std::string>();
        if (backend != "s3" && backend != "memory") {
            throw std::invalid_argument("--backend must be 's3' or 'memory', got '" + backend + "'");
        }
    } catch (const std::exception& e) {
        // cxxopts parse errors and bad option values alike
        std::cerr << e.what() << std::endl << options.help() << std::endl;
        return kExitUsage;
    }

    s3session::logging::InitializeLogging(cfg);
    S3SESSION_LOG_INFO("Configuration",
                       {s3session::logging::StringField("backend", backend),
                        s3session::logging::StringField("endpoint", cfg.endpoint),
                        s3session::logging::StringField("region", cfg.region),
                        s3session::logging::BoolField("path_style", cfg.use_path_style)});

    std::shared_ptr<s3session::StorageClient> client;
    if (backend == "memory") {
        client = std::make_shared<s3session::InMemoryStorageClient>();
    } else {
        client = std::make_shared<s3session::AwsS3Client>(cfg);
    }

    s3session::Session session(cfg, client);
    s3session::RunReport report = session.Run(cfg.bucket, payloads);

    PrintSummary(report);
    s3session::logging::ShutdownLogging();
    return report.ExitCode();
}
