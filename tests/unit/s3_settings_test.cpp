#include "s3session/s3_settings.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteEnvFile(const std::string& test_name, const std::string& content) {
    const auto base_dir = std::filesystem::temp_directory_path() / "s3session_settings_tests";
    std::filesystem::create_directories(base_dir);

    const auto file_path = base_dir / (test_name + ".env");
    std::ofstream out(file_path);
    out << content;
    out.close();

    return file_path;
}

void ClearSessionEnv() {
    for (const char* name : {"S3S_ENDPOINT", "S3S_REGION", "S3S_BUCKET", "S3S_ACCESS_KEY", "S3S_SECRET_KEY",
                             "S3S_USE_PATH_STYLE", "S3S_OUTPUT_DIR", "S3S_DOWNLOAD_PREFIX",
                             "S3S_DELETE_CONCURRENCY", "S3S_LOG_LEVEL"}) {
        ::unsetenv(name);
    }
}

void TestDefaultsFillEmptyFields() {
    ClearSessionEnv();
    s3session::Config cfg;
    s3session::ApplyConfigDefaults(cfg);

    assert(cfg.endpoint == "http://localhost");
    assert(cfg.region == "us-east-1");
    assert(cfg.bucket == "mybucket");
    assert(cfg.access_key_id == "FAKEACCESS");
    assert(cfg.secret_access_key == "FAKESECRET");
    assert(cfg.use_path_style);
    assert(cfg.output_dir == ".");
    assert(cfg.download_prefix == "downloaded_");
    assert(cfg.delete_concurrency == 1);
    assert(cfg.log_level == "info");
}

void TestExplicitFieldsBeatEnvironment() {
    ClearSessionEnv();
    ::setenv("S3S_BUCKET", "from-env", 1);
    ::setenv("S3S_REGION", "eu-west-1", 1);

    s3session::Config cfg;
    cfg.bucket = "explicit";
    s3session::ApplyConfigDefaults(cfg);

    assert(cfg.bucket == "explicit");
    assert(cfg.region == "eu-west-1");
    ClearSessionEnv();
}

void TestExplicitEmptyDownloadPrefixIsKept() {
    ClearSessionEnv();
    ::setenv("S3S_DOWNLOAD_PREFIX", "env_", 1);

    s3session::Config cfg;
    cfg.download_prefix = "";
    s3session::ApplyConfigDefaults(cfg);
    assert(cfg.download_prefix.has_value());
    assert(cfg.download_prefix->empty());

    s3session::Config unset;
    s3session::ApplyConfigDefaults(unset);
    assert(unset.download_prefix == "env_");
    ClearSessionEnv();
}

void TestPathStyleOverriddenOnlyWhenSet() {
    ClearSessionEnv();
    s3session::Config cfg;
    cfg.use_path_style = false;
    s3session::ApplyConfigDefaults(cfg);
    assert(!cfg.use_path_style);

    ::setenv("S3S_USE_PATH_STYLE", "true", 1);
    s3session::ApplyConfigDefaults(cfg);
    assert(cfg.use_path_style);
    ClearSessionEnv();
}

void TestInvalidConcurrencyThrows() {
    ClearSessionEnv();
    ::setenv("S3S_DELETE_CONCURRENCY", "four", 1);

    s3session::Config cfg;
    bool threw = false;
    try {
        s3session::ApplyConfigDefaults(cfg);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    ClearSessionEnv();
}

void TestEnvFileFlexibleSpacingAndComments() {
    ClearSessionEnv();
    const auto path = WriteEnvFile("spacing",
                                   "# local endpoint\n"
                                   "S3S_ENDPOINT   =   http://127.0.0.1:9000\n"
                                   "\n"
                                   "S3S_BUCKET=dotenv-bucket\n"
                                   "not a variable line\n"
                                   "S3S_DELETE_CONCURRENCY = 3\n");

    const int loaded = s3session::LoadEnvFile(path.string());
    assert(loaded == 3);

    s3session::Config cfg;
    s3session::ApplyConfigDefaults(cfg);
    assert(cfg.endpoint == "http://127.0.0.1:9000");
    assert(cfg.bucket == "dotenv-bucket");
    assert(cfg.delete_concurrency == 3);
    ClearSessionEnv();
}

void TestEnvFileDoesNotOverrideEnvironment() {
    ClearSessionEnv();
    ::setenv("S3S_BUCKET", "from-env", 1);
    const auto path = WriteEnvFile("precedence", "S3S_BUCKET = from-file\n");

    assert(s3session::LoadEnvFile(path.string()) == 0);
    assert(std::string(std::getenv("S3S_BUCKET")) == "from-env");
    ClearSessionEnv();
}

void TestMissingEnvFileReportsFailure() {
    assert(s3session::LoadEnvFile("/nonexistent/s3session/.env") == -1);
}

} // namespace

int main() {
    TestDefaultsFillEmptyFields();
    TestExplicitFieldsBeatEnvironment();
    TestExplicitEmptyDownloadPrefixIsKept();
    TestPathStyleOverriddenOnlyWhenSet();
    TestInvalidConcurrencyThrows();
    TestEnvFileFlexibleSpacingAndComments();
    TestEnvFileDoesNotOverrideEnvironment();
    TestMissingEnvFileReportsFailure();

    std::cout << "s3_settings_test passed" << std::endl;
    return 0;
}
