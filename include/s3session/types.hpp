#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace s3session {

struct Config {
    // S3 Configuration
    std::string endpoint;
    std::string region;
    std::string bucket;
    std::string access_key_id;
    std::string secret_access_key;
    bool use_path_style = true;

    // Local side of the round trip
    std::string output_dir;
    std::optional<std::string> download_prefix; // unset = take the default; "" is a valid prefix

    std::uint32_t delete_concurrency = 0; // 0 = take the default
    std::string log_level;
};

enum class StorageErrorCode {
    kOk,
    kAlreadyExists,
    kNoSuchBucket,
    kNoSuchKey,
    kBucketNotEmpty,
    kAccessDenied,
    kTransport,
    kLocalIo,
    kDigestMismatch,
    kCancelled,
    kUnknown,
};

const char* ToString(StorageErrorCode code);

struct StorageStatus {
    StorageErrorCode code = StorageErrorCode::kOk;
    std::string message;

    bool ok() const { return code == StorageErrorCode::kOk; }

    static StorageStatus Ok() { return {}; }
    static StorageStatus Error(StorageErrorCode code, std::string message) {
        return {code, std::move(message)};
    }
};

enum class BucketState { kAbsent, kCreating, kPresent, kDeleting, kDeleted };

struct BucketHandle {
    std::string name;
    BucketState state = BucketState::kAbsent;
    // False when creation failed and the run went on regardless.
    bool confirmed = false;
};

enum class UploadState { kPending, kUploaded, kFailed };

struct ObjectRecord {
    std::string name;
    std::string key;
    UploadState state = UploadState::kPending;
    std::uint64_t size = 0;
    std::string digest;
};

enum class TransferKind { kCreateBucket, kUpload, kList, kDownload, kDeleteObject, kDeleteBucket };

struct TransferResult {
    TransferKind kind;
    std::string key;
    StorageStatus status;

    bool ok() const { return status.ok(); }
};

const char* ToString(BucketState state);
const char* ToString(UploadState state);
const char* ToString(TransferKind kind);

} // namespace s3session
