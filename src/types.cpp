#include "s3session/types.hpp"

namespace s3session {

const char* ToString(StorageErrorCode code) {
    switch (code) {
    case StorageErrorCode::kOk: return "Ok";
    case StorageErrorCode::kAlreadyExists: return "AlreadyExists";
    case StorageErrorCode::kNoSuchBucket: return "NoSuchBucket";
    case StorageErrorCode::kNoSuchKey: return "NoSuchKey";
    case StorageErrorCode::kBucketNotEmpty: return "BucketNotEmpty";
    case StorageErrorCode::kAccessDenied: return "AccessDenied";
    case StorageErrorCode::kTransport: return "Transport";
    case StorageErrorCode::kLocalIo: return "LocalIo";
    case StorageErrorCode::kDigestMismatch: return "DigestMismatch";
    case StorageErrorCode::kCancelled: return "Cancelled";
    case StorageErrorCode::kUnknown: return "Unknown";
    }
    return "Unknown";
}

const char* ToString(BucketState state) {
    switch (state) {
    case BucketState::kAbsent: return "absent";
    case BucketState::kCreating: return "creating";
    case BucketState::kPresent: return "present";
    case BucketState::kDeleting: return "deleting";
    case BucketState::kDeleted: return "deleted";
    }
    return "unknown";
}

const char* ToString(UploadState state) {
    switch (state) {
    case UploadState::kPending: return "pending";
    case UploadState::kUploaded: return "uploaded";
    case UploadState::kFailed: return "failed";
    }
    return "unknown";
}

const char* ToString(TransferKind kind) {
    switch (kind) {
    case TransferKind::kCreateBucket: return "create_bucket";
    case TransferKind::kUpload: return "upload";
    case TransferKind::kList: return "list";
    case TransferKind::kDownload: return "download";
    case TransferKind::kDeleteObject: return "delete_object";
    case TransferKind::kDeleteBucket: return "delete_bucket";
    }
    return "unknown";
}

} // namespace s3session
