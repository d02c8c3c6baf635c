#pragma once

#include "s3session/memory_client.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace s3session::testing {

// Wraps an InMemoryStorageClient, counts calls, and fails the operations a
// test asks it to fail.
class FaultyStorageClient : public StorageClient {
public:
    FaultyStorageClient() : inner_(std::make_shared<InMemoryStorageClient>()) {}

    std::optional<StorageErrorCode> create_bucket_error;
    std::optional<StorageErrorCode> delete_bucket_error;
    std::optional<StorageErrorCode> list_error;
    std::string fail_put_suffix;
    std::string fail_get_suffix;
    std::string corrupt_get_suffix;
    std::string fail_delete_suffix;
    // Runs after every successful put, e.g. to cancel a run mid-phase.
    std::function<void()> on_put;

    std::atomic<int> create_calls{0};
    std::atomic<int> put_calls{0};
    std::atomic<int> list_calls{0};
    std::atomic<int> get_calls{0};
    std::atomic<int> delete_calls{0};
    std::atomic<int> delete_bucket_calls{0};

    InMemoryStorageClient& inner() { return *inner_; }

    std::vector<std::string> deleted_keys() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return deleted_keys_;
    }

    StorageStatus CreateBucket(const std::string& bucket) override {
        ++create_calls;
        if (create_bucket_error) {
            return StorageStatus::Error(*create_bucket_error, "injected create failure");
        }
        return inner_->CreateBucket(bucket);
    }

    StorageStatus PutObject(const std::string& bucket, const std::string& key, bytes_view data) override {
        ++put_calls;
        if (Matches(key, fail_put_suffix)) {
            return StorageStatus::Error(StorageErrorCode::kTransport, "injected put failure");
        }
        StorageStatus status = inner_->PutObject(bucket, key, data);
        if (status.ok() && on_put) {
            on_put();
        }
        return status;
    }

    StorageStatus ListObjects(const std::string& bucket, std::vector<std::string>* keys) override {
        ++list_calls;
        if (list_error) {
            return StorageStatus::Error(*list_error, "injected list failure");
        }
        return inner_->ListObjects(bucket, keys);
    }

    StorageStatus GetObject(const std::string& bucket, const std::string& key, Bytes* data) override {
        ++get_calls;
        if (Matches(key, fail_get_suffix)) {
            return StorageStatus::Error(StorageErrorCode::kTransport, "injected get failure");
        }
        StorageStatus status = inner_->GetObject(bucket, key, data);
        if (status.ok() && Matches(key, corrupt_get_suffix)) {
            data->push_back(0xff);
        }
        return status;
    }

    StorageStatus DeleteObject(const std::string& bucket, const std::string& key) override {
        ++delete_calls;
        if (Matches(key, fail_delete_suffix)) {
            return StorageStatus::Error(StorageErrorCode::kAccessDenied, "injected delete failure");
        }
        StorageStatus status = inner_->DeleteObject(bucket, key);
        if (status.ok()) {
            std::lock_guard<std::mutex> lock(mutex_);
            deleted_keys_.push_back(key);
        }
        return status;
    }

    StorageStatus DeleteBucket(const std::string& bucket) override {
        ++delete_bucket_calls;
        if (delete_bucket_error) {
            return StorageStatus::Error(*delete_bucket_error, "injected delete bucket failure");
        }
        return inner_->DeleteBucket(bucket);
    }

private:
    static bool Matches(const std::string& key, const std::string& suffix) {
        return !suffix.empty() && key.size() >= suffix.size() &&
               key.compare(key.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    std::shared_ptr<InMemoryStorageClient> inner_;
    mutable std::mutex mutex_;
    std::vector<std::string> deleted_keys_;
};

} // namespace s3session::testing
