#include "s3session/memory_client.hpp"

namespace s3session {

StorageStatus InMemoryStorageClient::CreateBucket(const std::string& bucket) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!buckets_.emplace(bucket, ObjectMap{}).second) {
        return StorageStatus::Error(StorageErrorCode::kAlreadyExists,
                                    "Bucket already exists: " + bucket);
    }
    return StorageStatus::Ok();
}

StorageStatus InMemoryStorageClient::PutObject(const std::string& bucket,
                                               const std::string& key,
                                               bytes_view data) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = buckets_.find(bucket);
    if (it == buckets_.end()) {
        return StorageStatus::Error(StorageErrorCode::kNoSuchBucket, "Bucket not found: " + bucket);
    }
    it->second[key] = data.ToBytes();
    return StorageStatus::Ok();
}

StorageStatus InMemoryStorageClient::ListObjects(const std::string& bucket,
                                                 std::vector<std::string>* keys) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = buckets_.find(bucket);
    if (it == buckets_.end()) {
        return StorageStatus::Error(StorageErrorCode::kNoSuchBucket, "Bucket not found: " + bucket);
    }
    keys->clear();
    keys->reserve(it->second.size());
    for (const auto& entry : it->second) {
        keys->push_back(entry.first);
    }
    return StorageStatus::Ok();
}

StorageStatus InMemoryStorageClient::GetObject(const std::string& bucket,
                                               const std::string& key,
                                               Bytes* data) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = buckets_.find(bucket);
    if (it == buckets_.end()) {
        return StorageStatus::Error(StorageErrorCode::kNoSuchBucket, "Bucket not found: " + bucket);
    }
    auto obj_it = it->second.find(key);
    if (obj_it == it->second.end()) {
        return StorageStatus::Error(StorageErrorCode::kNoSuchKey, "Object not found: " + bucket + "/" + key);
    }
    *data = obj_it->second;
    return StorageStatus::Ok();
}

StorageStatus InMemoryStorageClient::DeleteObject(const std::string& bucket, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = buckets_.find(bucket);
    if (it == buckets_.end()) {
        return StorageStatus::Error(StorageErrorCode::kNoSuchBucket, "Bucket not found: " + bucket);
    }
    if (it->second.erase(key) == 0) {
        return StorageStatus::Error(StorageErrorCode::kNoSuchKey, "Object not found: " + bucket + "/" + key);
    }
    return StorageStatus::Ok();
}

StorageStatus InMemoryStorageClient::DeleteBucket(const std::string& bucket) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = buckets_.find(bucket);
    if (it == buckets_.end()) {
        return StorageStatus::Error(StorageErrorCode::kNoSuchBucket, "Bucket not found: " + bucket);
    }
    if (!it->second.empty()) {
        return StorageStatus::Error(StorageErrorCode::kBucketNotEmpty,
                                    "Bucket is not empty: " + bucket);
    }
    buckets_.erase(it);
    return StorageStatus::Ok();
}

bool InMemoryStorageClient::HasBucket(const std::string& bucket) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buckets_.count(bucket) != 0;
}

std::size_t InMemoryStorageClient::ObjectCount(const std::string& bucket) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = buckets_.find(bucket);
    return it == buckets_.end() ? 0 : it->second.size();
}

} // namespace s3session
