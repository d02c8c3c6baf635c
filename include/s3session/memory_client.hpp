#pragma once

#include "storage_client.hpp"
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace s3session {

// Strongly consistent in-process backend. Answers with the same error
// vocabulary an S3-compatible server uses, lists keys in lexicographic
// order and is safe to call from several threads.
class InMemoryStorageClient : public StorageClient {
public:
    InMemoryStorageClient() = default;

    StorageStatus CreateBucket(const std::string& bucket) override;
    StorageStatus PutObject(const std::string& bucket,
                            const std::string& key,
                            bytes_view data) override;
    StorageStatus ListObjects(const std::string& bucket,
                              std::vector<std::string>* keys) override;
    StorageStatus GetObject(const std::string& bucket,
                            const std::string& key,
                            Bytes* data) override;
    StorageStatus DeleteObject(const std::string& bucket, const std::string& key) override;
    StorageStatus DeleteBucket(const std::string& bucket) override;

    // Introspection
    bool HasBucket(const std::string& bucket) const;
    std::size_t ObjectCount(const std::string& bucket) const;

private:
    using ObjectMap = std::map<std::string, Bytes>;

    mutable std::mutex mutex_;
    std::map<std::string, ObjectMap> buckets_;
};

} // namespace s3session
