#pragma once

#include "types.hpp"
#include "bytes_view.hpp"
#include <string>
#include <vector>

namespace s3session {

/**
 * @class StorageClient
 * @brief The object-storage operations a Session depends on.
 *
 * Every call reports its outcome through a StorageStatus rather than by
 * throwing. Implementations must tolerate concurrent calls when a Session
 * is configured with delete_concurrency > 1.
 */
class StorageClient {
public:
    virtual ~StorageClient() = default;

    /**
     * @brief Creates a bucket.
     * @return kOk, kAlreadyExists when the bucket is already there, or another error.
     */
    virtual StorageStatus CreateBucket(const std::string& bucket) = 0;

    virtual StorageStatus PutObject(const std::string& bucket,
                                    const std::string& key,
                                    bytes_view data) = 0;

    /**
     * @brief Lists every key in the bucket.
     * @param keys Replaced with the full listing. Order is backend-defined.
     */
    virtual StorageStatus ListObjects(const std::string& bucket,
                                      std::vector<std::string>* keys) = 0;

    virtual StorageStatus GetObject(const std::string& bucket,
                                    const std::string& key,
                                    Bytes* data) = 0;

    virtual StorageStatus DeleteObject(const std::string& bucket, const std::string& key) = 0;

    virtual StorageStatus DeleteBucket(const std::string& bucket) = 0;
};

} // namespace s3session
