#pragma once

#include "storage_client.hpp"
#include "types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace Aws {
    namespace S3 {
        class S3Client;
    }
}

namespace s3session {

// StorageClient backed by the AWS SDK. Owns the SDK's global init/shutdown
// for its lifetime, so keep one instance per process.
class AwsS3Client : public StorageClient {
public:
    explicit AwsS3Client(const Config& cfg);
    ~AwsS3Client() override;

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

private:
    struct AwsS3ClientImpl;
    std::unique_ptr<AwsS3ClientImpl> p_impl;

    AwsS3Client(const AwsS3Client&) = delete;
    AwsS3Client& operator=(const AwsS3Client&) = delete;
};

} // namespace s3session
