#include "s3session/s3_client.hpp"

#include <aws/core/Aws.h>
#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/http/HttpResponse.h>
#include <aws/core/utils/logging/LogLevel.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/S3Errors.h>
#include <aws/s3/model/BucketLocationConstraint.h>
#include <aws/s3/model/CreateBucketConfiguration.h>
#include <aws/s3/model/CreateBucketRequest.h>
#include <aws/s3/model/DeleteBucketRequest.h>
#include <aws/s3/model/DeleteObjectRequest.h>
#include <aws/s3/model/GetObjectRequest.h>
#include <aws/s3/model/ListObjectsV2Request.h>
#include <aws/s3/model/PutObjectRequest.h>
#include <iterator>

namespace s3session {

namespace {

constexpr char kDefaultRegion[] = "us-east-1";

StorageErrorCode MapErrorCode(const Aws::S3::S3Error& error) {
    using Aws::S3::S3Errors;
    switch (error.GetErrorType()) {
    case S3Errors::BUCKET_ALREADY_EXISTS:
    case S3Errors::BUCKET_ALREADY_OWNED_BY_YOU:
        return StorageErrorCode::kAlreadyExists;
    case S3Errors::NO_SUCH_BUCKET:
        return StorageErrorCode::kNoSuchBucket;
    case S3Errors::NO_SUCH_KEY:
    case S3Errors::RESOURCE_NOT_FOUND:
        return StorageErrorCode::kNoSuchKey;
    case S3Errors::ACCESS_DENIED:
    case S3Errors::INVALID_ACCESS_KEY_ID:
    case S3Errors::SIGNATURE_DOES_NOT_MATCH:
        return StorageErrorCode::kAccessDenied;
    case S3Errors::NETWORK_CONNECTION:
    case S3Errors::REQUEST_TIMEOUT:
    case S3Errors::SERVICE_UNAVAILABLE:
        return StorageErrorCode::kTransport;
    default:
        break;
    }
    // Not every S3 error code has an enumerator of its own.
    if (error.GetExceptionName() == "BucketNotEmpty") {
        return StorageErrorCode::kBucketNotEmpty;
    }
    if (error.GetExceptionName() == "BucketAlreadyExists" ||
        error.GetExceptionName() == "BucketAlreadyOwnedByYou") {
        return StorageErrorCode::kAlreadyExists;
    }
    return StorageErrorCode::kUnknown;
}

StorageStatus ToStatus(const Aws::S3::S3Error& error) {
    std::string message = error.GetExceptionName().c_str();
    if (!error.GetMessage().empty()) {
        message += message.empty() ? "" : ": ";
        message += error.GetMessage().c_str();
    }
    return StorageStatus::Error(MapErrorCode(error), message);
}

} // namespace

// PIMPL for hiding AWS SDK headers
struct AwsS3Client::AwsS3ClientImpl {
    Aws::SDKOptions aws_options;
    std::unique_ptr<Aws::S3::S3Client> s3;
    std::string region;
};

AwsS3Client::AwsS3Client(const Config& cfg) : p_impl(std::make_unique<AwsS3ClientImpl>()) {
    p_impl->aws_options.loggingOptions.logLevel = Aws::Utils::Logging::LogLevel::Fatal;
    Aws::InitAPI(p_impl->aws_options);

    Aws::Client::ClientConfiguration aws_cfg;
    if (!cfg.region.empty()) {
        aws_cfg.region = cfg.region;
    }
    if (!cfg.endpoint.empty()) {
        aws_cfg.endpointOverride = cfg.endpoint;
        if (cfg.endpoint.rfind("http://", 0) == 0) {
            aws_cfg.scheme = Aws::Http::Scheme::HTTP;
        }
    }

    Aws::Auth::AWSCredentials creds;
    if (!cfg.access_key_id.empty() && !cfg.secret_access_key.empty()) {
        creds.SetAWSAccessKeyId(cfg.access_key_id.c_str());
        creds.SetAWSSecretKey(cfg.secret_access_key.c_str());
    }

    // The AWS C++ SDK uses 'useVirtualAddressing'. Path style is the inverse.
    bool useVirtualAddressing = !cfg.use_path_style;

    p_impl->s3 = std::make_unique<Aws::S3::S3Client>(creds, aws_cfg,
        Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
        useVirtualAddressing);

    p_impl->region = cfg.region.empty() ? kDefaultRegion : cfg.region;
}

AwsS3Client::~AwsS3Client() {
    // The SDK client must be gone before the API shuts down.
    p_impl->s3.reset();
    Aws::ShutdownAPI(p_impl->aws_options);
}

StorageStatus AwsS3Client::CreateBucket(const std::string& bucket) {
    Aws::S3::Model::CreateBucketRequest request;
    request.SetBucket(bucket);

    // us-east-1 rejects an explicit location constraint.
    if (p_impl->region != kDefaultRegion) {
        Aws::S3::Model::CreateBucketConfiguration bucket_cfg;
        bucket_cfg.SetLocationConstraint(
            Aws::S3::Model::BucketLocationConstraintMapper::GetBucketLocationConstraintForName(
                p_impl->region.c_str()));
        request.SetCreateBucketConfiguration(bucket_cfg);
    }

    auto outcome = p_impl->s3->CreateBucket(request);
    if (!outcome.IsSuccess()) {
        const auto& error = outcome.GetError();
        StorageStatus status = ToStatus(error);
        if (status.code == StorageErrorCode::kUnknown &&
            error.GetResponseCode() == Aws::Http::HttpResponseCode::CONFLICT) {
            status.code = StorageErrorCode::kAlreadyExists;
        }
        return status;
    }
    return StorageStatus::Ok();
}

StorageStatus AwsS3Client::PutObject(const std::string& bucket,
                                     const std::string& key,
                                     bytes_view data) {
    Aws::S3::Model::PutObjectRequest request;
    request.SetBucket(bucket);
    request.SetKey(key);

    auto stream = std::make_shared<Aws::StringStream>();
    stream->write(reinterpret_cast<const char*>(data.data()), data.size());
    request.SetBody(stream);
    request.SetContentLength(static_cast<long long>(data.size()));

    auto outcome = p_impl->s3->PutObject(request);
    if (!outcome.IsSuccess()) {
        return ToStatus(outcome.GetError());
    }
    return StorageStatus::Ok();
}

StorageStatus AwsS3Client::ListObjects(const std::string& bucket,
                                       std::vector<std::string>* keys) {
    Aws::S3::Model::ListObjectsV2Request request;
    request.SetBucket(bucket);

    std::vector<std::string> listed;
    Aws::String continuation_token;
    do {
        if (!continuation_token.empty()) {
            request.SetContinuationToken(continuation_token);
        }

        auto outcome = p_impl->s3->ListObjectsV2(request);
        if (!outcome.IsSuccess()) {
            return ToStatus(outcome.GetError());
        }

        const auto& result = outcome.GetResult();
        for (const auto& object : result.GetContents()) {
            listed.emplace_back(object.GetKey().c_str());
        }
        continuation_token = result.GetIsTruncated() ? result.GetNextContinuationToken() : "";
    } while (!continuation_token.empty());

    *keys = std::move(listed);
    return StorageStatus::Ok();
}

StorageStatus AwsS3Client::GetObject(const std::string& bucket,
                                     const std::string& key,
                                     Bytes* data) {
    Aws::S3::Model::GetObjectRequest request;
    request.SetBucket(bucket);
    request.SetKey(key);

    auto outcome = p_impl->s3->GetObject(request);
    if (!outcome.IsSuccess()) {
        return ToStatus(outcome.GetError());
    }

    auto& body = outcome.GetResult().GetBody();
    data->assign(std::istreambuf_iterator<char>(body), std::istreambuf_iterator<char>());
    if (body.bad()) {
        return StorageStatus::Error(StorageErrorCode::kTransport,
                                    "Failed reading body of " + bucket + "/" + key);
    }
    return StorageStatus::Ok();
}

StorageStatus AwsS3Client::DeleteObject(const std::string& bucket, const std::string& key) {
    Aws::S3::Model::DeleteObjectRequest request;
    request.SetBucket(bucket);
    request.SetKey(key);

    auto outcome = p_impl->s3->DeleteObject(request);
    if (!outcome.IsSuccess()) {
        return ToStatus(outcome.GetError());
    }
    return StorageStatus::Ok();
}

StorageStatus AwsS3Client::DeleteBucket(const std::string& bucket) {
    Aws::S3::Model::DeleteBucketRequest request;
    request.SetBucket(bucket);

    auto outcome = p_impl->s3->DeleteBucket(request);
    if (!outcome.IsSuccess()) {
        return ToStatus(outcome.GetError());
    }
    return StorageStatus::Ok();
}

} // namespace s3session
