#include "s3session/session.hpp"
#include "s3session/keys.hpp"
#include "s3session/logging.hpp"
#include "s3session/s3_settings.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <unordered_map>

namespace s3session {

using logging::IntField;
using logging::StringField;

// --- Phase tables ---

PhasePolicy PolicyFor(Phase phase) {
    switch (phase) {
    case Phase::kEnsureBucket:
    case Phase::kDeleteBucket:
        return PhasePolicy::kBestEffort;
    case Phase::kUpload:
    case Phase::kList:
    case Phase::kDownload:
    case Phase::kDeleteObjects:
        return PhasePolicy::kFailFast;
    }
    return PhasePolicy::kFailFast;
}

RunState StateAfter(Phase phase) {
    switch (phase) {
    case Phase::kEnsureBucket: return RunState::kBucketEnsured;
    case Phase::kUpload: return RunState::kUploaded;
    case Phase::kList: return RunState::kListed;
    case Phase::kDownload: return RunState::kDownloaded;
    case Phase::kDeleteObjects: return RunState::kObjectsDeleted;
    case Phase::kDeleteBucket: return RunState::kBucketDeleted;
    }
    return RunState::kAborted;
}

const char* ToString(Phase phase) {
    switch (phase) {
    case Phase::kEnsureBucket: return "ensure_bucket";
    case Phase::kUpload: return "upload";
    case Phase::kList: return "list";
    case Phase::kDownload: return "download";
    case Phase::kDeleteObjects: return "delete_objects";
    case Phase::kDeleteBucket: return "delete_bucket";
    }
    return "unknown";
}

const char* ToString(PhasePolicy policy) {
    return policy == PhasePolicy::kBestEffort ? "best_effort" : "fail_fast";
}

const char* ToString(PhaseOutcome outcome) {
    switch (outcome) {
    case PhaseOutcome::kSuccess: return "success";
    case PhaseOutcome::kPartial: return "partial";
    case PhaseOutcome::kAbort: return "abort";
    }
    return "unknown";
}

const char* ToString(RunState state) {
    switch (state) {
    case RunState::kInit: return "Init";
    case RunState::kBucketEnsured: return "BucketEnsured";
    case RunState::kUploaded: return "Uploaded";
    case RunState::kListed: return "Listed";
    case RunState::kDownloaded: return "Downloaded";
    case RunState::kObjectsDeleted: return "ObjectsDeleted";
    case RunState::kBucketDeleted: return "BucketDeleted";
    case RunState::kDone: return "Done";
    case RunState::kAborted: return "Aborted";
    }
    return "Unknown";
}

const PhaseReport* RunReport::Find(Phase phase) const {
    for (const auto& report : phases) {
        if (report.phase == phase) {
            return &report;
        }
    }
    return nullptr;
}

namespace {

TransferKind KindFor(Phase phase) {
    switch (phase) {
    case Phase::kEnsureBucket: return TransferKind::kCreateBucket;
    case Phase::kUpload: return TransferKind::kUpload;
    case Phase::kList: return TransferKind::kList;
    case Phase::kDownload: return TransferKind::kDownload;
    case Phase::kDeleteObjects: return TransferKind::kDeleteObject;
    case Phase::kDeleteBucket: return TransferKind::kDeleteBucket;
    }
    return TransferKind::kUpload;
}

// A failed step aborts a fail-fast phase and only degrades a best-effort one.
PhaseOutcome FailureOutcome(Phase phase) {
    return PolicyFor(phase) == PhasePolicy::kFailFast ? PhaseOutcome::kAbort : PhaseOutcome::kPartial;
}

std::int64_t UnixSecondsNow() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // namespace

// --- Internal Data Structures ---

// State of one Run() call.
struct RunContext {
    RunReport report;
    std::int64_t timestamp = 0;
    std::unordered_map<std::string, std::string> uploaded_digests; // key -> digest
};

// PIMPL: Private Implementation
class SessionImpl {
public:
    SessionImpl(const Config& cfg, std::shared_ptr<StorageClient> client, TimestampSource timestamps);

    RunReport Run(const std::string& bucket,
                  const std::vector<PayloadSpec>& payloads,
                  const CancellationToken* cancel);

    const Config& config() const { return config_; }

private:
    PhaseReport EnsureBucket(RunContext& ctx);
    PhaseReport Upload(RunContext& ctx, const std::vector<PayloadSpec>& payloads);
    PhaseReport List(RunContext& ctx);
    PhaseReport Download(RunContext& ctx);
    PhaseReport DeleteObjects(RunContext& ctx);
    PhaseReport DeleteBucket(RunContext& ctx);

    void DeleteObjectsConcurrently(RunContext& ctx, PhaseReport& report, std::uint32_t workers);
    bool RequireBucket(const RunContext& ctx, PhaseReport& report) const;
    void Fail(PhaseReport& report, const std::string& key, StorageStatus status) const;

    Config config_;
    std::shared_ptr<StorageClient> client_;
    TimestampSource timestamps_;
};

// --- SessionImpl Implementation ---

SessionImpl::SessionImpl(const Config& cfg, std::shared_ptr<StorageClient> client, TimestampSource timestamps)
    : config_(cfg), client_(std::move(client)), timestamps_(std::move(timestamps)) {
    if (!client_) {
        throw std::invalid_argument("Session requires a storage client");
    }
    ApplyConfigDefaults(config_);
    if (!timestamps_) {
        timestamps_ = UnixSecondsNow;
    }
}

RunReport SessionImpl::Run(const std::string& bucket,
                           const std::vector<PayloadSpec>& payloads,
                           const CancellationToken* cancel) {
    if (bucket.empty()) {
        throw std::invalid_argument("Bucket name must not be empty");
    }

    RunContext ctx;
    ctx.report.bucket.name = bucket;
    ctx.timestamp = timestamps_();

    static const Phase kPipeline[] = {
        Phase::kEnsureBucket, Phase::kUpload,        Phase::kList,
        Phase::kDownload,     Phase::kDeleteObjects, Phase::kDeleteBucket,
    };

    S3SESSION_LOG_INFO("Session started",
                       {StringField("bucket", bucket),
                        IntField("payloads", static_cast<std::int64_t>(payloads.size())),
                        IntField("timestamp", ctx.timestamp)});

    for (Phase phase : kPipeline) {
        if (cancel && cancel->IsCancelled()) {
            PhaseReport report{phase, PolicyFor(phase)};
            Fail(report, "", StorageStatus::Error(StorageErrorCode::kCancelled, "Run cancelled"));
            report.outcome = PhaseOutcome::kAbort;
            ctx.report.phases.push_back(std::move(report));
            ctx.report.state = RunState::kAborted;
            ctx.report.aborted_in = phase;
            S3SESSION_LOG_WARN("Session cancelled", {StringField("before_phase", ToString(phase))});
            return std::move(ctx.report);
        }

        PhaseReport report{phase, PolicyFor(phase)};
        switch (phase) {
        case Phase::kEnsureBucket: report = EnsureBucket(ctx); break;
        case Phase::kUpload: report = Upload(ctx, payloads); break;
        case Phase::kList: report = List(ctx); break;
        case Phase::kDownload: report = Download(ctx); break;
        case Phase::kDeleteObjects: report = DeleteObjects(ctx); break;
        case Phase::kDeleteBucket: report = DeleteBucket(ctx); break;
        }

        S3SESSION_LOG_DEBUG("Phase finished",
                            {StringField("phase", ToString(phase)),
                             StringField("policy", ToString(report.policy)),
                             StringField("outcome", ToString(report.outcome)),
                             IntField("transfers", static_cast<std::int64_t>(report.transfers.size()))});

        const PhaseOutcome outcome = report.outcome;
        ctx.report.phases.push_back(std::move(report));

        if (outcome == PhaseOutcome::kAbort) {
            ctx.report.state = RunState::kAborted;
            ctx.report.aborted_in = phase;
            S3SESSION_LOG_ERROR("Session aborted", {StringField("phase", ToString(phase))});
            return std::move(ctx.report);
        }
        ctx.report.state = StateAfter(phase);
    }

    ctx.report.state = RunState::kDone;
    S3SESSION_LOG_INFO("Session done", {StringField("bucket", bucket)});
    return std::move(ctx.report);
}

void SessionImpl::Fail(PhaseReport& report, const std::string& key, StorageStatus status) const {
    report.transfers.push_back({KindFor(report.phase), key, std::move(status)});
    report.outcome = FailureOutcome(report.phase);
}

bool SessionImpl::RequireBucket(const RunContext& ctx, PhaseReport& report) const {
    if (ctx.report.bucket.state == BucketState::kPresent) {
        return true;
    }
    Fail(report, "", StorageStatus::Error(StorageErrorCode::kNoSuchBucket,
        std::string("Bucket is ") + ToString(ctx.report.bucket.state) + ": " + ctx.report.bucket.name));
    return false;
}

PhaseReport SessionImpl::EnsureBucket(RunContext& ctx) {
    PhaseReport report{Phase::kEnsureBucket, PolicyFor(Phase::kEnsureBucket)};
    BucketHandle& bucket = ctx.report.bucket;

    bucket.state = BucketState::kCreating;
    StorageStatus status = client_->CreateBucket(bucket.name);

    if (status.ok() || status.code == StorageErrorCode::kAlreadyExists) {
        bucket.state = BucketState::kPresent;
        bucket.confirmed = true;
        if (status.ok()) {
            S3SESSION_LOG_INFO("Bucket created", {StringField("bucket", bucket.name)});
        } else {
            S3SESSION_LOG_INFO("Bucket already exists", {StringField("bucket", bucket.name)});
        }
        report.transfers.push_back({TransferKind::kCreateBucket, "", std::move(status)});
        return report;
    }

    // Best effort: later phases report the real problem if the bucket is unusable.
    S3SESSION_LOG_ERROR("Bucket create error",
                        {StringField("bucket", bucket.name),
                         StringField("code", ToString(status.code)),
                         StringField("message", status.message)});
    report.warnings.push_back("Bucket create error: " + status.message);
    bucket.state = BucketState::kPresent;
    bucket.confirmed = false;
    Fail(report, "", std::move(status));
    return report;
}

PhaseReport SessionImpl::Upload(RunContext& ctx, const std::vector<PayloadSpec>& payloads) {
    PhaseReport report{Phase::kUpload, PolicyFor(Phase::kUpload)};
    if (!RequireBucket(ctx, report)) {
        return report;
    }

    const std::string& bucket = ctx.report.bucket.name;
    std::set<std::string> used_keys;

    for (const auto& payload : payloads) {
        Bytes data;
        std::string error;
        const LoadResult loaded = LoadPayload(payload, &data, &error);

        if (loaded == LoadResult::kAbsent) {
            std::string warning = "File '" + payload.path + "' not found. Skipping upload.";
            S3SESSION_LOG_WARN(warning, {StringField("name", payload.name)});
            report.warnings.push_back(std::move(warning));
            report.outcome = PhaseOutcome::kPartial;
            continue;
        }

        ObjectRecord record;
        record.name = payload.name;
        record.key = MakeObjectKey(ctx.timestamp, payload.name);

        if (!used_keys.insert(record.key).second) {
            std::string warning = "Duplicate payload name '" + payload.name + "'. Skipping upload.";
            S3SESSION_LOG_WARN(warning, {StringField("key", record.key)});
            report.warnings.push_back(std::move(warning));
            report.outcome = PhaseOutcome::kPartial;
            continue;
        }

        if (loaded == LoadResult::kUnreadable) {
            S3SESSION_LOG_ERROR("Upload error", {StringField("key", record.key), StringField("message", error)});
            record.state = UploadState::kFailed;
            ctx.report.objects.push_back(record);
            Fail(report, record.key, StorageStatus::Error(StorageErrorCode::kLocalIo, error));
            return report;
        }

        record.size = data.size();
        record.digest = ContentDigest(data);

        StorageStatus status = client_->PutObject(bucket, record.key, data);
        if (!status.ok()) {
            S3SESSION_LOG_ERROR("Upload error",
                                {StringField("key", record.key),
                                 StringField("code", ToString(status.code)),
                                 StringField("message", status.message)});
            record.state = UploadState::kFailed;
            ctx.report.objects.push_back(record);
            Fail(report, record.key, std::move(status));
            return report;
        }

        record.state = UploadState::kUploaded;
        ctx.uploaded_digests[record.key] = record.digest;
        S3SESSION_LOG_INFO("Uploaded",
                           {StringField("key", record.key),
                            IntField("bytes", static_cast<std::int64_t>(record.size))});
        report.transfers.push_back({TransferKind::kUpload, record.key, StorageStatus::Ok()});
        ctx.report.objects.push_back(std::move(record));
    }
    return report;
}

PhaseReport SessionImpl::List(RunContext& ctx) {
    PhaseReport report{Phase::kList, PolicyFor(Phase::kList)};
    if (!RequireBucket(ctx, report)) {
        return report;
    }

    std::vector<std::string> keys;
    StorageStatus status = client_->ListObjects(ctx.report.bucket.name, &keys);
    if (!status.ok()) {
        S3SESSION_LOG_ERROR("List error",
                            {StringField("bucket", ctx.report.bucket.name),
                             StringField("code", ToString(status.code)),
                             StringField("message", status.message)});
        Fail(report, "", std::move(status));
        return report;
    }

    S3SESSION_LOG_INFO("Objects in bucket",
                       {StringField("bucket", ctx.report.bucket.name),
                        IntField("count", static_cast<std::int64_t>(keys.size()))});
    for (const auto& key : keys) {
        S3SESSION_LOG_INFO("- " + key);
    }

    // Read-after-write is assumed; a gap is worth a warning, not an abort.
    for (const auto& uploaded : ctx.uploaded_digests) {
        if (std::find(keys.begin(), keys.end(), uploaded.first) == keys.end()) {
            std::string warning = "Uploaded key '" + uploaded.first + "' missing from listing";
            S3SESSION_LOG_WARN(warning);
            report.warnings.push_back(std::move(warning));
            report.outcome = PhaseOutcome::kPartial;
        }
    }

    report.transfers.push_back({TransferKind::kList, "", StorageStatus::Ok()});
    ctx.report.listed_keys = std::move(keys);
    return report;
}

PhaseReport SessionImpl::Download(RunContext& ctx) {
    PhaseReport report{Phase::kDownload, PolicyFor(Phase::kDownload)};
    if (!RequireBucket(ctx, report)) {
        return report;
    }

    std::set<std::string> local_paths;
    for (const auto& key : ctx.report.listed_keys) {
        Bytes data;
        StorageStatus status = client_->GetObject(ctx.report.bucket.name, key, &data);
        if (!status.ok()) {
            S3SESSION_LOG_ERROR("Download error",
                                {StringField("key", key),
                                 StringField("code", ToString(status.code)),
                                 StringField("message", status.message)});
            Fail(report, key, std::move(status));
            return report;
        }

        auto uploaded = ctx.uploaded_digests.find(key);
        if (uploaded != ctx.uploaded_digests.end()) {
            const std::string digest = ContentDigest(data);
            if (digest != uploaded->second) {
                S3SESSION_LOG_ERROR("Download digest mismatch",
                                    {StringField("key", key),
                                     StringField("expected", uploaded->second),
                                     StringField("actual", digest)});
                Fail(report, key, StorageStatus::Error(StorageErrorCode::kDigestMismatch,
                    "Downloaded bytes of '" + key + "' differ from the uploaded bytes"));
                return report;
            }
        }

        const std::string local_path =
            (std::filesystem::path(config_.output_dir) / LocalNameForKey(config_.download_prefix.value_or(""), key))
                .string();
        if (!local_paths.insert(local_path).second) {
            std::string warning = "Key '" + key + "' maps to already downloaded file '" + local_path + "'. Overwriting.";
            S3SESSION_LOG_WARN(warning, {StringField("key", key), StringField("file", local_path)});
            report.warnings.push_back(std::move(warning));
            report.outcome = PhaseOutcome::kPartial;
        }
        status = WriteFileBytes(local_path, data);
        if (!status.ok()) {
            S3SESSION_LOG_ERROR("Download error", {StringField("key", key), StringField("message", status.message)});
            Fail(report, key, std::move(status));
            return report;
        }

        S3SESSION_LOG_INFO("Downloaded", {StringField("key", key), StringField("file", local_path)});
        report.transfers.push_back({TransferKind::kDownload, key, StorageStatus::Ok()});
        ctx.report.downloaded_files.push_back(local_path);
    }
    return report;
}

PhaseReport SessionImpl::DeleteObjects(RunContext& ctx) {
    PhaseReport report{Phase::kDeleteObjects, PolicyFor(Phase::kDeleteObjects)};
    if (!RequireBucket(ctx, report)) {
        return report;
    }

    const auto& keys = ctx.report.listed_keys;
    const std::uint32_t workers =
        static_cast<std::uint32_t>(std::min<std::size_t>(config_.delete_concurrency, keys.size()));
    if (workers > 1) {
        DeleteObjectsConcurrently(ctx, report, workers);
        return report;
    }

    for (const auto& key : keys) {
        StorageStatus status = client_->DeleteObject(ctx.report.bucket.name, key);
        if (!status.ok()) {
            S3SESSION_LOG_ERROR("Delete error",
                                {StringField("key", key),
                                 StringField("code", ToString(status.code)),
                                 StringField("message", status.message)});
            Fail(report, key, std::move(status));
            return report;
        }
        S3SESSION_LOG_INFO("Deleted", {StringField("key", key)});
        report.transfers.push_back({TransferKind::kDeleteObject, key, StorageStatus::Ok()});
    }
    return report;
}

void SessionImpl::DeleteObjectsConcurrently(RunContext& ctx, PhaseReport& report, std::uint32_t workers) {
    const auto& keys = ctx.report.listed_keys;
    const std::string& bucket = ctx.report.bucket.name;

    std::atomic<std::size_t> next{0};
    std::atomic<bool> failed{false};
    std::mutex results_mutex;

    // Results land in completion order. No new delete starts after a failure.
    auto worker = [&]() {
        while (!failed.load()) {
            const std::size_t index = next.fetch_add(1);
            if (index >= keys.size()) {
                return;
            }
            const std::string& key = keys[index];
            StorageStatus status = client_->DeleteObject(bucket, key);

            std::lock_guard<std::mutex> lock(results_mutex);
            if (!status.ok()) {
                S3SESSION_LOG_ERROR("Delete error",
                                    {StringField("key", key),
                                     StringField("code", ToString(status.code)),
                                     StringField("message", status.message)});
                failed.store(true);
                Fail(report, key, std::move(status));
            } else {
                S3SESSION_LOG_INFO("Deleted", {StringField("key", key)});
                report.transfers.push_back({TransferKind::kDeleteObject, key, StorageStatus::Ok()});
            }
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (std::uint32_t i = 0; i < workers; ++i) {
        threads.emplace_back(worker);
    }
    for (auto& t : threads) {
        t.join();
    }
}

PhaseReport SessionImpl::DeleteBucket(RunContext& ctx) {
    PhaseReport report{Phase::kDeleteBucket, PolicyFor(Phase::kDeleteBucket)};
    BucketHandle& bucket = ctx.report.bucket;

    bucket.state = BucketState::kDeleting;
    StorageStatus status = client_->DeleteBucket(bucket.name);
    if (!status.ok()) {
        S3SESSION_LOG_ERROR("DeleteBucket error",
                            {StringField("bucket", bucket.name),
                             StringField("code", ToString(status.code)),
                             StringField("message", status.message)});
        report.warnings.push_back("DeleteBucket error: " + status.message);
        bucket.state = status.code == StorageErrorCode::kNoSuchBucket ? BucketState::kAbsent : BucketState::kPresent;
        Fail(report, "", std::move(status));
        return report;
    }

    bucket.state = BucketState::kDeleted;
    S3SESSION_LOG_INFO("Bucket deleted", {StringField("bucket", bucket.name)});
    report.transfers.push_back({TransferKind::kDeleteBucket, "", StorageStatus::Ok()});
    return report;
}


// --- Session Public API (forwarding to PIMPL) ---

Session::Session(const Config& cfg, std::shared_ptr<StorageClient> client)
    : p_impl(std::make_unique<SessionImpl>(cfg, std::move(client), TimestampSource())) {}
Session::Session(const Config& cfg, std::shared_ptr<StorageClient> client, TimestampSource timestamps)
    : p_impl(std::make_unique<SessionImpl>(cfg, std::move(client), std::move(timestamps))) {}
Session::~Session() = default;
RunReport Session::Run(const std::string& bucket,
                       const std::vector<PayloadSpec>& payloads,
                       const CancellationToken* cancel) {
    return p_impl->Run(bucket, payloads, cancel);
}
RunReport Session::Run(const std::vector<PayloadSpec>& payloads, const CancellationToken* cancel) {
    return p_impl->Run(p_impl->config().bucket, payloads, cancel);
}
const Config& Session::config() const { return p_impl->config(); }

} // namespace s3session
