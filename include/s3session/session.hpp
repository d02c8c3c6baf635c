#pragma once

#include "payload.hpp"
#include "storage_client.hpp"
#include "types.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace s3session {

enum class Phase { kEnsureBucket, kUpload, kList, kDownload, kDeleteObjects, kDeleteBucket };

// Whether a failing phase ends the run (kFailFast) or is only reported.
enum class PhasePolicy { kBestEffort, kFailFast };

enum class PhaseOutcome { kSuccess, kPartial, kAbort };

enum class RunState {
    kInit,
    kBucketEnsured,
    kUploaded,
    kListed,
    kDownloaded,
    kObjectsDeleted,
    kBucketDeleted,
    kDone,
    kAborted,
};

PhasePolicy PolicyFor(Phase phase);

// State the run enters once `phase` has finished without aborting.
RunState StateAfter(Phase phase);

const char* ToString(Phase phase);
const char* ToString(PhasePolicy policy);
const char* ToString(PhaseOutcome outcome);
const char* ToString(RunState state);

struct PhaseReport {
    Phase phase;
    PhasePolicy policy;
    PhaseOutcome outcome = PhaseOutcome::kSuccess;
    std::vector<TransferResult> transfers;
    std::vector<std::string> warnings;
};

struct RunReport {
    RunState state = RunState::kInit;
    std::optional<Phase> aborted_in;
    BucketHandle bucket;
    std::vector<ObjectRecord> objects;
    std::vector<std::string> listed_keys;
    std::vector<std::string> downloaded_files;
    std::vector<PhaseReport> phases;

    bool done() const { return state == RunState::kDone; }

    // 0 when the run reached Done, 1 when it aborted.
    int ExitCode() const { return done() ? 0 : 1; }

    // Report of `phase`, or nullptr when the phase never ran.
    const PhaseReport* Find(Phase phase) const;
};

// Checked by Session::Run between phases, never in the middle of one.
class CancellationToken {
public:
    void Cancel() { cancelled_.store(true); }
    bool IsCancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

// Seconds since the Unix epoch; used for the object key prefix.
using TimestampSource = std::function<std::int64_t()>;

class SessionImpl;

/**
 * @class Session
 * @brief Runs the bucket/object round trip against a StorageClient.
 *
 * Phases run in a fixed order: ensure bucket, upload, list, download,
 * delete objects, delete bucket. Bucket creation and deletion are
 * best-effort; every other phase aborts the run on its first failure.
 * Nothing is rolled back after an abort.
 */
class Session {
public:
    // Throws std::invalid_argument when `client` is null.
    Session(const Config& cfg, std::shared_ptr<StorageClient> client);
    Session(const Config& cfg, std::shared_ptr<StorageClient> client, TimestampSource timestamps);
    ~Session();

    /**
     * @brief Executes every phase against `bucket`.
     * @param payloads Uploaded in order. Missing local files are skipped.
     * @param cancel Optional; polled before each phase.
     * @throws std::invalid_argument if `bucket` is empty.
     */
    RunReport Run(const std::string& bucket,
                  const std::vector<PayloadSpec>& payloads,
                  const CancellationToken* cancel = nullptr);

    // Same, against the configured bucket.
    RunReport Run(const std::vector<PayloadSpec>& payloads, const CancellationToken* cancel = nullptr);

    const Config& config() const;

private:
    // PIMPL Idiom
    std::unique_ptr<SessionImpl> p_impl;

    // Disable copy/move
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
    Session(Session&&) = delete;
    Session& operator=(Session&&) = delete;
};

} // namespace s3session
