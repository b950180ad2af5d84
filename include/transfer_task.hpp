#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "batch_result.hpp"
#include "cancellation_token.hpp"
#include "download_request.hpp"
#include "http_transport.hpp"
#include "progress_event.hpp"
#include "progress_reporter.hpp"
#include "retry_policy.hpp"
#include "transfer_state.hpp"

/**
 * Settings shared by every task of a batch.
 */
struct TransferOptions
{
    TransportOptions transport;
    int retries = 3;    // total attempts for transient failures
    bool force = false; // overwrite an existing destination
};

/**
 * Downloads one resource to one destination, retrying transient failures.
 *
 * The body is streamed into "<destination>.part" and renamed over the
 * destination once complete, so a failed or cancelled task never leaves a
 * truncated file under the final name.
 *
 * A task is single-use and runs on the calling thread; state() is only
 * meaningful to that thread or after run() returned.
 */
class TransferTask
{
public:
    TransferTask(std::size_t id,
                 DownloadRequest request,
                 HttpTransport &transport,
                 const RetryPolicy &policy,
                 const TransferOptions &options,
                 ProgressReporter &reporter,
                 const CancellationToken &cancel);

    // Tasks hold references to shared engine objects
    TransferTask(const TransferTask &) = delete;
    TransferTask &operator=(const TransferTask &) = delete;

    /**
     * Drive the state machine until a terminal state is reached.
     * Never throws TransferError; every failure ends up in the outcome.
     */
    TransferOutcome run();

    const TransferState &state() const { return state_; }
    const RetryContext &retryContext() const { return context_; }
    std::size_t id() const { return id_; }

    /**
     * Temporary file the body is written to while streaming.
     */
    static std::filesystem::path makePartPath(const std::filesystem::path &destination);

private:
    /**
     * One request/stream/write cycle.
     * @throws TransferError on any failure
     */
    void attemptOnce();

    /**
     * Create missing parent directories of the destination.
     * @throws TransferError FilesystemWriteError
     */
    void ensureDirectoryExists() const;

    /**
     * Require requiredBytes plus 10% free space next to the destination.
     * @throws TransferError FilesystemWriteError
     */
    void checkDiskSpace(std::uint64_t requiredBytes) const;

    void commitPartFile() const;
    void removePartFile() const;

    void transition(const TransferState &next);
    void emit(EventName name, const std::string &message = {});

    TransferOutcome finishSucceeded();
    TransferOutcome finishFailed(ErrorKind kind, const std::string &message, long httpStatus);
    TransferOutcome finishCancelled();

    std::size_t id_;
    DownloadRequest request_;
    std::filesystem::path partPath_;
    HttpTransport &transport_;
    const RetryPolicy &policy_;
    TransferOptions options_;
    ProgressReporter &reporter_;
    const CancellationToken &cancel_;

    TransferState state_;
    RetryContext context_;

    // Size classification is decided on the first response and kept
    bool sizeDecided_ = false;
    std::optional<std::uint64_t> totalBytes_;

    int attemptsMade_ = 0;
    std::uint64_t bytesSoFar_ = 0;
    long lastHttpStatus_ = 0;
    std::chrono::milliseconds pendingBackoff_{0};
};
