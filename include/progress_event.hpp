#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "error_kind.hpp"
#include "transfer_state.hpp"

/**
 * Named lifecycle events emitted by the engine.
 * The string identifiers returned by toString() are stable and are what
 * renderers and message hooks key on.
 */
enum class EventName
{
    BatchStart,        // "batch_start"
    RequestSent,       // "request_sent"
    ResponseReceived,  // "response_received"
    FileSizeKnown,     // "file_size_known"
    FileSizeUnknown,   // "file_size_unknown"
    FileExistsSkip,    // "file_exists_skip"
    FileCreate,        // "file_create"
    DownloadStart,     // "download_start"
    DownloadProgress,  // "download_progress"
    DownloadRetry,     // "download_retry"
    DownloadSuccess,   // "download_success"
    DownloadError,     // "download_error"
    DownloadCancelled, // "download_cancelled"
    BatchFinish        // "batch_finish"
};

const char *toString(EventName name);

/**
 * One state transition of one transfer task.
 * Copied on emission and never mutated afterwards.
 */
struct ProgressEvent
{
    std::size_t taskId = 0;
    EventName name = EventName::RequestSent;
    TransferState state;

    // Bytes written in the current attempt; restarts from 0 on every retry
    std::uint64_t bytes = 0;

    // Set once the task classified itself as SizeKnown
    std::optional<std::uint64_t> totalBytes;

    // Attempt in progress; for download_retry, the attempt about to start
    int attempt = 1;

    std::string url;
    std::string destination;
    std::string displayName;

    std::optional<ErrorKind> error;
    long httpStatus = 0;
    std::string message;

    // Delay before the next attempt (download_retry only)
    std::chrono::milliseconds backoff{0};
};
