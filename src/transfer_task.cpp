#include "transfer_task.hpp"

#include <exception>
#include <fstream>
#include <system_error>
#include <utility>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

TransferTask::TransferTask(std::size_t id,
                           DownloadRequest request,
                           HttpTransport &transport,
                           const RetryPolicy &policy,
                           const TransferOptions &options,
                           ProgressReporter &reporter,
                           const CancellationToken &cancel)
    : id_(id),
      request_(std::move(request)),
      partPath_(makePartPath(request_.destination())),
      transport_(transport),
      policy_(policy),
      options_(options),
      reporter_(reporter),
      cancel_(cancel)
{
}

std::filesystem::path TransferTask::makePartPath(const std::filesystem::path &destination)
{
    // Simply append ".part" to the filename
    std::filesystem::path partPath = destination;
    partPath += ".part";
    return partPath;
}

TransferOutcome TransferTask::run()
{
    if (cancel_.isCancelled())
    {
        return finishCancelled();
    }

    // 1. Refuse to clobber an existing file unless forced, before any network traffic
    std::error_code ec;
    if (!options_.force && std::filesystem::exists(request_.destination(), ec))
    {
        emit(EventName::FileExistsSkip);
        return finishFailed(ErrorKind::FileExistsError,
                            fmt::format("Destination already exists: {}", request_.destination().string()),
                            0);
    }

    // 2. Ensure destination directory exists
    try
    {
        ensureDirectoryExists();
    }
    catch (const TransferError &e)
    {
        return finishFailed(e.kind(), e.what(), 0);
    }

    // 3. Attempt loop; every attempt starts from a fresh context and byte counter
    context_ = RetryContext{};
    while (true)
    {
        ErrorKind kind = ErrorKind::ConnectError;
        std::string message;
        long httpStatus = 0;

        try
        {
            attemptOnce();
            return finishSucceeded();
        }
        catch (const TransferError &e)
        {
            kind = e.kind();
            message = e.what();
            httpStatus = e.httpStatus();
        }
        catch (const std::exception &e)
        {
            // Transport setup failure outside the classified errors; fails this task only
            spdlog::error("[task {}] unexpected error on attempt {}: {}", id_, context_.attempt, e.what());
            kind = ErrorKind::ConnectError;
            message = e.what();
        }

        removePartFile();

        if (kind == ErrorKind::Cancelled || cancel_.isCancelled())
        {
            return finishCancelled();
        }

        RetryDecision decision = policy_.decide(context_.attempt, kind, options_.retries);
        if (!decision.shouldRetry())
        {
            if (isTransient(kind))
            {
                message = fmt::format("{} (after {} {})", message, context_.attempt,
                                      context_.attempt == 1 ? "attempt" : "attempts");
            }
            return finishFailed(kind, message, httpStatus);
        }

        spdlog::info("[task {}] attempt {}/{} failed: {}; retrying in {} ms",
                     id_, context_.attempt, options_.retries, message, decision.backoff.count());

        pendingBackoff_ = decision.backoff;
        transition(TransferState::retrying(context_.attempt + 1));
        emit(EventName::DownloadRetry, message);
        pendingBackoff_ = std::chrono::milliseconds(0);

        // Wait before retry
        if (!cancel_.waitFor(decision.backoff))
        {
            return finishCancelled();
        }

        context_ = context_.next(kind, decision.backoff);
    }
}

void TransferTask::attemptOnce()
{
    ++attemptsMade_;
    bytesSoFar_ = 0;
    lastHttpStatus_ = 0;

    transition(TransferState::connecting());
    emit(EventName::RequestSent);

    std::unique_ptr<ResponseStream> stream = transport_.open(request_.source(), options_.transport, cancel_);
    lastHttpStatus_ = stream->statusCode();
    const std::optional<std::uint64_t> expected = stream->contentLength();

    // Size classification happens once per task and survives retries
    if (!sizeDecided_)
    {
        sizeDecided_ = true;
        totalBytes_ = expected;
        transition(totalBytes_ ? TransferState::sizeKnown(*totalBytes_) : TransferState::sizeUnknown());
        emit(EventName::ResponseReceived);
        emit(totalBytes_ ? EventName::FileSizeKnown : EventName::FileSizeUnknown);
    }
    else
    {
        transition(totalBytes_ ? TransferState::sizeKnown(*totalBytes_) : TransferState::sizeUnknown());
        emit(EventName::ResponseReceived);
    }

    if (expected)
    {
        checkDiskSpace(*expected);
    }

    // Open .part file, truncating whatever an earlier attempt left behind
    std::ofstream outFile(partPath_, std::ios::binary | std::ios::trunc);
    if (!outFile)
    {
        throw TransferError(ErrorKind::FilesystemWriteError,
                            fmt::format("Cannot open file for writing: {}", partPath_.string()));
    }
    emit(EventName::FileCreate);

    transition(TransferState::streaming(0));
    emit(EventName::DownloadStart);

    std::string chunk;
    while (stream->readChunk(chunk))
    {
        if (cancel_.isCancelled())
        {
            throw TransferError(ErrorKind::Cancelled, "Download cancelled");
        }
        if (chunk.empty())
        {
            continue;
        }

        outFile.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        if (!outFile.good())
        {
            throw TransferError(ErrorKind::FilesystemWriteError,
                                fmt::format("Failed to write {}", partPath_.string()));
        }

        bytesSoFar_ += chunk.size();
        transition(TransferState::streaming(bytesSoFar_));
        emit(EventName::DownloadProgress);
    }

    outFile.close();
    if (outFile.fail())
    {
        throw TransferError(ErrorKind::FilesystemWriteError,
                            fmt::format("Failed to flush {}", partPath_.string()));
    }

    // Only check if server provided Content-Length
    if (expected && bytesSoFar_ != *expected)
    {
        throw TransferError(ErrorKind::StreamInterrupted,
                            fmt::format("Size mismatch: expected {} bytes but got {}", *expected, bytesSoFar_));
    }

    commitPartFile();
}

void TransferTask::ensureDirectoryExists() const
{
    auto directory = request_.destination().parent_path();

    // If parent directory is empty (file in current dir), nothing to create
    if (directory.empty())
    {
        return;
    }

    try
    {
        // Create all parent directories (like mkdir -p)
        std::filesystem::create_directories(directory);
    }
    catch (const std::filesystem::filesystem_error &e)
    {
        throw TransferError(ErrorKind::FilesystemWriteError,
                            fmt::format("Failed to create directory for {}: {}",
                                        request_.destination().string(), e.what()));
    }
}

void TransferTask::checkDiskSpace(std::uint64_t requiredBytes) const
{
    if (requiredBytes == 0)
    {
        return;
    }

    auto directory = request_.destination().parent_path();
    if (directory.empty())
    {
        directory = ".";
    }

    std::error_code ec;
    auto spaceInfo = std::filesystem::space(directory, ec);
    if (ec)
    {
        // Some filesystems don't support space queries
        spdlog::warn("[task {}] Unable to check disk space in {}: {}", id_, directory.string(), ec.message());
        return;
    }

    // Keep a 10% buffer, some filesystems reserve space
    std::uint64_t requiredWithBuffer = requiredBytes + requiredBytes / 10;
    if (spaceInfo.available < requiredWithBuffer)
    {
        throw TransferError(ErrorKind::FilesystemWriteError,
                            fmt::format("Insufficient disk space: need {} bytes (+ 10% buffer) but only {} available",
                                        requiredBytes, spaceInfo.available));
    }
}

void TransferTask::commitPartFile() const
{
    try
    {
        // Replaces an existing destination (only reachable with force)
        std::filesystem::rename(partPath_, request_.destination());
    }
    catch (const std::filesystem::filesystem_error &e)
    {
        throw TransferError(ErrorKind::FilesystemWriteError,
                            fmt::format("Failed to rename {} to {}: {}",
                                        partPath_.string(), request_.destination().string(), e.what()));
    }
}

void TransferTask::removePartFile() const
{
    std::error_code ec;
    std::filesystem::remove(partPath_, ec);
    if (ec)
    {
        spdlog::warn("[task {}] Could not remove {}: {}", id_, partPath_.string(), ec.message());
    }
}

void TransferTask::transition(const TransferState &next)
{
    spdlog::debug("[task {}] {} -> {}", id_,
                  TransferState::phaseName(state_.phase()), TransferState::phaseName(next.phase()));
    state_ = next;
}

void TransferTask::emit(EventName name, const std::string &message)
{
    ProgressEvent event;
    event.taskId = id_;
    event.name = name;
    event.state = state_;
    event.bytes = bytesSoFar_;
    event.totalBytes = totalBytes_;
    event.attempt = state_.phase() == TransferState::Phase::Retrying ? state_.attempt() : context_.attempt;
    event.url = request_.source();
    event.destination = request_.destination().string();
    event.displayName = request_.displayName();
    event.error = state_.errorKind();
    event.httpStatus = lastHttpStatus_;
    event.message = message;
    event.backoff = pendingBackoff_;

    reporter_.onEvent(event);
}

TransferOutcome TransferTask::finishSucceeded()
{
    transition(TransferState::succeeded());
    emit(EventName::DownloadSuccess);
    spdlog::info("[task {}] {} -> {} ({} bytes, {} {})", id_, request_.source(),
                 request_.destination().string(), bytesSoFar_, attemptsMade_,
                 attemptsMade_ == 1 ? "attempt" : "attempts");

    TransferOutcome outcome{request_};
    outcome.succeeded = true;
    outcome.httpStatus = lastHttpStatus_;
    outcome.attempts = attemptsMade_;
    outcome.bytesWritten = bytesSoFar_;
    return outcome;
}

TransferOutcome TransferTask::finishFailed(ErrorKind kind, const std::string &message, long httpStatus)
{
    lastHttpStatus_ = httpStatus;
    transition(TransferState::failed(kind));
    emit(EventName::DownloadError, message);
    spdlog::error("[task {}] {} failed: {} ({})", id_, request_.source(), message, toString(kind));

    TransferOutcome outcome{request_};
    outcome.error = kind;
    outcome.httpStatus = httpStatus;
    outcome.message = message;
    outcome.attempts = attemptsMade_;
    return outcome;
}

TransferOutcome TransferTask::finishCancelled()
{
    transition(TransferState::failed(ErrorKind::Cancelled));
    emit(EventName::DownloadCancelled, "Download cancelled");
    spdlog::info("[task {}] {} cancelled", id_, request_.source());

    TransferOutcome outcome{request_};
    outcome.error = ErrorKind::Cancelled;
    outcome.message = "Download cancelled";
    outcome.attempts = attemptsMade_;
    return outcome;
}
