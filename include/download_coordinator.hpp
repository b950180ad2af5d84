#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "batch_result.hpp"
#include "cancellation_token.hpp"
#include "download_request.hpp"
#include "http_transport.hpp"
#include "progress_reporter.hpp"
#include "retry_policy.hpp"
#include "transfer_task.hpp"

/**
 * Runs a batch of downloads with bounded parallelism.
 *
 * Requests are admitted first-come-first-served; at most `parallelism`
 * transfer tasks run at once. A failed task never stops its siblings: the
 * batch always drains unless cancel() is called.
 */
class DownloadCoordinator
{
public:
    DownloadCoordinator(std::shared_ptr<HttpTransport> transport,
                        ProgressReporter &reporter,
                        TransferOptions options,
                        RetryPolicy policy = RetryPolicy());

    DownloadCoordinator(const DownloadCoordinator &) = delete;
    DownloadCoordinator &operator=(const DownloadCoordinator &) = delete;

    /**
     * Download every request and wait for all of them to finish.
     *
     * Requests with an invalid URL, or whose destination was already claimed
     * by an earlier request of the same batch, are rejected without any
     * network traffic.
     *
     * @param requests Batch to download
     * @param parallelism Maximum number of simultaneous transfers (> 0)
     * @return Aggregate result, outcomes in request order
     * @throws std::invalid_argument if parallelism is zero
     */
    BatchResult run(const std::vector<DownloadRequest> &requests, std::size_t parallelism);

    /**
     * Cooperatively cancel the running batch. Safe to call from any thread
     * and from a signal handler.
     *
     * A coordinator is single-use once cancelled: later run() calls still
     * reject invalid requests but report every admissible one as Cancelled
     * without opening a connection.
     */
    void cancel() noexcept { cancel_.cancel(); }

    CancellationToken &cancellationToken() noexcept { return cancel_; }

    /**
     * Highest number of simultaneous transfers seen during the last run().
     */
    std::size_t peakInFlight() const { return peakInFlight_; }

private:
    TransferOutcome reject(std::size_t index, const DownloadRequest &request,
                           ErrorKind kind, const std::string &message);
    TransferOutcome skipCancelled(std::size_t index, const DownloadRequest &request);

    std::shared_ptr<HttpTransport> transport_;
    ProgressReporter &reporter_;
    TransferOptions options_;
    RetryPolicy policy_;
    CancellationToken cancel_;
    std::size_t peakInFlight_ = 0;
};
