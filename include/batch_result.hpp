#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "download_request.hpp"
#include "error_kind.hpp"

/**
 * Final outcome of one transfer task.
 */
struct TransferOutcome
{
    DownloadRequest request;
    bool succeeded = false;
    std::optional<ErrorKind> error; // unset on success
    long httpStatus = 0;
    std::string message;
    int attempts = 0;
    std::uint64_t bytesWritten = 0;

    bool cancelled() const { return error == ErrorKind::Cancelled; }
};

/**
 * Detail of a transfer that ended in a (non-cancelled) failure.
 */
struct TransferFailure
{
    DownloadRequest request;
    ErrorKind kind;
    long httpStatus = 0;
    std::string message;
    int attempts = 0;
};

/**
 * Aggregate outcome of a batch, in request order.
 * Cancelled transfers are counted separately and are not listed as failures.
 */
struct BatchResult
{
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::size_t cancelled = 0;

    std::vector<TransferFailure> failures;
    std::vector<TransferOutcome> outcomes;

    void record(const TransferOutcome &outcome);

    std::size_t total() const { return outcomes.size(); }
    bool allSucceeded() const { return succeeded == outcomes.size(); }
};
