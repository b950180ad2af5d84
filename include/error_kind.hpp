#pragma once

#include <stdexcept>
#include <string>

/**
 * Why a transfer did not succeed.
 *
 * ConnectError, TimeoutError, HttpStatusError and StreamInterrupted are
 * transient and worth retrying. Everything else ends the task immediately.
 */
enum class ErrorKind
{
    ConnectError,         // DNS, refused connection, TLS handshake
    TimeoutError,         // connect or transfer timeout expired
    HttpStatusError,      // server answered with status >= 400
    StreamInterrupted,    // body ended early or the connection broke mid-stream
    FilesystemWriteError, // destination unwritable (permissions, disk full, ...)
    FileExistsError,      // destination present and overwrite not forced
    InvalidUrl,           // malformed or unsupported URL
    DuplicateDestination, // another request in the batch already claimed the path
    Cancelled             // batch cancelled; not reported as an error
};

/**
 * @return true if a failed attempt with this kind may be retried
 */
bool isTransient(ErrorKind kind);

/**
 * Stable identifier of the error kind, e.g. "HttpStatusError".
 */
const char *toString(ErrorKind kind);

/**
 * Failure raised by the transport and by the transfer task internals.
 * Carries the error kind and, for HttpStatusError, the response status.
 */
class TransferError : public std::runtime_error
{
public:
    TransferError(ErrorKind kind, const std::string &message, long httpStatus = 0);

    ErrorKind kind() const noexcept { return kind_; }
    long httpStatus() const noexcept { return httpStatus_; }

private:
    ErrorKind kind_;
    long httpStatus_;
};
