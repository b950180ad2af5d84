#include "error_kind.hpp"

bool isTransient(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::ConnectError:      // server might be restarting
    case ErrorKind::TimeoutError:      // server didn't respond in time
    case ErrorKind::HttpStatusError:   // 5xx overload, or a flaky proxy
    case ErrorKind::StreamInterrupted: // network glitch mid-transfer
        return true;

    case ErrorKind::FilesystemWriteError:
    case ErrorKind::FileExistsError:
    case ErrorKind::InvalidUrl:
    case ErrorKind::DuplicateDestination:
    case ErrorKind::Cancelled:
        return false;
    }
    return false;
}

const char *toString(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::ConnectError:
        return "ConnectError";
    case ErrorKind::TimeoutError:
        return "TimeoutError";
    case ErrorKind::HttpStatusError:
        return "HttpStatusError";
    case ErrorKind::StreamInterrupted:
        return "StreamInterrupted";
    case ErrorKind::FilesystemWriteError:
        return "FilesystemWriteError";
    case ErrorKind::FileExistsError:
        return "FileExistsError";
    case ErrorKind::InvalidUrl:
        return "InvalidUrl";
    case ErrorKind::DuplicateDestination:
        return "DuplicateDestination";
    case ErrorKind::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

TransferError::TransferError(ErrorKind kind, const std::string &message, long httpStatus)
    : std::runtime_error(message), kind_(kind), httpStatus_(httpStatus)
{
}
