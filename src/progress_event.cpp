#include "progress_event.hpp"

const char *toString(EventName name)
{
    switch (name)
    {
    case EventName::BatchStart:
        return "batch_start";
    case EventName::RequestSent:
        return "request_sent";
    case EventName::ResponseReceived:
        return "response_received";
    case EventName::FileSizeKnown:
        return "file_size_known";
    case EventName::FileSizeUnknown:
        return "file_size_unknown";
    case EventName::FileExistsSkip:
        return "file_exists_skip";
    case EventName::FileCreate:
        return "file_create";
    case EventName::DownloadStart:
        return "download_start";
    case EventName::DownloadProgress:
        return "download_progress";
    case EventName::DownloadRetry:
        return "download_retry";
    case EventName::DownloadSuccess:
        return "download_success";
    case EventName::DownloadError:
        return "download_error";
    case EventName::DownloadCancelled:
        return "download_cancelled";
    case EventName::BatchFinish:
        return "batch_finish";
    }
    return "unknown";
}
