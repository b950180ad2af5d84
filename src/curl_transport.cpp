#include "curl_transport.hpp"

#include <cstdlib>
#include <mutex>
#include <stdexcept>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace
{

void ensureCurlInitialized()
{
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
        {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

/**
 * Response body pulled out of libcurl one chunk at a time.
 *
 * The easy handle lives in a private multi handle; every call into the
 * stream runs curl_multi_perform()/curl_multi_poll() until data, headers or
 * completion is available. Between polls the cancellation token is checked.
 */
class CurlResponseStream final : public ResponseStream
{
public:
    CurlResponseStream(const std::string &url,
                       const TransportOptions &options,
                       const CancellationToken &cancel);
    ~CurlResponseStream() override;

    CurlResponseStream(const CurlResponseStream &) = delete;
    CurlResponseStream &operator=(const CurlResponseStream &) = delete;

    /**
     * Run the transfer until the response headers are in.
     * @throws TransferError on connection failure or HTTP status >= 400
     */
    void awaitHeaders();

    long statusCode() const override { return status_; }
    std::optional<std::uint64_t> contentLength() const override { return contentLength_; }
    bool readChunk(std::string &buffer) override;

private:
    /**
     * One step of the transfer: perform, collect completion, poll for activity.
     */
    void pump();

    [[noreturn]] void throwTransferFailure() const;

    /**
     * Static callback for libcurl to hand over downloaded data.
     * libcurl is C library, so callbacks must be static or free functions.
     */
    static size_t writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata);

    /**
     * Called once per header line; an empty line ends a header block.
     */
    static size_t headerCallback(char *buffer, size_t size, size_t nitems, void *userdata);

    std::unique_ptr<CURLM, decltype(&curl_multi_cleanup)> multi_;
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> easy_;
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headerList_;

    std::string url_;
    const CancellationToken &cancel_;
    bool attached_ = false;

    std::string pending_; // body bytes received but not yet read
    bool headersDone_ = false;
    bool finished_ = false;
    CURLcode result_ = CURLE_OK;
    long status_ = 0;
    std::optional<std::uint64_t> contentLength_;
    char errorBuffer_[CURL_ERROR_SIZE] = {};

    // Upper bound on a single wait so cancellation is noticed promptly
    static constexpr int POLL_TIMEOUT_MS = 100;
};

CurlResponseStream::CurlResponseStream(const std::string &url,
                                       const TransportOptions &options,
                                       const CancellationToken &cancel)
    : multi_(curl_multi_init(), curl_multi_cleanup),
      easy_(curl_easy_init(), curl_easy_cleanup),
      headerList_(nullptr, curl_slist_free_all),
      url_(url),
      cancel_(cancel)
{
    if (!multi_ || !easy_)
    {
        throw TransferError(ErrorKind::ConnectError, "Failed to initialize CURL (out of memory or library error)");
    }

    CURL *curl = easy_.get();

    // 1. Set URL
    curl_easy_setopt(curl, CURLOPT_URL, url_.c_str());

    // 2. Body and header callbacks
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, this);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, this);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errorBuffer_);

    // 3. HTTPS settings (CRITICAL for security)
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L); // Verify server certificate
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L); // Verify hostname matches cert

    // 4. Follow HTTP redirects (e.g., http://example.com -> https://example.com)
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, options.maxRedirects);

    // 5. Timeouts. Signals are unusable for timeouts in a multi-threaded process
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options.connectTimeout.count()));
    if (options.timeout.count() > 0)
    {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(options.timeout.count()));

        // A read that stalls (< 1 byte/s) for the whole window counts as a timeout too
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(options.timeout.count()));
    }

    // 6. Identification and passthrough headers
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options.userAgent.c_str());
    for (const auto &header : options.headers)
    {
        curl_slist *appended = curl_slist_append(headerList_.get(), header.c_str());
        if (!appended)
        {
            throw TransferError(ErrorKind::ConnectError, "Failed to build request headers");
        }
        headerList_.release();
        headerList_.reset(appended);
    }
    if (headerList_)
    {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headerList_.get());
    }

    CURLMcode mc = curl_multi_add_handle(multi_.get(), curl);
    if (mc != CURLM_OK)
    {
        throw TransferError(ErrorKind::ConnectError,
                            fmt::format("curl_multi_add_handle failed: {}", curl_multi_strerror(mc)));
    }
    attached_ = true;
}

CurlResponseStream::~CurlResponseStream()
{
    // The easy handle must leave the multi handle before either is cleaned up
    if (attached_)
    {
        curl_multi_remove_handle(multi_.get(), easy_.get());
    }
}

size_t CurlResponseStream::writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    // Calculate total bytes in this chunk
    size_t totalSize = size * nmemb;

    auto *stream = static_cast<CurlResponseStream *>(userdata);
    stream->headersDone_ = true;
    stream->pending_.append(ptr, totalSize);

    // If we return a different value, libcurl aborts the transfer
    return totalSize;
}

size_t CurlResponseStream::headerCallback(char *buffer, size_t size, size_t nitems, void *userdata)
{
    size_t totalSize = size * nitems;
    auto *stream = static_cast<CurlResponseStream *>(userdata);

    bool blankLine = (totalSize == 2 && buffer[0] == '\r' && buffer[1] == '\n') ||
                     (totalSize == 1 && buffer[0] == '\n');
    if (!blankLine)
    {
        return totalSize;
    }

    long code = 0;
    curl_easy_getinfo(stream->easy_.get(), CURLINFO_RESPONSE_CODE, &code);

    // 1xx interim responses and redirects are followed by another header block
    bool interim = code >= 100 && code < 200;
    bool redirect = code >= 300 && code < 400;
    if (!interim && !redirect)
    {
        stream->headersDone_ = true;
    }
    return totalSize;
}

void CurlResponseStream::pump()
{
    int running = 0;
    CURLMcode mc = curl_multi_perform(multi_.get(), &running);
    if (mc != CURLM_OK)
    {
        throw TransferError(headersDone_ ? ErrorKind::StreamInterrupted : ErrorKind::ConnectError,
                            fmt::format("curl_multi_perform failed: {}", curl_multi_strerror(mc)));
    }

    int remaining = 0;
    while (CURLMsg *message = curl_multi_info_read(multi_.get(), &remaining))
    {
        if (message->msg == CURLMSG_DONE && message->easy_handle == easy_.get())
        {
            finished_ = true;
            result_ = message->data.result;
        }
    }

    // Nothing to hand out yet: wait for socket activity
    if (!finished_ && running > 0 && pending_.empty())
    {
        curl_multi_poll(multi_.get(), nullptr, 0, POLL_TIMEOUT_MS, nullptr);
    }
}

void CurlResponseStream::awaitHeaders()
{
    while (!headersDone_ && !finished_)
    {
        if (cancel_.isCancelled())
        {
            throw TransferError(ErrorKind::Cancelled, fmt::format("Request to {} cancelled", url_));
        }
        pump();
    }

    if (finished_ && result_ != CURLE_OK)
    {
        throwTransferFailure();
    }

    curl_easy_getinfo(easy_.get(), CURLINFO_RESPONSE_CODE, &status_);
    if (status_ >= 400)
    {
        throw TransferError(ErrorKind::HttpStatusError,
                            fmt::format("HTTP error {}: {}", status_, CurlTransport::getHttpStatusText(status_)),
                            status_);
    }

    curl_off_t length = -1;
    if (curl_easy_getinfo(easy_.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) == CURLE_OK && length >= 0)
    {
        contentLength_ = static_cast<std::uint64_t>(length);
    }

    spdlog::debug("{} -> HTTP {}, Content-Length {}", url_, status_,
                  contentLength_ ? std::to_string(*contentLength_) : std::string("unknown"));
}

bool CurlResponseStream::readChunk(std::string &buffer)
{
    while (pending_.empty() && !finished_)
    {
        if (cancel_.isCancelled())
        {
            throw TransferError(ErrorKind::Cancelled, fmt::format("Download of {} cancelled", url_));
        }
        pump();
    }

    // Hand out what arrived before reporting how the transfer ended
    if (!pending_.empty())
    {
        buffer.swap(pending_);
        pending_.clear();
        return true;
    }

    if (result_ != CURLE_OK)
    {
        throwTransferFailure();
    }

    buffer.clear();
    return false;
}

void CurlResponseStream::throwTransferFailure() const
{
    ErrorKind kind = CurlTransport::classifyError(result_, headersDone_);
    std::string detail = errorBuffer_[0] != '\0' ? std::string(errorBuffer_) : std::string(curl_easy_strerror(result_));
    throw TransferError(kind, fmt::format("{}: {}", url_, detail));
}

} // namespace

CurlTransport::CurlTransport()
{
    ensureCurlInitialized();
}

std::unique_ptr<ResponseStream> CurlTransport::open(const std::string &url,
                                                    const TransportOptions &options,
                                                    const CancellationToken &cancel)
{
    auto stream = std::make_unique<CurlResponseStream>(url, options, cancel);
    stream->awaitHeaders();
    return stream;
}

// Classify error for retry logic
ErrorKind CurlTransport::classifyError(CURLcode code, bool headersReceived)
{
    switch (code)
    {
    // Server didn't respond in time, or the transfer stalled
    case CURLE_OPERATION_TIMEDOUT:
        return ErrorKind::TimeoutError;

    // Could not reach the server (might be temporary)
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_RESOLVE_PROXY:
    case CURLE_COULDNT_CONNECT:
    case CURLE_SSL_CONNECT_ERROR:
    case CURLE_PEER_FAILED_VERIFICATION:
        return ErrorKind::ConnectError;

    // Retrying won't help
    case CURLE_URL_MALFORMAT:
    case CURLE_UNSUPPORTED_PROTOCOL:
        return ErrorKind::InvalidUrl;

    case CURLE_ABORTED_BY_CALLBACK:
        return ErrorKind::Cancelled;

    // Transfer ended early (network interruption)
    case CURLE_PARTIAL_FILE:
    case CURLE_RECV_ERROR:
    case CURLE_SEND_ERROR:
    case CURLE_GOT_NOTHING:
    default:
        return headersReceived ? ErrorKind::StreamInterrupted : ErrorKind::ConnectError;
    }
}

// Helper: Get human-readable HTTP status text
std::string CurlTransport::getHttpStatusText(long code)
{
    switch (code)
    {
    case 400:
        return "Bad Request";
    case 401:
        return "Unauthorized";
    case 403:
        return "Forbidden";
    case 404:
        return "Not Found";
    case 408:
        return "Request Timeout";
    case 429:
        return "Too Many Requests";
    case 500:
        return "Internal Server Error";
    case 502:
        return "Bad Gateway";
    case 503:
        return "Service Unavailable";
    case 504:
        return "Gateway Timeout";
    default:
        return "Unknown Status";
    }
}
