#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cancellation_token.hpp"

/**
 * Per-request transport settings.
 */
struct TransportOptions
{
    std::chrono::seconds connectTimeout{5};

    // Bound on the whole transfer; also the stall window for a single read.
    // Zero disables both.
    std::chrono::seconds timeout{30};

    std::vector<std::string> headers; // "Name: value", sent verbatim
    std::string userAgent = "dw/1.0";
    long maxRedirects = 5;
};

/**
 * Body of an HTTP response whose headers have been received.
 */
class ResponseStream
{
public:
    virtual ~ResponseStream() = default;

    virtual long statusCode() const = 0;

    /**
     * Size hint from the Content-Length header, if the server sent one.
     */
    virtual std::optional<std::uint64_t> contentLength() const = 0;

    /**
     * Read the next chunk of the body into buffer (its previous contents
     * are discarded).
     *
     * @param buffer Receives the chunk
     * @return false once the end of the stream was reached
     * @throws TransferError StreamInterrupted, TimeoutError or Cancelled
     */
    virtual bool readChunk(std::string &buffer) = 0;
};

/**
 * Issues GET requests. Never touches the filesystem.
 */
class HttpTransport
{
public:
    virtual ~HttpTransport() = default;

    /**
     * Send a GET request and wait for the response headers.
     *
     * @param url Resource to fetch
     * @param options Timeouts and passthrough headers
     * @param cancel Observed while waiting on the network
     * @return Open stream positioned at the start of the body
     * @throws TransferError ConnectError, TimeoutError, HttpStatusError,
     *         InvalidUrl or Cancelled
     */
    virtual std::unique_ptr<ResponseStream> open(const std::string &url,
                                                 const TransportOptions &options,
                                                 const CancellationToken &cancel) = 0;
};
