#pragma once

#include <memory>
#include <string>
#include <curl/curl.h>

#include "error_kind.hpp"
#include "http_transport.hpp"

/**
 * HTTP transport backed by libcurl.
 *
 * Each open() drives its own easy handle through a private multi handle, so
 * the body can be pulled chunk by chunk and the caller regains control
 * between network waits (where cancellation is checked).
 * Safe to share between threads: open() keeps no state in the transport.
 */
class CurlTransport final : public HttpTransport
{
public:
    /**
     * Initializes libcurl globally on first construction.
     * @throws std::runtime_error if libcurl cannot be initialized
     */
    CurlTransport();

    std::unique_ptr<ResponseStream> open(const std::string &url,
                                         const TransportOptions &options,
                                         const CancellationToken &cancel) override;

    /**
     * Map a libcurl failure onto the engine's error taxonomy.
     *
     * @param code CURL error code from the finished transfer
     * @param headersReceived Whether the response headers had arrived
     * @return Error kind (StreamInterrupted only after headers)
     */
    static ErrorKind classifyError(CURLcode code, bool headersReceived);

    /**
     * Get human-readable HTTP status text for a status code.
     */
    static std::string getHttpStatusText(long code);
};
