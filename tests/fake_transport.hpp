#pragma once

#include <algorithm>
#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <fmt/core.h>
#include "error_kind.hpp"
#include "http_transport.hpp"

/**
 * What the fake server does for one request.
 */
struct ScriptedResponse
{
    std::optional<ErrorKind> openError; // thrown by open()
    long status = 200;
    std::string body;
    std::optional<std::uint64_t> contentLength; // unset: no size hint
    std::optional<ErrorKind> midStreamError;    // thrown once the body is sent
    std::size_t chunkSize = 4;
    std::chrono::milliseconds chunkDelay{0};

    static ScriptedResponse ok(const std::string &body, bool withLength = true)
    {
        ScriptedResponse response;
        response.body = body;
        if (withLength)
        {
            response.contentLength = body.size();
        }
        return response;
    }

    static ScriptedResponse slow(const std::string &body, std::chrono::milliseconds chunkDelay)
    {
        ScriptedResponse response = ok(body);
        response.chunkDelay = chunkDelay;
        return response;
    }

    static ScriptedResponse httpError(long status)
    {
        ScriptedResponse response;
        response.openError = ErrorKind::HttpStatusError;
        response.status = status;
        return response;
    }

    static ScriptedResponse failure(ErrorKind kind)
    {
        ScriptedResponse response;
        response.openError = kind;
        return response;
    }

    // Sends `sent`, announces `announced` bytes, then breaks the connection
    static ScriptedResponse interrupted(const std::string &sent, std::uint64_t announced)
    {
        ScriptedResponse response;
        response.body = sent;
        response.contentLength = announced;
        response.midStreamError = ErrorKind::StreamInterrupted;
        return response;
    }

    // Ends cleanly but short of the announced size
    static ScriptedResponse truncated(const std::string &sent, std::uint64_t announced)
    {
        ScriptedResponse response;
        response.body = sent;
        response.contentLength = announced;
        return response;
    }
};

/**
 * In-memory HttpTransport replaying scripted responses per URL.
 * The last response of a script repeats once the script is exhausted.
 */
class FakeTransport : public HttpTransport
{
public:
    void script(const std::string &url, std::deque<ScriptedResponse> responses)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        scripts_[url] = std::move(responses);
    }

    std::unique_ptr<ResponseStream> open(const std::string &url,
                                         const TransportOptions &,
                                         const CancellationToken &cancel) override
    {
        ScriptedResponse response;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++opens_[url];
            ++totalOpens_;

            auto it = scripts_.find(url);
            if (it == scripts_.end() || it->second.empty())
            {
                throw TransferError(ErrorKind::ConnectError, fmt::format("No script for {}", url));
            }
            response = it->second.front();
            if (it->second.size() > 1)
            {
                it->second.pop_front();
            }
        }

        if (cancel.isCancelled())
        {
            throw TransferError(ErrorKind::Cancelled, "cancelled");
        }
        if (response.openError)
        {
            long status = *response.openError == ErrorKind::HttpStatusError ? response.status : 0;
            throw TransferError(*response.openError,
                                fmt::format("scripted {} for {}", toString(*response.openError), url),
                                status);
        }
        return std::make_unique<Stream>(*this, std::move(response), cancel);
    }

    int opens(const std::string &url) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = opens_.find(url);
        return it == opens_.end() ? 0 : it->second;
    }

    int totalOpens() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return totalOpens_;
    }

    // Most streams that were open at the same time
    int peakActive() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return peakActive_;
    }

private:
    class Stream : public ResponseStream
    {
    public:
        Stream(FakeTransport &owner, ScriptedResponse response, const CancellationToken &cancel)
            : owner_(owner), response_(std::move(response)), cancel_(cancel)
        {
            std::lock_guard<std::mutex> lock(owner_.mutex_);
            ++owner_.active_;
            owner_.peakActive_ = std::max(owner_.peakActive_, owner_.active_);
        }

        ~Stream() override
        {
            std::lock_guard<std::mutex> lock(owner_.mutex_);
            --owner_.active_;
        }

        long statusCode() const override { return response_.status; }
        std::optional<std::uint64_t> contentLength() const override { return response_.contentLength; }

        bool readChunk(std::string &buffer) override
        {
            if (response_.chunkDelay.count() > 0 && !cancel_.waitFor(response_.chunkDelay))
            {
                throw TransferError(ErrorKind::Cancelled, "cancelled");
            }

            if (offset_ >= response_.body.size())
            {
                if (response_.midStreamError)
                {
                    throw TransferError(*response_.midStreamError, "scripted connection reset");
                }
                buffer.clear();
                return false;
            }

            buffer = response_.body.substr(offset_, std::max<std::size_t>(1, response_.chunkSize));
            offset_ += buffer.size();
            return true;
        }

    private:
        FakeTransport &owner_;
        ScriptedResponse response_;
        const CancellationToken &cancel_;
        std::size_t offset_ = 0;
    };

    mutable std::mutex mutex_;
    std::map<std::string, std::deque<ScriptedResponse>> scripts_;
    std::map<std::string, int> opens_;
    int totalOpens_ = 0;
    int active_ = 0;
    int peakActive_ = 0;
};
