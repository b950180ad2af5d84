#pragma once

#include <filesystem>
#include <optional>
#include <string>

/**
 * One resource to fetch and where to store it.
 * Immutable once created.
 */
class DownloadRequest
{
public:
    DownloadRequest(std::string source,
                    std::filesystem::path destination,
                    std::optional<std::string> displayName = std::nullopt);

    const std::string &source() const { return source_; }
    const std::filesystem::path &destination() const { return destination_; }

    /**
     * Name shown by renderers. Falls back to the destination's file name.
     */
    std::string displayName() const;

private:
    std::string source_;
    std::filesystem::path destination_;
    std::optional<std::string> displayName_;
};

/**
 * Check that a URL is something the transport can fetch:
 * an http:// or https:// scheme followed by a non-empty host.
 */
bool isValidUrl(const std::string &url);
