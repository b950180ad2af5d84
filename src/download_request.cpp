#include "download_request.hpp"

#include <utility>

DownloadRequest::DownloadRequest(std::string source,
                                 std::filesystem::path destination,
                                 std::optional<std::string> displayName)
    : source_(std::move(source)),
      destination_(std::move(destination)),
      displayName_(std::move(displayName))
{
}

std::string DownloadRequest::displayName() const
{
    if (displayName_ && !displayName_->empty())
    {
        return *displayName_;
    }

    std::string name = destination_.filename().string();
    return name.empty() ? destination_.string() : name;
}

bool isValidUrl(const std::string &url)
{
    std::size_t hostStart = 0;
    if (url.rfind("http://", 0) == 0)
    {
        hostStart = 7;
    }
    else if (url.rfind("https://", 0) == 0)
    {
        hostStart = 8;
    }
    else
    {
        return false;
    }

    // Host ends at the first '/', '?' or '#'
    std::size_t hostEnd = url.find_first_of("/?#", hostStart);
    std::string host = url.substr(hostStart, hostEnd == std::string::npos ? std::string::npos : hostEnd - hostStart);

    return !host.empty() && host.find_first_of(" \t\r\n") == std::string::npos;
}
