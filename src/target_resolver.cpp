#include "target_resolver.hpp"

#include <fstream>
#include <regex>
#include <stdexcept>
#include <system_error>

#include <fmt/core.h>

namespace
{

constexpr std::size_t MAX_FILENAME_LENGTH = 100;
constexpr const char *FALLBACK_FILENAME = "download";

std::string trim(const std::string &text, const char *characters)
{
    auto first = text.find_first_not_of(characters);
    if (first == std::string::npos)
    {
        return {};
    }
    auto last = text.find_last_not_of(characters);
    return text.substr(first, last - first + 1);
}

} // namespace

std::string filenameFromUrl(const std::string &url)
{
    // Remove query and anchor parameters
    static const std::regex paramsPattern(R"([?#].*$)");
    std::string cleanUrl = std::regex_replace(url, paramsPattern, "");

    // Extract the last component of the path
    auto slash = cleanUrl.rfind('/');
    std::string base = (slash == std::string::npos) ? cleanUrl : cleanUrl.substr(slash + 1);

    std::string name;
    if (base.empty())
    {
        // URL ends in '/': name it after everything past the scheme, query included
        static const std::regex specialPattern(R"([^a-zA-Z0-9_]+)");
        auto scheme = url.find("://");
        std::string rest = (scheme == std::string::npos) ? std::string() : url.substr(scheme + 3);
        name = std::regex_replace(rest, specialPattern, "_");
    }
    else
    {
        static const std::regex specialPattern(R"([^a-zA-Z0-9_.]+)");
        name = std::regex_replace(base, specialPattern, "_");
    }

    name = trim(name, "_");
    if (name.size() > MAX_FILENAME_LENGTH)
    {
        name.resize(MAX_FILENAME_LENGTH);
    }

    // "." and ".." would resolve to directories
    if (name.empty() || name == "." || name == "..")
    {
        return FALLBACK_FILENAME;
    }
    return name;
}

std::filesystem::path resolveTarget(const std::string &url,
                                    const std::optional<std::string> &target,
                                    const std::filesystem::path &downloadDir)
{
    if (!target || target->empty())
    {
        return downloadDir / filenameFromUrl(url);
    }

    std::filesystem::path targetPath(*target);

    // Existing directories are treated as the target location
    std::error_code ec;
    if (std::filesystem::is_directory(targetPath, ec))
    {
        return targetPath / filenameFromUrl(url);
    }
    return targetPath;
}

std::vector<std::string> readUrlList(const std::filesystem::path &path)
{
    std::ifstream in(path);
    if (!in)
    {
        throw std::runtime_error(fmt::format("Cannot open URL list: {}", path.string()));
    }

    std::vector<std::string> urls;
    std::string line;
    while (std::getline(in, line))
    {
        std::string url = trim(line, " \t\r\n");
        if (url.empty() || url.front() == '#')
        {
            continue;
        }
        urls.push_back(std::move(url));
    }

    if (in.bad())
    {
        throw std::runtime_error(fmt::format("Failed to read URL list: {}", path.string()));
    }
    return urls;
}
