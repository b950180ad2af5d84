#include "config.hpp"

#include <cstdlib>
#include <system_error>

std::optional<std::filesystem::path> findConfigFile()
{
    std::vector<std::filesystem::path> candidates;

    // Override via environment variable
    if (const char *custom = std::getenv("DW_CONFIG_PATH"); custom && *custom)
    {
        candidates.emplace_back(custom);
    }

    // User configs
    if (const char *home = std::getenv("HOME"); home && *home)
    {
        std::filesystem::path homePath(home);
        candidates.push_back(homePath / ".config" / "dw.toml");
        candidates.push_back(homePath / ".config" / "dw" / "config.toml");
        candidates.push_back(homePath / ".dw.toml");
    }

    // Global config
    candidates.emplace_back("/etc/dw.toml");

    for (const auto &candidate : candidates)
    {
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec))
        {
            return candidate;
        }
    }
    return std::nullopt;
}
