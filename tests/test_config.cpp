#include <cstdlib>
#include <stdexcept>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "config.hpp"
#include "logging.hpp"
#include "test_support.hpp"

int main()
{
    try
    {
        // Test 1: Defaults
        DownloadConfig config;
        check(config.timeoutSecs == 30 && config.connectTimeoutSecs == 5, "Default timeouts");
        check(config.retries == 3 && config.parallelRequests == 5, "Default retries and parallelism");
        check(config.logLevel == LogLevel::All && !config.force, "Default console level and flags");
        check(config.progressBar.maxDisplayedFilename == 20, "Default displayed file name length");
        check(config.progressBar.progressBarTemplates.size() == 1 && config.progressBar.spinnerTemplates.size() == 1
                  && config.progressBar.requestSpinnerTemplates.size() == 1,
              "Default template lists hold one entry each");
        check(config.progressBar.progressBarChars.front() == ProgressBarConfig::DEFAULT_PROGRESS_BAR_CHARS,
              "Default bar glyphs");
        check(config.messages.onFinish == std::string("Finish!"), "Default finish message");

        // Test 2: Config lookup honours DW_CONFIG_PATH
        TempDir dir;
        writeFile(dir / "custom.toml", "retries = 5\n");
        setenv("DW_CONFIG_PATH", (dir / "custom.toml").c_str(), 1);
        auto found = findConfigFile();
        check(found && *found == dir / "custom.toml", "DW_CONFIG_PATH takes precedence");

        // Test 3: Missing override falls through to the home directory
        setenv("DW_CONFIG_PATH", (dir / "missing.toml").c_str(), 1);
        setenv("HOME", dir.path().c_str(), 1);
        std::filesystem::create_directories(dir / ".config");
        writeFile(dir / ".config" / "dw.toml", "parallel_requests = 2\n");
        found = findConfigFile();
        check(found && *found == dir / ".config" / "dw.toml", "User config found under ~/.config");

        // Test 4: Diagnostics logger
        bool badLevelRejected = false;
        try
        {
            initLogging("loud", std::nullopt);
        }
        catch (const std::invalid_argument &)
        {
            badLevelRejected = true;
        }
        check(badLevelRejected, "Unknown log level rejected");

        auto logFile = dir / "dw.log";
        initLogging("info", logFile.string());
        spdlog::info("diagnostics check");
        spdlog::debug("below threshold");
        spdlog::default_logger()->flush();
        std::string logged = readFile(logFile);
        check(logged.find("diagnostics check") != std::string::npos, "Log file receives messages");
        check(logged.find("below threshold") == std::string::npos, "Log level filters messages");
        spdlog::drop_all();

        return finish();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "❌ Error: {}\n", e.what());
        return 1;
    }
}
