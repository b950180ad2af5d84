#pragma once

#include <string>
#include <vector>
#include <optional> // C++17 feature for optional values
#include <filesystem>
#include <cstddef>

/**
 * What the user sees on the console.
 * Independent of the diagnostics logger (spdlog), which has its own level.
 */
enum class LogLevel
{
    All,             // messages, progress, summary and errors
    ErrorsOnly,      // progress and errors, no informational messages
    ProgressBarOnly, // progress only; failures still listed at the end
    Silent           // no rendering at all; failures still listed at the end
};

/**
 * Optional text printed on lifecycle events.
 * "{}" inside a message is replaced with the URL or file path of the event.
 */
struct OutputMessages
{
    std::optional<std::string> onStart;
    std::optional<std::string> onFinish = std::string("Finish!");
    std::optional<std::string> onSuccess = std::string("\nAll files downloaded successfully!");
    std::optional<std::string> onErrors;
    std::optional<std::string> onRequest;
    std::optional<std::string> onResponse;
    std::optional<std::string> onFileExists = std::string("File exists: {}. See '--help' for solutions.");
    std::optional<std::string> onFileCreate;
    std::optional<std::string> onFileSizeKnown;
    std::optional<std::string> onStartDownload;
};

/**
 * Rendering settings. Opaque to the engine, consumed by ConsoleReporter only.
 *
 * Templates use fmt syntax with named fields. Every list may hold several
 * variants; each download picks one entry of each list at random, an empty
 * list falls back to the built-in default.
 */
struct ProgressBarConfig
{
    static constexpr const char *DEFAULT_PROGRESS_BAR_TEMPLATE =
        "{name} [{bar}] {percent:5.1f}% | {bytes} / {total} | {speed} | ETA: {eta}";
    static constexpr const char *DEFAULT_PROGRESS_BAR_CHARS = "=> ";
    static constexpr const char *DEFAULT_SPINNER_TEMPLATE = "{name} {spinner} {bytes} | {speed}";
    static constexpr const char *DEFAULT_SPINNER_CHARS = "⠁⠂⠄⡀⢀⠠⠐⠈";
    static constexpr const char *DEFAULT_REQUEST_SPINNER_TEMPLATE = "{name} {spinner} {message}";

    bool enable = true;
    std::size_t maxDisplayedFilename = 20;

    // Size known. Fields: name bar percent bytes total speed eta elapsed url
    std::vector<std::string> progressBarTemplates{DEFAULT_PROGRESS_BAR_TEMPLATE};

    // Three glyphs each: filled, head, empty (UTF-8 allowed)
    std::vector<std::string> progressBarChars{DEFAULT_PROGRESS_BAR_CHARS};

    // Size unknown. Fields: name spinner bytes speed elapsed url
    std::vector<std::string> spinnerTemplates{DEFAULT_SPINNER_TEMPLATE};
    std::vector<std::string> spinnerChars{DEFAULT_SPINNER_CHARS};

    // Request sent, no data yet. Fields: name spinner message url elapsed
    std::vector<std::string> requestSpinnerTemplates{DEFAULT_REQUEST_SPINNER_TEMPLATE};
    std::vector<std::string> requestSpinnerChars{DEFAULT_SPINNER_CHARS};
};

/**
 * Configuration for the download manager.
 * Populated by the CLI11 parser from command-line arguments and config files.
 */
struct DownloadConfig
{
    // Positional parameters
    std::string source;
    std::optional<std::string> target;

    // Newline-separated list of URLs to download in one batch
    std::optional<std::string> inputFile;

    // Download settings
    int timeoutSecs = DEFAULT_TIMEOUT_SECS;
    int connectTimeoutSecs = DEFAULT_CONNECT_TIMEOUT_SECS;
    int retries = DEFAULT_RETRIES;
    int parallelRequests = DEFAULT_PARALLEL_REQUESTS;
    std::optional<std::string> downloadDir;
    std::vector<std::string> headers; // passed through as-is, "Name: value"

    // Flags
    bool silent = false;
    bool resume = false; // reserved, not implemented
    bool force = false;
    bool showVersion = false;

    LogLevel logLevel = LogLevel::All;

    // Diagnostics (spdlog)
    std::string diagnosticsLevel = "warn";
    std::optional<std::string> logFile;

    OutputMessages messages;
    ProgressBarConfig progressBar;

    static constexpr int DEFAULT_TIMEOUT_SECS = 30;
    static constexpr int DEFAULT_CONNECT_TIMEOUT_SECS = 5;
    static constexpr int DEFAULT_RETRIES = 3;
    static constexpr int DEFAULT_PARALLEL_REQUESTS = 5;
};

/**
 * Locate a configuration file when none was given on the command line.
 *
 * Checked in order: $DW_CONFIG_PATH, ~/.config/dw.toml,
 * ~/.config/dw/config.toml, ~/.dw.toml, /etc/dw.toml.
 *
 * @return First existing path, or std::nullopt
 */
std::optional<std::filesystem::path> findConfigFile();
