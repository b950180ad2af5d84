#include <atomic>
#include <csignal>
#include <filesystem>
#include <map>
#include <memory>
#include <fmt/core.h>
#include <CLI/CLI.hpp> // CLI11 main header
#include <spdlog/spdlog.h>
#include "config.hpp"
#include "console_reporter.hpp"
#include "curl_transport.hpp"
#include "download_coordinator.hpp"
#include "logging.hpp"
#include "reporter_channel.hpp"
#include "target_resolver.hpp"

namespace
{

constexpr const char *VERSION = "1.0.0";

constexpr int EXIT_INTERRUPTED = 130;

// Set while a batch is running; the SIGINT handler only touches these
std::atomic<CancellationToken *> g_cancelToken{nullptr};
volatile std::sig_atomic_t g_interrupted = 0;

static_assert(std::atomic<CancellationToken *>::is_always_lock_free,
              "the interrupt handler must read the token without locking");

extern "C" void handleInterrupt(int)
{
    g_interrupted = 1;
    if (CancellationToken *token = g_cancelToken.load())
    {
        token->cancel();
    }
}

/**
 * Routes SIGINT/SIGTERM to a batch's cancellation token for the guard's
 * lifetime, including when the batch ends with an exception.
 */
class InterruptGuard
{
public:
    explicit InterruptGuard(CancellationToken &token)
    {
        g_cancelToken.store(&token);
        std::signal(SIGINT, handleInterrupt);
        std::signal(SIGTERM, handleInterrupt);
    }

    ~InterruptGuard()
    {
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
        g_cancelToken.store(nullptr);
    }

    InterruptGuard(const InterruptGuard &) = delete;
    InterruptGuard &operator=(const InterruptGuard &) = delete;
};

std::vector<DownloadRequest> buildRequests(const DownloadConfig &config)
{
    std::filesystem::path downloadDir = config.downloadDir
                                            ? std::filesystem::path(*config.downloadDir)
                                            : std::filesystem::current_path();

    std::vector<DownloadRequest> requests;
    if (!config.source.empty())
    {
        requests.emplace_back(config.source, resolveTarget(config.source, config.target, downloadDir));
    }
    if (config.inputFile)
    {
        for (const auto &url : readUrlList(*config.inputFile))
        {
            requests.emplace_back(url, resolveTarget(url, std::nullopt, downloadDir));
        }
    }
    return requests;
}

} // namespace

int main(int argc, char *argv[])
{
    // Quick check for --version flag before full parsing
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--version" || arg == "-V") {
            fmt::print("dw {}\n", VERSION);
            fmt::print("Built with:\n");
            fmt::print("  - libcurl {}: HTTP/HTTPS support\n", curl_version_info(CURLVERSION_NOW)->version);
            fmt::print("  - CLI11: Command-line parsing and config files\n");
            fmt::print("  - fmt: Modern string formatting\n");
            fmt::print("  - spdlog: Diagnostics logging\n");
            return 0;
        }
    }

    // Create CLI11 app
    CLI::App app{fmt::format("dw v{} - concurrent file downloader", VERSION)};

    // Configuration struct to be populated
    DownloadConfig config;

    // ====================================================================
    // DEFINE ARGUMENTS
    // ====================================================================

    // Positional arguments; the URL may instead come from --input-file
    app.add_option("source", config.source, "HTTP/HTTPS URL to download");
    app.add_option("target", config.target,
                   "File path or existing directory to save to (default: name derived from the URL)");

    // Config file, looked up in the usual places when not given
    auto defaultConfig = findConfigFile();
    app.set_config("--config", defaultConfig ? defaultConfig->string() : std::string(),
                   "Read options from a TOML/INI file (also $DW_CONFIG_PATH)");

    app.add_option("-i,--input_file,--input-file", config.inputFile,
                   "File with one URL per line ('#' starts a comment)")
        ->check(CLI::ExistingFile);

    // Flags
    app.add_flag("-s,--silent", config.silent, "Do not render progress; failures are still reported");
    app.add_flag("-r,--resume", config.resume, "Resume partial downloads (not implemented)");
    app.add_flag("-f,--force", config.force, "Overwrite existing files");

    // Download settings
    app.add_option("-t,--timeout_secs,--timeout", config.timeoutSecs,
                   "Overall timeout per attempt in seconds, also the stall timeout")
        ->check(CLI::PositiveNumber) // Built-in validator: must be positive
        ->capture_default_str();

    app.add_option("--connect_timeout_secs", config.connectTimeoutSecs,
                   "Connection timeout in seconds")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();

    app.add_option("--retries", config.retries,
                   "Total attempts for transient errors")
        ->check(CLI::Range(1, 100))
        ->capture_default_str();

    app.add_option("-p,--parallel_requests", config.parallelRequests,
                   "Maximum number of simultaneous downloads")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();

    app.add_option("-d,--download_dir", config.downloadDir,
                   "Directory for downloads without an explicit target (default: current directory)");

    app.add_option("-H,--header", config.headers,
                   "Extra request header 'Name: value' (repeatable)")
        ->allow_extra_args(false);

    // Console output
    const std::map<std::string, LogLevel> logLevels{
        {"All", LogLevel::All},
        {"ErrorsOnly", LogLevel::ErrorsOnly},
        {"ProgressBarOnly", LogLevel::ProgressBarOnly},
        {"Silent", LogLevel::Silent},
    };
    app.add_option("--log_level", config.logLevel, "Console output: All, ErrorsOnly, ProgressBarOnly, Silent")
        ->transform(CLI::CheckedTransformer(logLevels, CLI::ignore_case));

    // Diagnostics (spdlog)
    app.add_option("--log-level", config.diagnosticsLevel,
                   "Diagnostics level: trace, debug, info, warn, error, off")
        ->capture_default_str();
    app.add_option("--log-file", config.logFile, "Write diagnostics to this file instead of stderr");

    // Optional flag: --version (for help display only, actual handling is done above)
    app.add_flag("-V,--version", config.showVersion, "Display version information");

    // Message hooks; "{}" is replaced with the URL or path
    auto *messages = app.add_option_group("Messages", "Text printed on download events");
    messages->add_option("--message_on_start", config.messages.onStart, "Printed before the batch starts");
    messages->add_option("--message_on_finish", config.messages.onFinish, "Printed after the batch");
    messages->add_option("--message_on_success", config.messages.onSuccess, "Printed when every download succeeded");
    messages->add_option("--message_on_errors", config.messages.onErrors, "Printed when some download failed");
    messages->add_option("--message_on_request", config.messages.onRequest, "Printed for each request sent");
    messages->add_option("--message_on_response", config.messages.onResponse, "Printed for each response");
    messages->add_option("--message_on_file_exists", config.messages.onFileExists,
                         "Printed when a destination already exists");
    messages->add_option("--message_on_file_create", config.messages.onFileCreate,
                         "Printed when a destination file is created");
    messages->add_option("--message_on_file_size_known", config.messages.onFileSizeKnown,
                         "Printed when the download size is known");
    messages->add_option("--message_on_start_download", config.messages.onStartDownload,
                         "Printed when data starts flowing");

    // Progress display
    auto *progress = app.add_option_group("Progress bar", "Progress display settings");
    progress->add_option("--progress_bar", config.progressBar.enable, "Show progress bars (true/false)")
        ->capture_default_str();
    progress->add_option("--max_displayed_filename", config.progressBar.maxDisplayedFilename,
                         "Longest file name shown next to a bar")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();

    // List options: repeat the flag (or use a config array) to give variants,
    // one of which is picked at random for each download
    progress->add_option("--progress_bar_templates", config.progressBar.progressBarTemplates,
                         "Bar line templates; fields {name} {bar} {percent} {bytes} {total} {speed} {eta} {elapsed}")
        ->allow_extra_args(false);
    progress->add_option("--progress_bar_chars", config.progressBar.progressBarChars,
                         "Bar glyph sets, three glyphs each: filled, head, empty")
        ->allow_extra_args(false);
    progress->add_option("--spinner_templates", config.progressBar.spinnerTemplates,
                         "Spinner line templates for unknown sizes; fields {name} {spinner} {bytes} {speed} {elapsed}")
        ->allow_extra_args(false);
    progress->add_option("--spinner_chars", config.progressBar.spinnerChars,
                         "Spinner frame sets for downloads of unknown size")
        ->allow_extra_args(false);
    progress->add_option("--request_spinner_templates", config.progressBar.requestSpinnerTemplates,
                         "Line templates while waiting for a response; fields {name} {spinner} {message} {url}")
        ->allow_extra_args(false);
    progress->add_option("--request_spinner_chars", config.progressBar.requestSpinnerChars,
                         "Spinner frame sets while waiting for a response")
        ->allow_extra_args(false);

    // ====================================================================
    // PARSE ARGUMENTS
    // ====================================================================

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e)
    {
        // CLI11 prints help or the usage error; any error is exit status 1
        return app.exit(e) == 0 ? 0 : 1;
    }

    try
    {
        initLogging(config.diagnosticsLevel, config.logFile);
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "✗ Cannot set up logging: {}\n", e.what());
        return 1;
    }

    if (config.silent)
    {
        config.logLevel = LogLevel::Silent;
    }
    if (config.resume)
    {
        fmt::print(stderr, "Warning: --resume is not implemented yet; files are downloaded from the start.\n");
    }

    // ====================================================================
    // PERFORM DOWNLOADS
    // ====================================================================

    try
    {
        std::vector<DownloadRequest> requests = buildRequests(config);
        if (requests.empty())
        {
            fmt::print(stderr, "✗ Nothing to download: give a URL or --input-file\n{}", app.help());
            return 1;
        }

        TransferOptions options;
        options.transport.connectTimeout = std::chrono::seconds(config.connectTimeoutSecs);
        options.transport.timeout = std::chrono::seconds(config.timeoutSecs);
        options.transport.headers = config.headers;
        options.transport.userAgent = fmt::format("dw/{}", VERSION);
        options.retries = config.retries;
        options.force = config.force;

        // Pick the renderer; the console one runs on its own thread behind a channel
        std::unique_ptr<ConsoleReporter> console;
        std::unique_ptr<ReporterChannel> channel;
        SilentReporter silent;
        ProgressReporter *reporter = &silent;
        if (config.logLevel != LogLevel::Silent)
        {
            console = std::make_unique<ConsoleReporter>(config.progressBar, config.messages, config.logLevel);
            channel = std::make_unique<ReporterChannel>(*console);
            reporter = channel.get();
        }

        // Create transport (RAII ensures libcurl is initialized once)
        auto transport = std::make_shared<CurlTransport>();
        DownloadCoordinator coordinator(transport, *reporter, options);

        BatchResult result;
        {
            InterruptGuard interrupts(coordinator.cancellationToken());
            result = coordinator.run(requests, static_cast<std::size_t>(config.parallelRequests));
        }

        if (channel)
        {
            channel->flush();
            if (channel->droppedEvents() > 0)
            {
                spdlog::debug("{} progress updates skipped by the renderer", channel->droppedEvents());
            }
        }

        // ================================================================
        // SUMMARY
        // ================================================================

        if (config.logLevel != LogLevel::Silent)
        {
            fmt::print("\n{} succeeded, {} failed", result.succeeded, result.failed);
            if (result.cancelled > 0)
            {
                fmt::print(", {} cancelled", result.cancelled);
            }
            fmt::print("\n");
        }

        // Failures are always reported, even in silent mode
        for (const auto &failure : result.failures)
        {
            fmt::print(stderr, "✗ {} -> {}: {}\n",
                       failure.request.source(),
                       failure.request.destination().string(),
                       failure.message);
        }

        if (g_interrupted || result.cancelled > 0)
        {
            return EXIT_INTERRUPTED;
        }
        return result.failed > 0 ? 1 : 0;
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "✗ Fatal error: {}\n", e.what());
        return 1;
    }
}
