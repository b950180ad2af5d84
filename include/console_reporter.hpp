#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "config.hpp"
#include "progress_reporter.hpp"

/**
 * Terminal renderer: one line per transfer, redrawn in place.
 *
 * Transfers with a known size get a determinate bar, the others a spinner
 * for their whole lifetime; until data flows a request spinner is shown.
 * Each transfer picks its templates and glyphs once from the configured
 * lists. When the output is not a terminal, only lifecycle lines are
 * printed (no redraws).
 *
 * Not thread-safe: feed it through a ReporterChannel.
 */
class ConsoleReporter final : public ProgressReporter
{
public:
    ConsoleReporter(ProgressBarConfig progressConfig,
                    OutputMessages messages,
                    LogLevel level,
                    std::FILE *out = stdout);

    void onBatchStart(std::size_t totalTasks) override;
    void onEvent(const ProgressEvent &event) override;
    void onBatchFinish(const BatchResult &result) override;

    /**
     * Panel line of a transfer as it would be drawn on a terminal.
     * Empty if no event of that task was seen in the current batch.
     */
    std::string currentLine(std::size_t taskId) const;

    /**
     * Format bytes into human-readable string (e.g., "52.30 MB")
     */
    static std::string formatBytes(std::uint64_t bytes);

    /**
     * Format duration into human-readable string (e.g., "2m 30s")
     */
    static std::string formatDuration(long seconds);

    /**
     * Shorten a file name to maxLength characters, keeping the extension:
     * "averyveryverylongname.tar.gz" (20) -> "averyveryverylong…gz"
     */
    static std::string shortenFilename(const std::string &name, std::size_t maxLength);

    /**
     * Split a UTF-8 string into its code points (glyphs of bars and spinners).
     */
    static std::vector<std::string> splitGlyphs(const std::string &text);

private:
    // Templates and glyphs chosen for one transfer
    struct LineStyle
    {
        std::string barTemplate;
        std::vector<std::string> barGlyphs; // filled, head, empty
        std::string spinnerTemplate;
        std::vector<std::string> spinnerGlyphs;
        std::string requestTemplate;
        std::vector<std::string> requestGlyphs;
    };

    struct TaskLine
    {
        LineStyle style;
        std::string name;
        std::string url;
        std::optional<std::uint64_t> total; // set: bar, unset: spinner
        std::uint64_t bytes = 0;
        std::chrono::steady_clock::time_point startedAt;
        std::size_t frame = 0;
        std::string status; // final or transient status text
        std::string request; // request spinner text, empty once data flows
        bool done = false;
    };

    std::string renderLine(const TaskLine &line) const;
    std::string renderBar(const std::vector<std::string> &glyphs, std::uint64_t done, std::uint64_t total) const;
    LineStyle chooseStyle();
    void redraw(bool force);
    void clearPanel();
    void printMessage(const std::optional<std::string> &message, const std::string &argument);
    void printLine(const std::string &text);
    TaskLine &lineFor(const ProgressEvent &event);

    bool showMessages() const { return level_ == LogLevel::All; }
    bool showErrors() const { return level_ == LogLevel::All || level_ == LogLevel::ErrorsOnly; }
    bool showProgress() const { return config_.enable && level_ != LogLevel::Silent; }

    ProgressBarConfig config_;
    OutputMessages messages_;
    LogLevel level_;
    std::FILE *out_;
    bool isTerminalOutput_ = true;

    std::mt19937 random_{std::random_device{}()};

    std::map<std::size_t, TaskLine> lines_;
    std::size_t previousLines_ = 0;
    std::chrono::steady_clock::time_point lastDraw_;

    // Redraw at most 10 times per second
    static constexpr std::chrono::milliseconds REDRAW_INTERVAL{100};
};
