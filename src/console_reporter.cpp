#include "console_reporter.hpp"

#include <algorithm>
#include <random>
#include <utility>
#include <unistd.h> // isatty

#include <fmt/core.h>
#include <fmt/format.h>

#include "batch_result.hpp"

namespace
{

constexpr int BAR_WIDTH = 30;

// Values a line template may refer to by name
struct LineFields
{
    std::string name;
    std::string url;
    std::string bar;
    double percent = 0.0;
    std::string bytes;
    std::string total;
    std::string speed;
    std::string eta;
    std::string elapsed;
    std::string spinner;
    std::string message;
};

std::string expandTemplate(const std::string &pattern, const LineFields &fields)
{
    return fmt::format(fmt::runtime(pattern),
                       fmt::arg("name", fields.name),
                       fmt::arg("url", fields.url),
                       fmt::arg("bar", fields.bar),
                       fmt::arg("percent", fields.percent),
                       fmt::arg("bytes", fields.bytes),
                       fmt::arg("total", fields.total),
                       fmt::arg("speed", fields.speed),
                       fmt::arg("eta", fields.eta),
                       fmt::arg("elapsed", fields.elapsed),
                       fmt::arg("spinner", fields.spinner),
                       fmt::arg("message", fields.message));
}

// A template fmt cannot expand is replaced by the built-in one
std::string expandOr(const std::string &pattern, const char *fallback, const LineFields &fields)
{
    try
    {
        return expandTemplate(pattern, fields);
    }
    catch (const fmt::format_error &)
    {
        return expandTemplate(fallback, fields);
    }
}

std::string chooseOr(const std::vector<std::string> &choices, const char *fallback, std::mt19937 &random)
{
    if (choices.empty())
    {
        return fallback;
    }
    std::uniform_int_distribution<std::size_t> pick(0, choices.size() - 1);
    return choices[pick(random)];
}

std::string joinGlyphs(const std::vector<std::string> &glyphs, std::size_t count)
{
    std::string out;
    for (std::size_t i = 0; i < count && i < glyphs.size(); ++i)
    {
        out += glyphs[i];
    }
    return out;
}

} // namespace

ConsoleReporter::ConsoleReporter(ProgressBarConfig progressConfig,
                                 OutputMessages messages,
                                 LogLevel level,
                                 std::FILE *out)
    : config_(std::move(progressConfig)),
      messages_(std::move(messages)),
      level_(level),
      out_(out)
{
    // Detect if output is a terminal to decide how we render the progress bar
    isTerminalOutput_ = isatty(fileno(out_)) != 0;
}

void ConsoleReporter::onBatchStart(std::size_t totalTasks)
{
    lines_.clear();
    previousLines_ = 0;
    if (showMessages())
    {
        printMessage(messages_.onStart, std::to_string(totalTasks));
    }
}

ConsoleReporter::TaskLine &ConsoleReporter::lineFor(const ProgressEvent &event)
{
    auto it = lines_.find(event.taskId);
    if (it == lines_.end())
    {
        TaskLine line;
        line.style = chooseStyle();
        line.name = shortenFilename(event.displayName, config_.maxDisplayedFilename);
        line.url = event.url;
        line.startedAt = std::chrono::steady_clock::now();
        it = lines_.emplace(event.taskId, std::move(line)).first;
    }
    return it->second;
}

ConsoleReporter::LineStyle ConsoleReporter::chooseStyle()
{
    LineStyle style;
    style.barTemplate =
        chooseOr(config_.progressBarTemplates, ProgressBarConfig::DEFAULT_PROGRESS_BAR_TEMPLATE, random_);
    style.barGlyphs =
        splitGlyphs(chooseOr(config_.progressBarChars, ProgressBarConfig::DEFAULT_PROGRESS_BAR_CHARS, random_));
    if (style.barGlyphs.size() < 3)
    {
        style.barGlyphs = splitGlyphs(ProgressBarConfig::DEFAULT_PROGRESS_BAR_CHARS);
    }

    style.spinnerTemplate = chooseOr(config_.spinnerTemplates, ProgressBarConfig::DEFAULT_SPINNER_TEMPLATE, random_);
    style.spinnerGlyphs =
        splitGlyphs(chooseOr(config_.spinnerChars, ProgressBarConfig::DEFAULT_SPINNER_CHARS, random_));
    if (style.spinnerGlyphs.empty())
    {
        style.spinnerGlyphs = splitGlyphs(ProgressBarConfig::DEFAULT_SPINNER_CHARS);
    }

    style.requestTemplate =
        chooseOr(config_.requestSpinnerTemplates, ProgressBarConfig::DEFAULT_REQUEST_SPINNER_TEMPLATE, random_);
    style.requestGlyphs =
        splitGlyphs(chooseOr(config_.requestSpinnerChars, ProgressBarConfig::DEFAULT_SPINNER_CHARS, random_));
    if (style.requestGlyphs.empty())
    {
        style.requestGlyphs = splitGlyphs(ProgressBarConfig::DEFAULT_SPINNER_CHARS);
    }
    return style;
}

std::string ConsoleReporter::currentLine(std::size_t taskId) const
{
    auto it = lines_.find(taskId);
    return it == lines_.end() ? std::string() : renderLine(it->second);
}

void ConsoleReporter::onEvent(const ProgressEvent &event)
{
    switch (event.name)
    {
    case EventName::RequestSent:
    {
        TaskLine &line = lineFor(event);
        line.status.clear();
        line.request = fmt::format("Requesting information about {}", event.url);
        if (event.attempt > 1)
        {
            line.request += fmt::format(" (attempt {})", event.attempt);
        }
        ++line.frame;
        if (showMessages())
        {
            printMessage(messages_.onRequest, event.url);
        }
        redraw(true);
        break;
    }
    case EventName::ResponseReceived:
        if (showMessages())
        {
            printMessage(messages_.onResponse, event.url);
        }
        break;
    case EventName::FileSizeKnown:
        lineFor(event).total = event.totalBytes;
        if (showMessages())
        {
            printMessage(messages_.onFileSizeKnown, event.totalBytes ? formatBytes(*event.totalBytes) : event.url);
        }
        break;
    case EventName::FileSizeUnknown:
        lineFor(event).total.reset();
        break;
    case EventName::FileExistsSkip:
        if (showErrors())
        {
            printMessage(messages_.onFileExists, event.destination);
        }
        break;
    case EventName::FileCreate:
        if (showMessages())
        {
            printMessage(messages_.onFileCreate, event.destination);
        }
        break;
    case EventName::DownloadStart:
    {
        TaskLine &line = lineFor(event);
        line.bytes = 0;
        line.status.clear();
        line.request.clear();
        line.startedAt = std::chrono::steady_clock::now();
        if (showMessages())
        {
            printMessage(messages_.onStartDownload, event.url);
        }
        redraw(true);
        break;
    }
    case EventName::DownloadProgress:
    {
        TaskLine &line = lineFor(event);
        line.bytes = event.bytes;
        ++line.frame;
        redraw(false);
        break;
    }
    case EventName::DownloadRetry:
    {
        TaskLine &line = lineFor(event);
        line.bytes = 0;
        line.request.clear();
        line.status = fmt::format("attempt {} in {:.1f}s", event.attempt,
                                  static_cast<double>(event.backoff.count()) / 1000.0);
        if (!isTerminalOutput_ && showErrors())
        {
            printLine(fmt::format("Retrying {} ({}): {}", event.url, line.status, event.message));
        }
        redraw(true);
        break;
    }
    case EventName::DownloadSuccess:
    {
        TaskLine &line = lineFor(event);
        line.bytes = event.bytes;
        line.done = true;
        line.status = "done";
        if (!isTerminalOutput_ && showMessages())
        {
            printLine(fmt::format("Downloaded {} -> {} ({})", event.url, event.destination, formatBytes(event.bytes)));
        }
        redraw(true);
        break;
    }
    case EventName::DownloadError:
    {
        TaskLine &line = lineFor(event);
        line.done = true;
        line.status = fmt::format("failed: {}", event.error ? toString(*event.error) : "error");
        if (!isTerminalOutput_ && showErrors())
        {
            printLine(fmt::format("Error: {}: {}", event.url, event.message));
        }
        redraw(true);
        break;
    }
    case EventName::DownloadCancelled:
    {
        TaskLine &line = lineFor(event);
        line.done = true;
        line.status = "cancelled";
        redraw(true);
        break;
    }
    case EventName::BatchStart:
    case EventName::BatchFinish:
        break;
    }
}

void ConsoleReporter::onBatchFinish(const BatchResult &result)
{
    redraw(true);
    if (!showMessages())
    {
        return;
    }

    if (result.allSucceeded())
    {
        printMessage(messages_.onSuccess, std::to_string(result.succeeded));
    }
    else
    {
        printMessage(messages_.onErrors, std::to_string(result.failed));
    }
    printMessage(messages_.onFinish, std::to_string(result.total()));
}

std::string ConsoleReporter::renderLine(const TaskLine &line) const
{
    const LineStyle &style = line.style;
    auto now = std::chrono::steady_clock::now();
    auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(now - line.startedAt).count();

    // Calculate download speed (bytes per second)
    double speed = elapsedMs > 0 ? static_cast<double>(line.bytes) * 1000.0 / static_cast<double>(elapsedMs) : 0.0;

    LineFields fields;
    fields.name = fmt::format("{:<{}}", line.name, config_.maxDisplayedFilename);
    fields.url = line.url;
    fields.bytes = formatBytes(line.bytes);
    fields.speed = formatBytes(static_cast<std::uint64_t>(speed)) + "/s";
    fields.elapsed = formatDuration(static_cast<long>(elapsedMs / 1000));

    std::string text;
    if (!line.request.empty() && !line.done)
    {
        fields.spinner = style.requestGlyphs[line.frame % style.requestGlyphs.size()];
        fields.message = line.request;
        text = expandOr(style.requestTemplate, ProgressBarConfig::DEFAULT_REQUEST_SPINNER_TEMPLATE, fields);
    }
    else if (line.total)
    {
        std::uint64_t total = *line.total;

        // ETA from remaining bytes
        long eta = (speed > 0 && total > line.bytes) ? static_cast<long>((total - line.bytes) / speed) : 0;

        fields.bar = renderBar(style.barGlyphs, line.bytes, total);
        fields.percent = total > 0 ? (static_cast<double>(line.bytes) / static_cast<double>(total)) * 100.0 : 100.0;
        fields.total = formatBytes(total);
        fields.eta = formatDuration(eta);
        text = expandOr(style.barTemplate, ProgressBarConfig::DEFAULT_PROGRESS_BAR_TEMPLATE, fields);
    }
    else
    {
        fields.spinner = line.done ? style.barGlyphs[0] : style.spinnerGlyphs[line.frame % style.spinnerGlyphs.size()];
        fields.total = "unknown";
        text = expandOr(style.spinnerTemplate, ProgressBarConfig::DEFAULT_SPINNER_TEMPLATE, fields);
    }

    if (!line.status.empty())
    {
        text += " | " + line.status;
    }
    return text;
}

std::string ConsoleReporter::renderBar(const std::vector<std::string> &glyphs,
                                       std::uint64_t done, std::uint64_t total) const
{
    int filled = total > 0 ? static_cast<int>((static_cast<double>(done) / static_cast<double>(total)) * BAR_WIDTH)
                           : BAR_WIDTH;
    std::string bar;
    for (int i = 0; i < BAR_WIDTH; ++i)
    {
        if (i < filled)
        {
            bar += glyphs[0];
        }
        else if (i == filled)
        {
            bar += glyphs[1];
        }
        else
        {
            bar += glyphs[2];
        }
    }
    return bar;
}

void ConsoleReporter::redraw(bool force)
{
    if (!showProgress() || !isTerminalOutput_)
    {
        return;
    }

    auto now = std::chrono::steady_clock::now();
    if (!force && now - lastDraw_ < REDRAW_INTERVAL)
    {
        return;
    }
    lastDraw_ = now;

    // Move the cursor back over the previous panel and repaint it
    clearPanel();
    for (const auto &entry : lines_)
    {
        fmt::print(out_, "{}\n", renderLine(entry.second));
    }
    previousLines_ = lines_.size();
    std::fflush(out_);
}

void ConsoleReporter::clearPanel()
{
    if (previousLines_ > 0)
    {
        fmt::print(out_, "\033[{}F\033[J", previousLines_);
        previousLines_ = 0;
    }
}

void ConsoleReporter::printMessage(const std::optional<std::string> &message, const std::string &argument)
{
    if (!message || message->empty())
    {
        return;
    }

    std::string text;
    try
    {
        text = fmt::format(fmt::runtime(*message), argument);
    }
    catch (const fmt::format_error &)
    {
        // Not a usable template: print it verbatim
        text = *message;
    }
    printLine(text);
}

void ConsoleReporter::printLine(const std::string &text)
{
    bool panelShown = previousLines_ > 0;
    clearPanel();
    fmt::print(out_, "{}\n", text);
    if (panelShown)
    {
        redraw(true);
    }
    std::fflush(out_);
}

// Format bytes into human-readable string
std::string ConsoleReporter::formatBytes(std::uint64_t bytes)
{
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    double value = static_cast<double>(bytes);
    if (value >= GB)
    {
        return fmt::format("{:.2f} GB", value / GB);
    }
    else if (value >= MB)
    {
        return fmt::format("{:.2f} MB", value / MB);
    }
    else if (value >= KB)
    {
        return fmt::format("{:.2f} KB", value / KB);
    }
    else
    {
        return fmt::format("{} B", bytes);
    }
}

// Format duration into human-readable string
std::string ConsoleReporter::formatDuration(long seconds)
{
    if (seconds < 0)
    {
        return "unknown";
    }
    else if (seconds < 60)
    {
        return fmt::format("{}s", seconds);
    }
    else if (seconds < 3600)
    {
        long minutes = seconds / 60;
        long secs = seconds % 60;
        return fmt::format("{}m {}s", minutes, secs);
    }
    else
    {
        long hours = seconds / 3600;
        long minutes = (seconds % 3600) / 60;
        return fmt::format("{}h {}m", hours, minutes);
    }
}

std::string ConsoleReporter::shortenFilename(const std::string &name, std::size_t maxLength)
{
    std::vector<std::string> glyphs = splitGlyphs(name);
    if (glyphs.size() <= maxLength || maxLength == 0)
    {
        return name;
    }

    // Keep the last extension: base + "…" + ext fits exactly maxLength glyphs
    auto dot = name.rfind('.');
    if (dot != std::string::npos && dot > 0)
    {
        std::vector<std::string> extension = splitGlyphs(name.substr(dot + 1));
        if (!extension.empty() && extension.size() + 1 < maxLength)
        {
            std::size_t baseLength = maxLength - extension.size() - 1;
            return joinGlyphs(glyphs, baseLength) + "…" + joinGlyphs(extension, extension.size());
        }
    }

    return joinGlyphs(glyphs, maxLength - 1) + "…";
}

std::vector<std::string> ConsoleReporter::splitGlyphs(const std::string &text)
{
    std::vector<std::string> glyphs;
    std::size_t i = 0;
    while (i < text.size())
    {
        auto lead = static_cast<unsigned char>(text[i]);
        std::size_t length = 1;
        if ((lead & 0xE0) == 0xC0)
        {
            length = 2;
        }
        else if ((lead & 0xF0) == 0xE0)
        {
            length = 3;
        }
        else if ((lead & 0xF8) == 0xF0)
        {
            length = 4;
        }

        // Truncated sequence at the end: keep the remaining bytes as one glyph
        length = std::min(length, text.size() - i);
        glyphs.push_back(text.substr(i, length));
        i += length;
    }
    return glyphs;
}
