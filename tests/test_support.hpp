#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <random>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>
#include <fmt/core.h>
#include "batch_result.hpp"
#include "progress_event.hpp"
#include "progress_reporter.hpp"

// Number of failed checks in this test executable
inline int &failedChecks()
{
    static int count = 0;
    return count;
}

inline void check(bool condition, const std::string &description)
{
    fmt::print("{}: {}\n", description, condition ? "PASS" : "FAIL");
    if (!condition)
    {
        ++failedChecks();
    }
}

inline int finish()
{
    if (failedChecks() == 0)
    {
        fmt::print("\n✅ All tests passed!\n");
        return 0;
    }
    fmt::print(stderr, "\n❌ {} check(s) failed\n", failedChecks());
    return 1;
}

/**
 * Fresh directory under the system temp dir, removed with its contents.
 */
class TempDir
{
public:
    TempDir()
    {
        std::random_device rd;
        auto base = std::filesystem::temp_directory_path();
        do
        {
            path_ = base / fmt::format("dw-test-{:08x}", rd());
        } while (std::filesystem::exists(path_));
        std::filesystem::create_directories(path_);
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const std::filesystem::path &path() const { return path_; }
    std::filesystem::path operator/(const std::string &name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

inline std::string readFile(const std::filesystem::path &path)
{
    std::ifstream in(path, std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

inline void writeFile(const std::filesystem::path &path, const std::string &content)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

/**
 * Keeps every event it receives. Thread-safe.
 */
class RecordingReporter : public ProgressReporter
{
public:
    void onBatchStart(std::size_t totalTasks) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++batchStarts_;
        announcedTasks_ = totalTasks;
    }

    void onEvent(const ProgressEvent &event) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    void onBatchFinish(const BatchResult &result) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++batchFinishes_;
        finishedTotal_ = result.total();
    }

    std::vector<ProgressEvent> events() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    std::vector<ProgressEvent> eventsFor(std::size_t taskId) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<ProgressEvent> selected;
        for (const auto &event : events_)
        {
            if (event.taskId == taskId)
            {
                selected.push_back(event);
            }
        }
        return selected;
    }

    std::size_t count(EventName name) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t n = 0;
        for (const auto &event : events_)
        {
            if (event.name == name)
            {
                ++n;
            }
        }
        return n;
    }

    int batchStarts() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return batchStarts_;
    }

    int batchFinishes() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return batchFinishes_;
    }

    std::size_t announcedTasks() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return announcedTasks_;
    }

    std::size_t finishedTotal() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return finishedTotal_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<ProgressEvent> events_;
    int batchStarts_ = 0;
    int batchFinishes_ = 0;
    std::size_t announcedTasks_ = 0;
    std::size_t finishedTotal_ = 0;
};

// Names of the given events, for order comparisons
inline std::vector<EventName> namesOf(const std::vector<ProgressEvent> &events)
{
    std::vector<EventName> names;
    for (const auto &event : events)
    {
        names.push_back(event.name);
    }
    return names;
}
