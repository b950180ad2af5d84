#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <thread>
#include <variant>

#include "batch_result.hpp"
#include "progress_event.hpp"
#include "progress_reporter.hpp"

/**
 * Decouples the engine from a renderer.
 *
 * Events are queued by any number of producer threads and delivered, in the
 * order they were queued, to the wrapped renderer on one dedicated thread.
 * Producers never wait for the renderer: when the buffer is full the oldest
 * queued download_progress event is dropped. Lifecycle events are never
 * dropped, so the buffer may exceed its capacity by those alone.
 */
class ReporterChannel final : public ProgressReporter
{
public:
    explicit ReporterChannel(ProgressReporter &renderer,
                             std::size_t capacity = DEFAULT_CAPACITY);

    /**
     * Delivers everything still queued, then stops the render thread.
     */
    ~ReporterChannel() override;

    ReporterChannel(const ReporterChannel &) = delete;
    ReporterChannel &operator=(const ReporterChannel &) = delete;

    void onBatchStart(std::size_t totalTasks) override;
    void onEvent(const ProgressEvent &event) override;
    void onBatchFinish(const BatchResult &result) override;

    /**
     * Block until every queued message has been handed to the renderer.
     */
    void flush();

    std::size_t droppedEvents() const;

    static constexpr std::size_t DEFAULT_CAPACITY = 1024;

private:
    struct BatchStarted
    {
        std::size_t totalTasks;
    };

    using Message = std::variant<BatchStarted, ProgressEvent, BatchResult>;

    void enqueue(Message message);
    void renderLoop();
    void deliver(const Message &message);

    ProgressReporter &renderer_;
    const std::size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable messageQueued_;
    std::condition_variable drained_;
    std::deque<Message> queue_;
    std::size_t dropped_ = 0;
    bool delivering_ = false;
    bool stopping_ = false;

    std::thread renderThread_;
};
