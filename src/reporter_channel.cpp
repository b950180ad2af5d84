#include "reporter_channel.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

ReporterChannel::ReporterChannel(ProgressReporter &renderer, std::size_t capacity)
    : renderer_(renderer), capacity_(std::max<std::size_t>(1, capacity))
{
    renderThread_ = std::thread([this]() { renderLoop(); });
}

ReporterChannel::~ReporterChannel()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    messageQueued_.notify_all();

    if (renderThread_.joinable())
    {
        renderThread_.join();
    }
}

void ReporterChannel::onBatchStart(std::size_t totalTasks)
{
    enqueue(BatchStarted{totalTasks});
}

void ReporterChannel::onEvent(const ProgressEvent &event)
{
    enqueue(event);
}

void ReporterChannel::onBatchFinish(const BatchResult &result)
{
    enqueue(result);
}

void ReporterChannel::flush()
{
    std::unique_lock<std::mutex> lock(mutex_);
    drained_.wait(lock, [this]() { return queue_.empty() && !delivering_; });
}

std::size_t ReporterChannel::droppedEvents() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

void ReporterChannel::enqueue(Message message)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (queue_.size() >= capacity_)
        {
            // Drop the oldest progress update; lifecycle events always get through
            auto oldest = std::find_if(queue_.begin(), queue_.end(), [](const Message &queued) {
                const auto *event = std::get_if<ProgressEvent>(&queued);
                return event && event->name == EventName::DownloadProgress;
            });
            if (oldest != queue_.end())
            {
                queue_.erase(oldest);
                ++dropped_;
            }
        }

        queue_.push_back(std::move(message));
    }
    messageQueued_.notify_one();
}

void ReporterChannel::renderLoop()
{
    std::unique_lock<std::mutex> lock(mutex_);
    while (true)
    {
        messageQueued_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });

        if (queue_.empty())
        {
            // stopping_ and nothing left to deliver
            break;
        }

        Message message = std::move(queue_.front());
        queue_.pop_front();
        delivering_ = true;

        lock.unlock(); // Unlock before calling into the renderer
        deliver(message);
        lock.lock();

        delivering_ = false;
        if (queue_.empty())
        {
            drained_.notify_all();
        }
    }
    drained_.notify_all();
}

void ReporterChannel::deliver(const Message &message)
{
    // A renderer failure must not take the render thread (and the process) down
    try
    {
        if (const auto *started = std::get_if<BatchStarted>(&message))
        {
            renderer_.onBatchStart(started->totalTasks);
        }
        else if (const auto *event = std::get_if<ProgressEvent>(&message))
        {
            renderer_.onEvent(*event);
        }
        else if (const auto *result = std::get_if<BatchResult>(&message))
        {
            renderer_.onBatchFinish(*result);
        }
    }
    catch (const std::exception &e)
    {
        spdlog::error("Progress renderer failed: {}", e.what());
    }
}
