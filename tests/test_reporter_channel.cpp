#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <fmt/core.h>
#include "reporter_channel.hpp"
#include "test_support.hpp"

namespace
{

ProgressEvent makeEvent(std::size_t taskId, EventName name, std::uint64_t bytes = 0)
{
    ProgressEvent event;
    event.taskId = taskId;
    event.name = name;
    event.bytes = bytes;
    return event;
}

/**
 * Records like RecordingReporter but holds the render thread inside the
 * first onBatchStart() until release() is called.
 */
class GatedReporter : public RecordingReporter
{
public:
    void onBatchStart(std::size_t totalTasks) override
    {
        entered_.set_value();
        gate_.get_future().wait();
        RecordingReporter::onBatchStart(totalTasks);
    }

    void waitUntilBlocked() { entered_.get_future().wait(); }
    void release() { gate_.set_value(); }

private:
    std::promise<void> entered_;
    std::promise<void> gate_;
};

class ThrowingReporter : public RecordingReporter
{
public:
    void onEvent(const ProgressEvent &event) override
    {
        if (event.name == EventName::DownloadError)
        {
            throw std::runtime_error("renderer broke");
        }
        RecordingReporter::onEvent(event);
    }
};

void testPreservesOrder()
{
    RecordingReporter renderer;
    std::vector<ProgressEvent> sent;
    {
        ReporterChannel channel(renderer);
        channel.onBatchStart(2);
        for (std::uint64_t i = 1; i <= 50; ++i)
        {
            sent.push_back(makeEvent(i % 2, EventName::DownloadProgress, i));
            channel.onEvent(sent.back());
        }
        channel.flush();

        auto received = renderer.events();
        bool sameOrder = received.size() == sent.size();
        for (std::size_t i = 0; sameOrder && i < sent.size(); ++i)
        {
            sameOrder = received[i].taskId == sent[i].taskId && received[i].bytes == sent[i].bytes;
        }
        check(sameOrder, "Channel: events delivered in queue order");
        check(renderer.batchStarts() == 1, "Channel: batch start delivered");
        check(channel.droppedEvents() == 0, "Channel: nothing dropped below capacity");

        channel.onBatchFinish(BatchResult{});
    }
    // Destructor drains the queue
    check(renderer.batchFinishes() == 1, "Channel: pending messages delivered on destruction");
}

void testDropsOldestProgressOnly()
{
    GatedReporter renderer;
    ReporterChannel channel(renderer, 4);

    channel.onBatchStart(1);
    renderer.waitUntilBlocked();

    channel.onEvent(makeEvent(0, EventName::RequestSent));
    for (std::uint64_t bytes = 1; bytes <= 10; ++bytes)
    {
        channel.onEvent(makeEvent(0, EventName::DownloadProgress, bytes));
    }
    channel.onEvent(makeEvent(0, EventName::DownloadSuccess, 10));

    renderer.release();
    channel.flush();

    auto received = renderer.events();
    std::vector<EventName> expectedNames = {EventName::RequestSent, EventName::DownloadProgress,
                                            EventName::DownloadProgress, EventName::DownloadSuccess};
    check(namesOf(received) == expectedNames, "Full channel: lifecycle events kept, old progress dropped");
    check(received.size() == 4 && received[1].bytes == 9 && received[2].bytes == 10,
          "Full channel: newest progress survives");
    check(channel.droppedEvents() == 8, "Full channel: dropped events counted");
}

void testNeverDropsLifecycle()
{
    GatedReporter renderer;
    ReporterChannel channel(renderer, 2);

    channel.onBatchStart(5);
    renderer.waitUntilBlocked();
    for (std::size_t task = 0; task < 5; ++task)
    {
        channel.onEvent(makeEvent(task, EventName::DownloadError));
    }

    renderer.release();
    channel.flush();

    check(renderer.count(EventName::DownloadError) == 5, "Over capacity: every lifecycle event delivered");
    check(channel.droppedEvents() == 0, "Over capacity: nothing dropped");
}

void testSurvivesRendererFailure()
{
    ThrowingReporter renderer;
    ReporterChannel channel(renderer);

    channel.onEvent(makeEvent(0, EventName::DownloadError));
    channel.onEvent(makeEvent(1, EventName::DownloadSuccess));
    channel.flush();

    check(renderer.count(EventName::DownloadSuccess) == 1, "Renderer exception: later events still delivered");
}

void testConcurrentProducers()
{
    RecordingReporter renderer;
    ReporterChannel channel(renderer, 100000);

    std::vector<std::thread> producers;
    for (std::size_t task = 0; task < 4; ++task)
    {
        producers.emplace_back([&channel, task]() {
            for (std::uint64_t bytes = 1; bytes <= 200; ++bytes)
            {
                channel.onEvent(makeEvent(task, EventName::DownloadProgress, bytes));
            }
        });
    }
    for (auto &producer : producers)
    {
        producer.join();
    }
    channel.flush();

    bool perTaskOrder = true;
    for (std::size_t task = 0; task < 4; ++task)
    {
        std::uint64_t last = 0;
        for (const auto &event : renderer.eventsFor(task))
        {
            perTaskOrder = perTaskOrder && event.bytes == last + 1;
            last = event.bytes;
        }
        perTaskOrder = perTaskOrder && last == 200;
    }
    check(perTaskOrder, "Concurrent producers: per-task order preserved");
}

} // namespace

int main()
{
    try
    {
        testPreservesOrder();
        testDropsOldestProgressOnly();
        testNeverDropsLifecycle();
        testSurvivesRendererFailure();
        testConcurrentProducers();
        return finish();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "❌ Error: {}\n", e.what());
        return 1;
    }
}
