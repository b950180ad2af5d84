#include <chrono>
#include <stdexcept>
#include <thread>
#include <fmt/core.h>
#include "admission_queue.hpp"
#include "cancellation_token.hpp"
#include "test_support.hpp"

using std::chrono::milliseconds;

namespace
{

void testFirstComeFirstServed()
{
    AdmissionQueue queue(2);
    for (std::size_t i = 0; i < 4; ++i)
    {
        queue.push(i);
    }

    auto first = queue.admit();
    auto second = queue.admit();
    check(first == std::size_t(0) && second == std::size_t(1), "Admission follows queue order");
    check(queue.inFlight() == 2 && queue.pendingCount() == 2, "Two in flight, two pending");

    // Third admit waits for a free slot
    std::optional<std::size_t> third;
    std::thread waiter([&]() { third = queue.admit(); });
    std::this_thread::sleep_for(milliseconds(50));
    check(queue.inFlight() == 2, "Admission blocked while full");

    queue.release();
    waiter.join();
    check(third == std::size_t(2), "Freed slot goes to the next pending entry");
    check(queue.peakInFlight() == 2, "Peak never exceeds the limit");

    queue.release();
    queue.release();
    auto fourth = queue.admit();
    queue.release();
    check(fourth == std::size_t(3) && !queue.admit(), "Empty queue admits nothing");
}

void testCloseAndDrain()
{
    AdmissionQueue queue(1);
    queue.push(7);
    queue.push(8);
    queue.push(9);

    auto running = queue.admit();
    queue.close();
    check(!queue.admit(), "Closed queue admits nothing");
    queue.release();

    auto remaining = queue.drainPending();
    check(running == std::size_t(7) && remaining == std::vector<std::size_t>({8, 9}),
          "Never-admitted entries drained in order");
    check(queue.pendingCount() == 0, "Drain empties the queue");
}

void testMisuse()
{
    bool zeroRejected = false;
    try
    {
        AdmissionQueue queue(0);
    }
    catch (const std::invalid_argument &)
    {
        zeroRejected = true;
    }
    check(zeroRejected, "Zero limit rejected");

    bool unmatchedRejected = false;
    try
    {
        AdmissionQueue queue(1);
        queue.release();
    }
    catch (const std::logic_error &)
    {
        unmatchedRejected = true;
    }
    check(unmatchedRejected, "Release without admit rejected");
}

void testCancellationToken()
{
    CancellationToken token;
    check(token.waitFor(milliseconds(20)), "Uncancelled wait runs to the end");

    std::thread canceller([&token]() {
        std::this_thread::sleep_for(milliseconds(50));
        token.cancel();
    });
    auto started = std::chrono::steady_clock::now();
    bool completed = token.waitFor(std::chrono::seconds(10));
    auto elapsed = std::chrono::steady_clock::now() - started;
    canceller.join();

    check(!completed && token.isCancelled(), "Cancel interrupts a wait");
    check(elapsed < std::chrono::seconds(2), "Cancelled wait returns promptly");
    check(!token.waitFor(milliseconds(20)) && token.isCancelled(), "Cancellation stays in effect");
}

} // namespace

int main()
{
    try
    {
        testFirstComeFirstServed();
        testCloseAndDrain();
        testMisuse();
        testCancellationToken();
        return finish();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "❌ Error: {}\n", e.what());
        return 1;
    }
}
