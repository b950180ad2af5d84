#include "cancellation_token.hpp"

#include <algorithm>
#include <thread>

bool CancellationToken::waitFor(std::chrono::milliseconds duration) const
{
    const auto deadline = std::chrono::steady_clock::now() + duration;

    while (!isCancelled())
    {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline)
        {
            return true;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(remaining, POLL_INTERVAL));
    }
    return false;
}
