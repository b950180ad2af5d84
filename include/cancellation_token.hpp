#pragma once

#include <atomic>
#include <chrono>

/**
 * Cooperative cancellation flag shared by a batch and its tasks.
 *
 * cancel() only stores to a lock-free atomic, so it may be called from a
 * signal handler. Waiting is done in short slices that re-check the flag.
 * Cancellation is permanent: a cancelled token never becomes live again.
 */
class CancellationToken
{
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken &) = delete;
    CancellationToken &operator=(const CancellationToken &) = delete;

    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

    bool isCancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

    /**
     * Sleep for the given duration unless cancelled first.
     *
     * @return true if the full duration elapsed, false if cancelled
     */
    bool waitFor(std::chrono::milliseconds duration) const;

    // Longest time a waiter goes without re-checking the flag
    static constexpr std::chrono::milliseconds POLL_INTERVAL{50};

private:
    std::atomic<bool> cancelled_{false};

    static_assert(std::atomic<bool>::is_always_lock_free,
                  "cancel() must be async-signal-safe");
};
