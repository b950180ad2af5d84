#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

/**
 * First-come-first-served admission of batch entries with a cap on how many
 * may be in flight at once. The single synchronization point shared by the
 * coordinator's workers.
 */
class AdmissionQueue
{
public:
    explicit AdmissionQueue(std::size_t limit);

    AdmissionQueue(const AdmissionQueue &) = delete;
    AdmissionQueue &operator=(const AdmissionQueue &) = delete;

    /**
     * Append an entry to the pending queue.
     */
    void push(std::size_t index);

    /**
     * Take the oldest pending entry and occupy an in-flight slot, waiting
     * while every slot is taken.
     *
     * @return Entry index, or std::nullopt once nothing is pending or the
     *         queue was closed
     */
    std::optional<std::size_t> admit();

    /**
     * Free the slot taken by a successful admit().
     */
    void release();

    /**
     * Stop admitting. Waiters in admit() return std::nullopt.
     */
    void close();

    /**
     * Remove and return entries that were never admitted, in queue order.
     */
    std::vector<std::size_t> drainPending();

    std::size_t limit() const { return limit_; }
    std::size_t inFlight() const;
    std::size_t peakInFlight() const;
    std::size_t pendingCount() const;

private:
    const std::size_t limit_;

    mutable std::mutex mutex_;
    std::condition_variable slotFreed_;
    std::deque<std::size_t> pending_;
    std::size_t inFlight_ = 0;
    std::size_t peakInFlight_ = 0;
    bool closed_ = false;
};
