#include "admission_queue.hpp"

#include <algorithm>
#include <stdexcept>

AdmissionQueue::AdmissionQueue(std::size_t limit) : limit_(limit)
{
    if (limit_ == 0)
    {
        throw std::invalid_argument("Admission limit must be positive");
    }
}

void AdmissionQueue::push(std::size_t index)
{
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.push_back(index);
}

std::optional<std::size_t> AdmissionQueue::admit()
{
    std::unique_lock<std::mutex> lock(mutex_);
    slotFreed_.wait(lock, [this]() { return closed_ || pending_.empty() || inFlight_ < limit_; });

    if (closed_ || pending_.empty())
    {
        return std::nullopt;
    }

    std::size_t index = pending_.front();
    pending_.pop_front();
    ++inFlight_;
    peakInFlight_ = std::max(peakInFlight_, inFlight_);
    return index;
}

void AdmissionQueue::release()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (inFlight_ == 0)
        {
            throw std::logic_error("AdmissionQueue::release() without a matching admit()");
        }
        --inFlight_;
    }
    slotFreed_.notify_one();
}

void AdmissionQueue::close()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    slotFreed_.notify_all();
}

std::vector<std::size_t> AdmissionQueue::drainPending()
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::size_t> remaining(pending_.begin(), pending_.end());
    pending_.clear();
    return remaining;
}

std::size_t AdmissionQueue::inFlight() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return inFlight_;
}

std::size_t AdmissionQueue::peakInFlight() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return peakInFlight_;
}

std::size_t AdmissionQueue::pendingCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}
