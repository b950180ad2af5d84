#include "retry_policy.hpp"

#include <algorithm>
#include <random>
#include <stdexcept>

RetryContext RetryContext::next(ErrorKind error, std::chrono::milliseconds backoff) const
{
    RetryContext following;
    following.attempt = attempt + 1;
    following.lastError = error;
    following.elapsedBackoff = elapsedBackoff + backoff;
    return following;
}

RetryPolicy::RetryPolicy(std::chrono::milliseconds baseDelay,
                         std::chrono::milliseconds maxDelay,
                         double jitter)
    : baseDelay_(baseDelay), maxDelay_(maxDelay), jitter_(jitter)
{
    if (baseDelay_.count() < 0 || maxDelay_ < baseDelay_)
    {
        throw std::invalid_argument("Retry delays must satisfy 0 <= base <= max");
    }
    if (jitter_ < 0.0 || jitter_ >= 1.0)
    {
        throw std::invalid_argument("Retry jitter must be in [0, 1)");
    }
}

RetryDecision RetryPolicy::decide(int attemptCount, ErrorKind error, int maxRetries) const
{
    // Permanent error - retrying won't help
    if (!isTransient(error))
    {
        return RetryDecision::giveUp();
    }

    if (attemptCount >= maxRetries)
    {
        return RetryDecision::giveUp();
    }

    auto delay = backoffFor(attemptCount);
    if (jitter_ > 0.0 && delay.count() > 0)
    {
        // Random variation of +/- jitter to prevent thundering herd
        thread_local std::mt19937 gen{std::random_device{}()};
        std::uniform_real_distribution<double> dis(-jitter_, jitter_);
        auto offset = static_cast<long long>(static_cast<double>(delay.count()) * dis(gen));
        delay += std::chrono::milliseconds(offset);
    }

    return RetryDecision::retry(delay);
}

std::chrono::milliseconds RetryPolicy::backoffFor(int attemptCount) const
{
    if (attemptCount < 1)
    {
        attemptCount = 1;
    }

    // base * 2^(attempt-1): 1s, 2s, 4s, ... stop doubling once past the cap
    auto delay = baseDelay_;
    for (int i = 1; i < attemptCount && delay < maxDelay_; ++i)
    {
        delay *= 2;
    }
    return std::min(delay, maxDelay_);
}
