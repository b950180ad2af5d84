#pragma once

#include <chrono>
#include <optional>

#include "error_kind.hpp"

/**
 * Retry bookkeeping of one transfer task.
 * A value object: each attempt gets a fresh context built by next().
 */
struct RetryContext
{
    int attempt = 1; // 1-based number of the attempt this context describes
    std::optional<ErrorKind> lastError;
    std::chrono::milliseconds elapsedBackoff{0};

    /**
     * Context of the attempt that follows a failure of this one.
     */
    RetryContext next(ErrorKind error, std::chrono::milliseconds backoff) const;
};

/**
 * Outcome of RetryPolicy::decide().
 */
struct RetryDecision
{
    enum class Action
    {
        Retry,
        GiveUp
    };

    Action action = Action::GiveUp;
    std::chrono::milliseconds backoff{0};

    static RetryDecision retry(std::chrono::milliseconds backoff) { return {Action::Retry, backoff}; }
    static RetryDecision giveUp() { return {Action::GiveUp, std::chrono::milliseconds(0)}; }

    bool shouldRetry() const { return action == Action::Retry; }
};

/**
 * Exponential backoff retry policy.
 *
 * Non-transient errors (and cancellation) are never retried. Transient errors
 * are retried while attemptCount < maxRetries, so maxRetries bounds the total
 * number of attempts. The delay before the next attempt is
 * baseDelay * 2^(attemptCount - 1), capped at maxDelay, with ±jitter variation
 * to avoid many clients hammering a recovering server in lockstep.
 */
class RetryPolicy
{
public:
    explicit RetryPolicy(std::chrono::milliseconds baseDelay = DEFAULT_BASE_DELAY,
                         std::chrono::milliseconds maxDelay = DEFAULT_MAX_DELAY,
                         double jitter = DEFAULT_JITTER);

    /**
     * @param attemptCount Number of failed attempts so far (>= 1)
     * @param error Kind of the latest failure
     * @param maxRetries Configured limit on attempts
     */
    RetryDecision decide(int attemptCount, ErrorKind error, int maxRetries) const;

    /**
     * Backoff for the given attempt before jitter is applied.
     */
    std::chrono::milliseconds backoffFor(int attemptCount) const;

    std::chrono::milliseconds baseDelay() const { return baseDelay_; }
    std::chrono::milliseconds maxDelay() const { return maxDelay_; }

    static constexpr std::chrono::milliseconds DEFAULT_BASE_DELAY{1000};
    static constexpr std::chrono::milliseconds DEFAULT_MAX_DELAY{30000};
    static constexpr double DEFAULT_JITTER = 0.2;

private:
    std::chrono::milliseconds baseDelay_;
    std::chrono::milliseconds maxDelay_;
    double jitter_;
};
