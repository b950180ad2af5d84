#pragma once

#include <cstdint>
#include <optional>

#include "error_kind.hpp"

/**
 * Snapshot of a transfer task's state machine.
 *
 *   Pending -> Connecting -> SizeKnown | SizeUnknown -> Streaming -> Succeeded
 *   any state past Pending -> Retrying -> Connecting ...
 *   any state -> Failed
 *
 * Values are immutable; the task replaces its current state on every
 * transition and copies it into the emitted ProgressEvent.
 */
class TransferState
{
public:
    enum class Phase
    {
        Pending,
        Connecting,
        SizeKnown,
        SizeUnknown,
        Streaming,
        Retrying,
        Succeeded,
        Failed
    };

    TransferState() = default;

    static TransferState pending() { return TransferState(Phase::Pending); }
    static TransferState connecting() { return TransferState(Phase::Connecting); }
    static TransferState sizeKnown(std::uint64_t totalBytes);
    static TransferState sizeUnknown() { return TransferState(Phase::SizeUnknown); }
    static TransferState streaming(std::uint64_t bytesSoFar);
    static TransferState retrying(int attempt);
    static TransferState succeeded() { return TransferState(Phase::Succeeded); }
    static TransferState failed(ErrorKind kind);

    Phase phase() const noexcept { return phase_; }

    // Payload accessors; zero / nullopt when the phase carries no such value
    std::uint64_t totalBytes() const noexcept { return totalBytes_; }
    std::uint64_t bytesSoFar() const noexcept { return bytesSoFar_; }
    int attempt() const noexcept { return attempt_; }
    std::optional<ErrorKind> errorKind() const noexcept { return errorKind_; }

    /**
     * Connecting, SizeKnown, SizeUnknown or Streaming.
     */
    bool isInFlight() const noexcept;

    bool isTerminal() const noexcept
    {
        return phase_ == Phase::Succeeded || phase_ == Phase::Failed;
    }

    static const char *phaseName(Phase phase);

private:
    explicit TransferState(Phase phase) : phase_(phase) {}

    Phase phase_ = Phase::Pending;
    std::uint64_t totalBytes_ = 0;
    std::uint64_t bytesSoFar_ = 0;
    int attempt_ = 0;
    std::optional<ErrorKind> errorKind_;
};
