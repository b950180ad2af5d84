#include "transfer_state.hpp"

TransferState TransferState::sizeKnown(std::uint64_t totalBytes)
{
    TransferState state(Phase::SizeKnown);
    state.totalBytes_ = totalBytes;
    return state;
}

TransferState TransferState::streaming(std::uint64_t bytesSoFar)
{
    TransferState state(Phase::Streaming);
    state.bytesSoFar_ = bytesSoFar;
    return state;
}

TransferState TransferState::retrying(int attempt)
{
    TransferState state(Phase::Retrying);
    state.attempt_ = attempt;
    return state;
}

TransferState TransferState::failed(ErrorKind kind)
{
    TransferState state(Phase::Failed);
    state.errorKind_ = kind;
    return state;
}

bool TransferState::isInFlight() const noexcept
{
    switch (phase_)
    {
    case Phase::Connecting:
    case Phase::SizeKnown:
    case Phase::SizeUnknown:
    case Phase::Streaming:
        return true;
    default:
        return false;
    }
}

const char *TransferState::phaseName(Phase phase)
{
    switch (phase)
    {
    case Phase::Pending:
        return "Pending";
    case Phase::Connecting:
        return "Connecting";
    case Phase::SizeKnown:
        return "SizeKnown";
    case Phase::SizeUnknown:
        return "SizeUnknown";
    case Phase::Streaming:
        return "Streaming";
    case Phase::Retrying:
        return "Retrying";
    case Phase::Succeeded:
        return "Succeeded";
    case Phase::Failed:
        return "Failed";
    }
    return "Unknown";
}
