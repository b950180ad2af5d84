#include "batch_result.hpp"

void BatchResult::record(const TransferOutcome &outcome)
{
    outcomes.push_back(outcome);

    if (outcome.succeeded)
    {
        ++succeeded;
    }
    else if (outcome.cancelled())
    {
        // Not an error for reporting purposes, but not a success either
        ++cancelled;
    }
    else
    {
        ++failed;
        failures.push_back(TransferFailure{outcome.request,
                                           outcome.error.value_or(ErrorKind::ConnectError),
                                           outcome.httpStatus,
                                           outcome.message,
                                           outcome.attempts});
    }
}
