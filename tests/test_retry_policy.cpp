#include <chrono>
#include <stdexcept>
#include <fmt/core.h>
#include "retry_policy.hpp"
#include "test_support.hpp"

using std::chrono::milliseconds;

int main()
{
    try
    {
        // Test 1: Transient kinds
        check(isTransient(ErrorKind::ConnectError), "ConnectError is transient");
        check(isTransient(ErrorKind::TimeoutError), "TimeoutError is transient");
        check(isTransient(ErrorKind::HttpStatusError), "HttpStatusError is transient");
        check(isTransient(ErrorKind::StreamInterrupted), "StreamInterrupted is transient");
        check(!isTransient(ErrorKind::FileExistsError), "FileExistsError is not transient");
        check(!isTransient(ErrorKind::FilesystemWriteError), "FilesystemWriteError is not transient");
        check(!isTransient(ErrorKind::InvalidUrl), "InvalidUrl is not transient");
        check(!isTransient(ErrorKind::DuplicateDestination), "DuplicateDestination is not transient");
        check(!isTransient(ErrorKind::Cancelled), "Cancelled is not transient");
        check(std::string(toString(ErrorKind::HttpStatusError)) == "HttpStatusError", "Error kind names");

        RetryPolicy exact(milliseconds(1000), milliseconds(30000), 0.0);

        // Test 2: Permanent errors give up on the first failure
        for (ErrorKind kind : {ErrorKind::FileExistsError, ErrorKind::FilesystemWriteError,
                               ErrorKind::InvalidUrl, ErrorKind::DuplicateDestination, ErrorKind::Cancelled})
        {
            check(!exact.decide(1, kind, 10).shouldRetry(), fmt::format("{} is never retried", toString(kind)));
        }

        // Test 3: retries bounds the total number of attempts
        check(exact.decide(1, ErrorKind::ConnectError, 3).shouldRetry(), "Attempt 1 of 3 retries");
        check(exact.decide(2, ErrorKind::ConnectError, 3).shouldRetry(), "Attempt 2 of 3 retries");
        check(!exact.decide(3, ErrorKind::ConnectError, 3).shouldRetry(), "Attempt 3 of 3 gives up");
        check(!exact.decide(1, ErrorKind::TimeoutError, 1).shouldRetry(), "Single attempt never retries");

        // Test 4: Exponential backoff, capped
        check(exact.backoffFor(1) == milliseconds(1000), "Backoff after attempt 1 is 1s");
        check(exact.backoffFor(2) == milliseconds(2000), "Backoff after attempt 2 is 2s");
        check(exact.backoffFor(3) == milliseconds(4000), "Backoff after attempt 3 is 4s");
        check(exact.backoffFor(6) == milliseconds(30000), "Backoff is capped at 30s");
        check(exact.backoffFor(60) == milliseconds(30000), "Backoff stays capped for large attempts");
        check(exact.decide(2, ErrorKind::StreamInterrupted, 5).backoff == milliseconds(2000),
              "Decision carries the backoff without jitter");

        // Test 5: Jitter stays within +/-20%
        RetryPolicy jittered(milliseconds(1000), milliseconds(30000), 0.2);
        bool withinBounds = true;
        for (int i = 0; i < 200; ++i)
        {
            auto backoff = jittered.decide(2, ErrorKind::ConnectError, 5).backoff;
            if (backoff < milliseconds(1600) || backoff > milliseconds(2400))
            {
                withinBounds = false;
            }
        }
        check(withinBounds, "Jittered backoff within 20% of 2s");

        // Test 6: Context of the following attempt
        RetryContext first;
        RetryContext second = first.next(ErrorKind::TimeoutError, milliseconds(1000));
        RetryContext third = second.next(ErrorKind::ConnectError, milliseconds(2000));
        check(first.attempt == 1 && !first.lastError, "Fresh context starts at attempt 1");
        check(second.attempt == 2 && second.lastError == ErrorKind::TimeoutError, "Next context records error");
        check(third.attempt == 3 && third.elapsedBackoff == milliseconds(3000), "Backoff accumulates");

        // Test 7: Invalid configuration
        bool rejectedJitter = false;
        try
        {
            RetryPolicy bad(milliseconds(1000), milliseconds(30000), 1.5);
        }
        catch (const std::invalid_argument &)
        {
            rejectedJitter = true;
        }
        check(rejectedJitter, "Jitter >= 1 rejected");

        bool rejectedDelays = false;
        try
        {
            RetryPolicy bad(milliseconds(5000), milliseconds(1000), 0.0);
        }
        catch (const std::invalid_argument &)
        {
            rejectedDelays = true;
        }
        check(rejectedDelays, "Max delay below base rejected");

        return finish();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "❌ Error: {}\n", e.what());
        return 1;
    }
}
