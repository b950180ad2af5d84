#include "download_coordinator.hpp"

#include <algorithm>
#include <exception>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "admission_queue.hpp"
#include "transfer_task.hpp"

namespace
{

// Key under which a destination is claimed, so "a/../b" and "b" collide
std::filesystem::path normalizedDestination(const std::filesystem::path &destination)
{
    std::error_code ec;
    auto absolute = std::filesystem::absolute(destination, ec);
    return (ec ? destination : absolute).lexically_normal();
}

} // namespace

DownloadCoordinator::DownloadCoordinator(std::shared_ptr<HttpTransport> transport,
                                         ProgressReporter &reporter,
                                         TransferOptions options,
                                         RetryPolicy policy)
    : transport_(std::move(transport)),
      reporter_(reporter),
      options_(std::move(options)),
      policy_(policy)
{
    if (!transport_)
    {
        throw std::invalid_argument("DownloadCoordinator requires a transport");
    }
}

BatchResult DownloadCoordinator::run(const std::vector<DownloadRequest> &requests, std::size_t parallelism)
{
    if (parallelism == 0)
    {
        throw std::invalid_argument("parallelism must be a positive integer");
    }

    spdlog::info("Starting batch of {} download(s), {} in parallel", requests.size(), parallelism);
    reporter_.onBatchStart(requests.size());

    std::vector<std::optional<TransferOutcome>> outcomes(requests.size());
    AdmissionQueue queue(parallelism);

    // Reject what can never succeed, claim destinations in request order.
    // A request claims its partial file too, so "x" and "x.part" collide.
    std::set<std::filesystem::path> claimed;
    std::size_t admissible = 0;
    for (std::size_t i = 0; i < requests.size(); ++i)
    {
        const auto &request = requests[i];
        if (!isValidUrl(request.source()))
        {
            outcomes[i] = reject(i, request, ErrorKind::InvalidUrl,
                                 fmt::format("Invalid URL: {}", request.source()));
            continue;
        }
        const auto destination = normalizedDestination(request.destination());
        const auto partial = normalizedDestination(TransferTask::makePartPath(request.destination()));
        if (claimed.count(destination) || claimed.count(partial))
        {
            outcomes[i] = reject(i, request, ErrorKind::DuplicateDestination,
                                 fmt::format("Destination used by another download: {}",
                                             request.destination().string()));
            continue;
        }
        claimed.insert(destination);
        claimed.insert(partial);
        queue.push(i);
        ++admissible;
    }

    // One worker per admission slot; each pulls the next pending request
    std::mutex errorMutex;
    std::exception_ptr workerError;

    auto worker = [&]()
    {
        while (!cancel_.isCancelled())
        {
            std::optional<std::size_t> index = queue.admit();
            if (!index)
            {
                break;
            }

            try
            {
                TransferTask task(*index, requests[*index], *transport_, policy_, options_, reporter_, cancel_);
                outcomes[*index] = task.run();
            }
            catch (...)
            {
                // Unexpected (not a transfer failure): stop the batch and rethrow after joining
                {
                    std::lock_guard<std::mutex> lock(errorMutex);
                    if (!workerError)
                    {
                        workerError = std::current_exception();
                    }
                }
                cancel_.cancel();
                queue.close();
            }
            queue.release();
        }
    };

    std::vector<std::thread> workers;
    const std::size_t workerCount = std::min(parallelism, admissible);
    workers.reserve(workerCount);
    for (std::size_t w = 0; w < workerCount; ++w)
    {
        workers.emplace_back(worker);
    }

    for (auto &thread : workers)
    {
        if (thread.joinable())
        {
            thread.join();
        }
    }

    peakInFlight_ = queue.peakInFlight();

    if (workerError)
    {
        std::rethrow_exception(workerError);
    }

    // Requests never admitted because the batch was cancelled
    for (std::size_t index : queue.drainPending())
    {
        outcomes[index] = skipCancelled(index, requests[index]);
    }

    BatchResult result;
    for (std::size_t i = 0; i < outcomes.size(); ++i)
    {
        if (!outcomes[i])
        {
            throw std::logic_error(fmt::format("Download {} finished without an outcome", i));
        }
        result.record(*outcomes[i]);
    }

    spdlog::info("Batch finished: {} succeeded, {} failed, {} cancelled (peak {} in flight)",
                 result.succeeded, result.failed, result.cancelled, peakInFlight_);
    reporter_.onBatchFinish(result);
    return result;
}

TransferOutcome DownloadCoordinator::reject(std::size_t index, const DownloadRequest &request,
                                            ErrorKind kind, const std::string &message)
{
    spdlog::error("[task {}] rejected: {}", index, message);

    ProgressEvent event;
    event.taskId = index;
    event.name = EventName::DownloadError;
    event.state = TransferState::failed(kind);
    event.attempt = 0;
    event.url = request.source();
    event.destination = request.destination().string();
    event.displayName = request.displayName();
    event.error = kind;
    event.message = message;
    reporter_.onEvent(event);

    TransferOutcome outcome{request};
    outcome.error = kind;
    outcome.message = message;
    return outcome;
}

TransferOutcome DownloadCoordinator::skipCancelled(std::size_t index, const DownloadRequest &request)
{
    ProgressEvent event;
    event.taskId = index;
    event.name = EventName::DownloadCancelled;
    event.state = TransferState::failed(ErrorKind::Cancelled);
    event.attempt = 0;
    event.url = request.source();
    event.destination = request.destination().string();
    event.displayName = request.displayName();
    event.error = ErrorKind::Cancelled;
    event.message = "Download cancelled before it started";
    reporter_.onEvent(event);

    TransferOutcome outcome{request};
    outcome.error = ErrorKind::Cancelled;
    outcome.message = event.message;
    return outcome;
}
