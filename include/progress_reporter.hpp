#pragma once

#include <cstddef>

#include "batch_result.hpp"
#include "progress_event.hpp"

/**
 * Consumer of engine events.
 *
 * The engine calls onEvent() from its worker threads, so several tasks may
 * report concurrently. Per-task order always follows that task's state
 * machine; no order is implied between different tasks. Renderers that are
 * not thread-safe should be wrapped in a ReporterChannel.
 */
class ProgressReporter
{
public:
    virtual ~ProgressReporter() = default;

    virtual void onBatchStart(std::size_t totalTasks) = 0;
    virtual void onEvent(const ProgressEvent &event) = 0;
    virtual void onBatchFinish(const BatchResult &result) = 0;
};

/**
 * Renders nothing. Used in silent mode; failures are still reported by the
 * caller from the BatchResult.
 */
class SilentReporter final : public ProgressReporter
{
public:
    void onBatchStart(std::size_t) override {}
    void onEvent(const ProgressEvent &) override {}
    void onBatchFinish(const BatchResult &) override {}
};
