#ifndef WORK_QUEUE_HPP
#define WORK_QUEUE_HPP

#include <cstdint>
#include <functional>

// Single-consumer job queue: every job runs on one worker context, one at a time.
class WorkQueue {
public:
    using Job = std::function<void()>;

    // Tag value for jobs that are never cancelled
    static constexpr uint32_t NO_TAG = 0;

    virtual ~WorkQueue() = default;

    // Start the worker. Idempotent.
    virtual bool begin() = 0;

    // Run job on the worker no earlier than delay_ms from now. Jobs with equal
    // deadlines run in post order. Returns false when full or shut down.
    virtual bool post(Job job, uint32_t delay_ms, uint32_t tag) = 0;

    // Drop pending jobs carrying tag. A job that is already running is not interrupted.
    virtual void cancel(uint32_t tag) = 0;

    // Stop accepting jobs, run the ones already due, discard delayed ones and
    // wait for the worker to exit. Must not be called from the worker itself.
    virtual bool shutdown() = 0;

    virtual bool isWorkerContext() const = 0;
};

#endif // WORK_QUEUE_HPP
