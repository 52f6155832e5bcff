#ifndef PERIODIC_TIMER_HPP
#define PERIODIC_TIMER_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <main/runtime/work_queue.hpp>

// Repeating job on a WorkQueue. The first run is immediate; each following
// run is posted interval_ms after the previous one finished, so the
// callback's own duration stretches the effective period.
class PeriodicTimer {
public:
    using Callback = std::function<void()>;

    PeriodicTimer(WorkQueue& queue, uint32_t interval_ms, Callback callback);
    ~PeriodicTimer();

    PeriodicTimer(const PeriodicTimer&) = delete;
    PeriodicTimer& operator=(const PeriodicTimer&) = delete;

    // No-op while running. Returns false if the first run could not be queued.
    bool start();
    // Cancels the next trigger; a run already in progress completes. No-op while idle.
    void stop();

    bool isRunning() const { return running.load(); }
    uint32_t intervalMs() const { return interval_ms; }

private:
    void tick(uint32_t generation);
    bool schedule(uint32_t generation, uint32_t delay_ms);

    WorkQueue& queue;
    const uint32_t interval_ms;
    Callback callback;
    const uint32_t tag;
    std::atomic<bool> running;
    // Bumped on every start/stop so a stale in-flight tick never re-arms
    std::atomic<uint32_t> generation;
};

#endif // PERIODIC_TIMER_HPP
