#include <main/runtime/periodic_timer.hpp>
#include <main/utils/logger.hpp>

namespace {
    static const char* TAG = "PeriodicTimer";
    static std::atomic<uint32_t> s_next_tag{1};
}

PeriodicTimer::PeriodicTimer(WorkQueue& queue, uint32_t interval_ms, Callback callback)
    : queue(queue),
      interval_ms(interval_ms),
      callback(std::move(callback)),
      tag(s_next_tag.fetch_add(1)),
      running(false),
      generation(0) {}

PeriodicTimer::~PeriodicTimer() {
    stop();
}

bool PeriodicTimer::start() {
    if (running.exchange(true)) {
        return true;
    }
    const uint32_t gen = generation.fetch_add(1) + 1U;
    if (!schedule(gen, 0)) {
        running.store(false);
        LOG_ERROR(TAG, "Timer tag=%lu could not be started", static_cast<unsigned long>(tag));
        return false;
    }
    return true;
}

void PeriodicTimer::stop() {
    if (!running.exchange(false)) {
        return;
    }
    generation.fetch_add(1);
    queue.cancel(tag);
}

bool PeriodicTimer::schedule(uint32_t gen, uint32_t delay_ms) {
    return queue.post([this, gen]() { tick(gen); }, delay_ms, tag);
}

void PeriodicTimer::tick(uint32_t gen) {
    if (!running.load() || gen != generation.load()) {
        return;
    }
    callback();
    if (!running.load() || gen != generation.load()) {
        return;
    }
    if (!schedule(gen, interval_ms)) {
        // Only possible when the queue is full or shutting down
        running.store(false);
        LOG_ERROR(TAG, "Timer tag=%lu could not be re-armed; stopped", static_cast<unsigned long>(tag));
    }
}
