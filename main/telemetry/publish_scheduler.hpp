#ifndef PUBLISH_SCHEDULER_HPP
#define PUBLISH_SCHEDULER_HPP

#include <cstdint>
#include <main/network/broker_session.hpp>
#include <main/network/connectivity_gate.hpp>
#include <main/runtime/periodic_timer.hpp>
#include <main/runtime/work_queue.hpp>
#include <main/state/latest_value_cache.hpp>

enum class CycleOutcome : uint8_t {
    PUBLISHED = 0,          // accepted by the session (sent or buffered)
    SKIPPED_NO_NETWORK = 1,
    SKIPPED_NO_DATA = 2,
    PAYLOAD_ERROR = 3,
    PUBLISH_FAILED = 4
};

const char* toString(CycleOutcome outcome);

// Fixed-interval sampling loop: snapshot the cache, render, publish.
// Every cycle re-arms the timer whatever its outcome; failures are logged
// and never stop the cadence.
class PublishScheduler {
public:
    using Clock = int64_t (*)();

    struct Settings {
        const char* topic;
        const char* device_id;
        uint32_t    interval_ms;
        int         qos;
        Clock       clock;       // epoch millis for the payload timestamp
    };

    PublishScheduler(WorkQueue& worker,
                     const LatestValueCache& cache,
                     const ConnectivityGate& connectivity,
                     BrokerSession& session,
                     const Settings& settings);

    // Idle -> Running; first cycle runs immediately on the worker
    bool start();
    // Running -> Idle; the session is untouched
    void stop();
    bool isRunning() const { return timer.isRunning(); }

    // One publish cycle; must run on the worker context
    CycleOutcome runCycle();

    uint32_t cycleCount() const { return cycles; }
    CycleOutcome lastOutcome() const { return last_outcome; }

private:
    const LatestValueCache& cache;
    const ConnectivityGate& connectivity;
    BrokerSession& session;
    Settings settings;
    PeriodicTimer timer;
    uint32_t cycles;
    CycleOutcome last_outcome;
};

#endif // PUBLISH_SCHEDULER_HPP
