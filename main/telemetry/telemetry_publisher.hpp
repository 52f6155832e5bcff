#ifndef TELEMETRY_PUBLISHER_HPP
#define TELEMETRY_PUBLISHER_HPP

#include <cstdint>
#include <main/network/broker_session.hpp>
#include <main/network/connectivity_gate.hpp>
#include <main/network/mqtt_transport.hpp>
#include <main/runtime/work_queue.hpp>
#include <main/sensors/metric_sink.hpp>
#include <main/state/latest_value_cache.hpp>
#include <main/telemetry/publish_scheduler.hpp>

// Periodic sensor telemetry to one broker topic.
//
// Sensor listeners may be called from any context at any rate; they only
// overwrite the latest-value cache. The worker context runs the publish
// cycles and every session operation. The broker session is created with
// the publisher and lives until close(); start()/stop() only arm and
// disarm the publish timer.
class TelemetryPublisher {
public:
    TelemetryPublisher(const char* app_name,
                       const char* topic,
                       const char* device_id,
                       WorkQueue& worker,
                       MqttTransport& transport,
                       const ConnectivityGate& connectivity,
                       PublishScheduler::Clock clock);
    ~TelemetryPublisher();

    TelemetryPublisher(const TelemetryPublisher&) = delete;
    TelemetryPublisher& operator=(const TelemetryPublisher&) = delete;

    // Starts the worker, creates the broker client and queues the first
    // connect. Returns false if the session cannot be set up; the instance
    // is then unusable.
    bool init();

    bool start();
    void stop();
    // Stop, queue the final disconnect, wait for the worker to drain.
    // Terminal; later calls are ignored. Not callable from the worker.
    void close();

    SensorEventListener& temperatureListener() { return temperature_sink; }
    SensorEventListener& pressureListener() { return pressure_sink; }

    const LatestValueCache& latestValues() const { return cache; }
    const BrokerSession& session() const { return broker; }
    const PublishScheduler& scheduler() const { return publish_scheduler; }

    bool isClosed() const { return closed; }

private:
    const char* app_name;
    WorkQueue& worker;
    MqttTransport& transport;

    LatestValueCache cache;
    MetricSink temperature_sink;
    MetricSink pressure_sink;
    BrokerSession broker;
    PublishScheduler publish_scheduler;

    bool initialized;
    bool closed;
};

#endif // TELEMETRY_PUBLISHER_HPP
