#include <main/telemetry/telemetry_publisher.hpp>
#include <main/config/config.hpp>
#include <main/utils/logger.hpp>

static const char* TAG = "TelemetryPublisher";

TelemetryPublisher::TelemetryPublisher(const char* app_name,
                                       const char* topic,
                                       const char* device_id,
                                       WorkQueue& worker,
                                       MqttTransport& transport,
                                       const ConnectivityGate& connectivity,
                                       PublishScheduler::Clock clock)
    : app_name(app_name),
      worker(worker),
      transport(transport),
      cache(),
      temperature_sink(cache, Metric::TEMPERATURE),
      pressure_sink(cache, Metric::PRESSURE),
      broker(transport, worker),
      publish_scheduler(worker, cache, connectivity, broker,
                        PublishScheduler::Settings{topic, device_id,
                                                   Config::Telemetry::publish_interval_ms,
                                                   Config::Mqtt::default_qos, clock}),
      initialized(false),
      closed(false) {}

TelemetryPublisher::~TelemetryPublisher() {
    if (initialized && !closed) {
        close();
    }
}

bool TelemetryPublisher::init() {
    if (initialized) {
        return true;
    }
    if (closed) {
        LOG_ERROR(TAG, "%s: init after close", app_name);
        return false;
    }
    if (!worker.begin()) {
        LOG_ERROR(TAG, "%s: worker context could not start", app_name);
        return false;
    }
    if (!transport.init()) {
        LOG_ERROR(TAG, "%s: broker session could not be created", app_name);
        (void)worker.shutdown();
        return false;
    }
    if (!worker.post([this]() {
            broker.setReconnectPolicy(Config::Mqtt::auto_reconnect);
            (void)broker.connect();
        }, 0, WorkQueue::NO_TAG)) {
        LOG_ERROR(TAG, "%s: could not queue broker connect", app_name);
        (void)transport.stop();
        (void)worker.shutdown();
        return false;
    }
    initialized = true;
    LOG_INFO(TAG, "%s: publisher ready", app_name);
    return true;
}

bool TelemetryPublisher::start() {
    if (!initialized || closed) {
        LOG_WARN(TAG, "%s: start ignored (%s)", app_name, closed ? "closed" : "not initialized");
        return false;
    }
    return publish_scheduler.start();
}

void TelemetryPublisher::stop() {
    publish_scheduler.stop();
}

void TelemetryPublisher::close() {
    if (closed) {
        LOG_WARN(TAG, "%s: already closed", app_name);
        return;
    }
    if (initialized && worker.isWorkerContext()) {
        // shutdown() would wait on the very task running this
        LOG_ERROR(TAG, "%s: close() called from the worker context; ignored", app_name);
        return;
    }
    closed = true;
    publish_scheduler.stop();
    if (!initialized) {
        return;
    }
    const bool queued = worker.post([this]() { broker.disconnect(); }, 0, WorkQueue::NO_TAG);
    if (!worker.shutdown()) {
        LOG_ERROR(TAG, "%s: worker did not shut down cleanly", app_name);
    }
    if (!queued) {
        LOG_WARN(TAG, "%s: disconnect could not be queued; disconnecting after worker stop", app_name);
        broker.disconnect();
    }
    const SessionStats s = broker.stats();
    LOG_INFO(TAG, "%s: closed (published=%lu flushed=%lu dropped=%lu)", app_name,
             static_cast<unsigned long>(s.published), static_cast<unsigned long>(s.flushed),
             static_cast<unsigned long>(s.dropped));
}
