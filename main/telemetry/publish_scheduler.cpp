#include <main/telemetry/publish_scheduler.hpp>
#include <main/telemetry/payload_builder.hpp>
#include <main/config/config.hpp>
#include <main/utils/logger.hpp>

static const char* TAG = "PublishScheduler";

const char* toString(CycleOutcome outcome) {
    switch (outcome) {
        case CycleOutcome::PUBLISHED:          return "PUBLISHED";
        case CycleOutcome::SKIPPED_NO_NETWORK: return "SKIPPED_NO_NETWORK";
        case CycleOutcome::SKIPPED_NO_DATA:    return "SKIPPED_NO_DATA";
        case CycleOutcome::PAYLOAD_ERROR:      return "PAYLOAD_ERROR";
        case CycleOutcome::PUBLISH_FAILED:     return "PUBLISH_FAILED";
        default:                               return "UNKNOWN";
    }
}

PublishScheduler::PublishScheduler(WorkQueue& worker,
                                   const LatestValueCache& cache,
                                   const ConnectivityGate& connectivity,
                                   BrokerSession& session,
                                   const Settings& settings)
    : cache(cache),
      connectivity(connectivity),
      session(session),
      settings(settings),
      timer(worker, settings.interval_ms, [this]() { (void)runCycle(); }),
      cycles(0),
      last_outcome(CycleOutcome::SKIPPED_NO_DATA) {}

bool PublishScheduler::start() {
    if (timer.isRunning()) {
        return true;
    }
    LOG_INFO(TAG, "Publishing to %s every %lu ms", settings.topic, static_cast<unsigned long>(settings.interval_ms));
    return timer.start();
}

void PublishScheduler::stop() {
    if (!timer.isRunning()) {
        return;
    }
    timer.stop();
    LOG_INFO(TAG, "Stopped after %lu cycle(s)", static_cast<unsigned long>(cycles));
}

CycleOutcome PublishScheduler::runCycle() {
    ++cycles;

    if (!connectivity.isNetworkUsable()) {
        LOG_ERROR(TAG, "%s", "no active network");
        last_outcome = CycleOutcome::SKIPPED_NO_NETWORK;
        return last_outcome;
    }

    const TelemetryMessage message = PayloadBuilder::build(cache.snapshot(), settings.device_id, settings.clock());
    if (!message.has_data) {
        LOG_DEBUG(TAG, "%s", "no sensor measurement to publish");
        last_outcome = CycleOutcome::SKIPPED_NO_DATA;
        return last_outcome;
    }

    char payload[Config::Telemetry::max_payload_len];
    const int len = PayloadBuilder::render(message, payload, sizeof(payload));
    if (len < 0) {
        LOG_ERROR(TAG, "Payload does not fit in %u bytes", static_cast<unsigned>(sizeof(payload)));
        last_outcome = CycleOutcome::PAYLOAD_ERROR;
        return last_outcome;
    }

    LOG_DEBUG(TAG, "publishing message: %s", payload);
    esp_err_t err = session.publish(settings.topic, payload, static_cast<std::size_t>(len), settings.qos);
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "Error publishing message: %s (%d)", esp_err_to_name(err), static_cast<int>(err));
        last_outcome = CycleOutcome::PUBLISH_FAILED;
        return last_outcome;
    }
    last_outcome = CycleOutcome::PUBLISHED;
    return last_outcome;
}
