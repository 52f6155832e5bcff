#ifndef TELEMETRY_MESSAGE_HPP
#define TELEMETRY_MESSAGE_HPP

#include <cstdint>
#include <main/config/config.hpp>
#include <main/models/metric.hpp>

// One telemetry record before rendering to the wire.
// "data" is rendered only when has_data is set; absent metrics inside it are skipped.
struct TelemetryMessage {
    char           device_id[Config::Telemetry::max_device_id_len];
    const char*    channel;      // always Config::Telemetry::channel
    int64_t        timestamp_ms; // epoch millis
    bool           has_data;
    MetricSnapshot data;
};

#endif // TELEMETRY_MESSAGE_HPP
