#ifndef PAYLOAD_BUILDER_HPP
#define PAYLOAD_BUILDER_HPP

#include <cstddef>
#include <cstdint>
#include <main/models/metric.hpp>
#include <main/models/telemetry_message.hpp>

// Pure, allocation-free construction of the telemetry wire payload:
//
//   {"deviceId":"<id>","channel":"pubsub","timestamp":<epoch ms>,
//    "data":{"temperature":"21.5","pressure":"1013.25"}}
//
// Metric values are JSON strings, not numbers; consumers depend on that.
// "data" is omitted when no metric has been recorded, and absent metrics
// are omitted from it.
namespace PayloadBuilder {
    TelemetryMessage build(const MetricSnapshot& snapshot, const char* device_id, int64_t timestamp_ms);

    // Writes the JSON text (null-terminated) into out.
    // Returns the payload length, or -1 if it does not fit in out_size - 1 bytes.
    int render(const TelemetryMessage& message, char* out, std::size_t out_size);

    // Shortest text that parses back to the same float, always with a
    // fraction ("21.5", "100.0"), scientific outside [1e-3, 1e7) ("1.0E7").
    // Returns the text length, or -1 if out is too small.
    int formatValue(float value, char* out, std::size_t out_size);
}

#endif // PAYLOAD_BUILDER_HPP
