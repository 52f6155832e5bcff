#ifndef METRIC_HPP
#define METRIC_HPP

#include <cstddef>
#include <cstdint>
#include <cmath>
#include <limits>

// Metrics tracked by the latest-value cache. Append new ones before COUNT.
enum class Metric : uint8_t {
    TEMPERATURE = 0,
    PRESSURE    = 1,
    COUNT
};

static constexpr std::size_t kMetricCount = static_cast<std::size_t>(Metric::COUNT);

// "Never recorded" marker for a metric slot
static constexpr float kMetricAbsent = std::numeric_limits<float>::quiet_NaN();

inline const char* metricName(Metric metric) {
    switch (metric) {
        case Metric::TEMPERATURE: return "temperature";
        case Metric::PRESSURE:    return "pressure";
        default:                  return "unknown";
    }
}

inline bool isMetricPresent(float value) {
    return !std::isnan(value);
}

// Point-in-time copy of every metric slot. Fields may come from different instants.
struct MetricSnapshot {
    float values[kMetricCount];

    float get(Metric metric) const { return values[static_cast<std::size_t>(metric)]; }
    bool has(Metric metric) const { return isMetricPresent(get(metric)); }

    bool hasAny() const {
        for (std::size_t i = 0; i < kMetricCount; ++i) {
            if (isMetricPresent(values[i])) {
                return true;
            }
        }
        return false;
    }

    static MetricSnapshot empty() {
        MetricSnapshot snapshot;
        for (std::size_t i = 0; i < kMetricCount; ++i) {
            snapshot.values[i] = kMetricAbsent;
        }
        return snapshot;
    }
};

#endif // METRIC_HPP
