#ifndef LATEST_VALUE_CACHE_HPP
#define LATEST_VALUE_CACHE_HPP

#include <atomic>
#include <array>
#include <main/models/metric.hpp>

// Most recent reading per metric. Slots start absent and are only ever
// overwritten, never cleared, so a reading is republished until replaced.
// Each slot is an independent atomic: writers on the sensor event context,
// the reader on the publisher worker, no cross-field consistency.
class LatestValueCache {
public:
    LatestValueCache();

    void record(Metric metric, float value);
    float read(Metric metric) const;
    MetricSnapshot snapshot() const;

private:
    std::array<std::atomic<float>, kMetricCount> slots;
};

#endif // LATEST_VALUE_CACHE_HPP
