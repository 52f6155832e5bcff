#ifndef METRIC_SINK_HPP
#define METRIC_SINK_HPP

#include <main/sensors/sensor_event_listener.hpp>
#include <main/state/latest_value_cache.hpp>

// Write-only adapter: stores values[0] of every event into one cache slot.
// No I/O, no validation, never blocks.
class MetricSink : public SensorEventListener {
public:
    MetricSink(LatestValueCache& cache, Metric metric) : cache(cache), metric(metric) {}

    void onSensorChanged(const SensorEvent& event) override {
        cache.record(metric, event.values[0]);
    }

    Metric target() const { return metric; }

private:
    LatestValueCache& cache;
    Metric metric;
};

#endif // METRIC_SINK_HPP
