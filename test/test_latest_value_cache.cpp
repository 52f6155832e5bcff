#include <unity.h>

#include <main/sensors/metric_sink.hpp>
#include <main/state/latest_value_cache.hpp>

namespace {
SensorEvent eventWith(float value) {
  SensorEvent event {};
  event.sensor_type = 13;
  event.accuracy = 3;
  event.timestamp_ns = 123456789;
  event.values[0] = value;
  event.values[1] = 99.0f;
  event.value_count = 1;
  return event;
}
} // namespace

void test_cache_starts_absent() {
  LatestValueCache cache;
  TEST_ASSERT_FALSE(isMetricPresent(cache.read(Metric::TEMPERATURE)));
  TEST_ASSERT_FALSE(isMetricPresent(cache.read(Metric::PRESSURE)));
  TEST_ASSERT_FALSE(cache.snapshot().hasAny());
}

void test_sink_records_primary_value_into_its_slot() {
  LatestValueCache cache;
  MetricSink temperature(cache, Metric::TEMPERATURE);
  MetricSink pressure(cache, Metric::PRESSURE);

  temperature.onSensorChanged(eventWith(21.5f));
  TEST_ASSERT_EQUAL_FLOAT(21.5f, cache.read(Metric::TEMPERATURE));
  TEST_ASSERT_FALSE(isMetricPresent(cache.read(Metric::PRESSURE)));

  pressure.onSensorChanged(eventWith(1013.25f));
  const MetricSnapshot snapshot = cache.snapshot();
  TEST_ASSERT_EQUAL_FLOAT(21.5f, snapshot.get(Metric::TEMPERATURE));
  TEST_ASSERT_EQUAL_FLOAT(1013.25f, snapshot.get(Metric::PRESSURE));
}

void test_cache_keeps_latest_value_across_reads() {
  LatestValueCache cache;
  MetricSink temperature(cache, Metric::TEMPERATURE);

  temperature.onSensorChanged(eventWith(20.0f));
  temperature.onSensorChanged(eventWith(22.25f));
  TEST_ASSERT_EQUAL_FLOAT(22.25f, cache.snapshot().get(Metric::TEMPERATURE));
  // Reading never clears a slot
  TEST_ASSERT_EQUAL_FLOAT(22.25f, cache.snapshot().get(Metric::TEMPERATURE));

  temperature.onAccuracyChanged(13, 0);
  TEST_ASSERT_EQUAL_FLOAT(22.25f, cache.read(Metric::TEMPERATURE));
}
