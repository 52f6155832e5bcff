#include <main/state/latest_value_cache.hpp>

LatestValueCache::LatestValueCache() {
    for (auto& slot : slots) {
        slot.store(kMetricAbsent, std::memory_order_relaxed);
    }
}

void LatestValueCache::record(Metric metric, float value) {
    slots[static_cast<std::size_t>(metric)].store(value, std::memory_order_release);
}

float LatestValueCache::read(Metric metric) const {
    return slots[static_cast<std::size_t>(metric)].load(std::memory_order_acquire);
}

MetricSnapshot LatestValueCache::snapshot() const {
    MetricSnapshot snapshot;
    for (std::size_t i = 0; i < kMetricCount; ++i) {
        snapshot.values[i] = slots[i].load(std::memory_order_acquire);
    }
    return snapshot;
}
