#ifndef SENSOR_EVENT_LISTENER_HPP
#define SENSOR_EVENT_LISTENER_HPP

#include <cstdint>
#include <main/models/sensor_event.hpp>

// Callback surface the platform invokes from its own event context.
class SensorEventListener {
public:
    virtual ~SensorEventListener() = default;
    virtual void onSensorChanged(const SensorEvent& event) = 0;
    virtual void onAccuracyChanged(int32_t sensor_type, int32_t accuracy) {
        (void)sensor_type;
        (void)accuracy;
    }
};

#endif // SENSOR_EVENT_LISTENER_HPP
