#ifndef SENSOR_EVENT_HPP
#define SENSOR_EVENT_HPP

#include <cstdint>

// Reading delivered by the platform's sensor framework
struct SensorEvent {
    int32_t  sensor_type;
    int32_t  accuracy;
    int64_t  timestamp_ns;
    float    values[3];   // values[0] is the primary reading
    uint8_t  value_count;
};

#endif // SENSOR_EVENT_HPP
