#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <main/secrets.hpp>
#include <sdkconfig.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

namespace Config {
namespace Wifi {
    // Network credentials sourced from secrets.hpp (git-ignored)
    static constexpr const char* ssid = Secrets::WIFI_SSID;
    static constexpr const char* password = Secrets::WIFI_PASSWORD;

    // Behavior
    static constexpr bool auto_connect_on_start = true;
    static constexpr int max_retry_count = 5;           // Association retries before giving up until the next connect()
    // Fresh connect() while there is no IP and no attempt in flight
    static constexpr uint32_t reconnect_interval_ms = 30000;
}

namespace Device {
    // Reported as "deviceId" in every telemetry message
    static constexpr const char* id = Secrets::DEVICE_ID;
}

namespace Telemetry {
    static constexpr const char* app_name = "weatherstation";
    static constexpr const char* topic = "weatherstation/telemetry";
    // Fixed channel marker expected by existing consumers
    static constexpr const char* channel = "pubsub";

    static constexpr uint32_t publish_interval_ms = 1000;

    // Disconnected buffer: keep the oldest backlog, drop new messages when full
    static constexpr std::size_t disconnected_buffer_capacity = 100;
    static constexpr bool disconnected_buffer_delete_oldest = false;

    // Fixed message slot sizes (no heap per message)
    static constexpr std::size_t max_topic_len = 96;
    static constexpr std::size_t max_payload_len = 256;
    static constexpr std::size_t max_device_id_len = 64;
}

namespace Tasks {
    // Task watchdog: longest a subscribed task may go without feeding (panics)
    static constexpr uint32_t watchdog_timeout_ms = 8000;

namespace Publisher {
#if CONFIG_IDF_TARGET_LINUX
    // POSIX port runs tasks on pthreads, which refuse stacks below PTHREAD_STACK_MIN
    static constexpr uint32_t stack_size_bytes = 65536;
#else
    static constexpr uint32_t stack_size_bytes = 6144;
#endif
    // Delayed + immediate jobs that may be pending at once on the worker
    static constexpr std::size_t max_pending_jobs = 8;
    // Upper bound on how long close() waits for the worker to drain
    static constexpr uint32_t shutdown_timeout_ms = 10000;
}
}

// Task priority levels (higher number = higher priority, can preempt lower)
namespace TaskPriorities {
    // Non-critical: network I/O can tolerate latency
    static constexpr UBaseType_t NORMAL   = tskIDLE_PRIORITY + 1;
}

namespace Logging {
    // 0 = ERROR, 1 = WARN, 2 = INFO, 3 = DEBUG
    static constexpr int default_level = 2;
}

namespace Mqtt {
    // Single fixed broker endpoint
    static constexpr const char* broker_uri = "mqtt://iot.eclipse.org:1883";
    // Client identity is "<prefix>-<random hex>" generated per publisher
    static constexpr const char* client_id_prefix = Telemetry::app_name;
    static constexpr std::size_t max_client_id_len = 48;

    // Session behavior: persistent session, automatic reconnect
    static constexpr bool clean_session = false;
    static constexpr bool auto_reconnect = true;
    static constexpr int reconnect_timeout_ms = 5000;
    static constexpr uint16_t keepalive_seconds = 60;
    // Bounds every blocking socket operation, and with it how long the
    // worker can wait on the client lock; must stay well under the watchdog
    static constexpr int network_timeout_ms = 4000;
    // At-least-once for every telemetry publish
    static constexpr int default_qos = 1;
}
}

static_assert(Config::Mqtt::network_timeout_ms * 2 <= static_cast<int>(Config::Tasks::watchdog_timeout_ms),
              "a stalled MQTT call on the worker must not reach the watchdog timeout");

#endif // CONFIG_HPP
