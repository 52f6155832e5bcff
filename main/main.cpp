#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <main/utils/logger.hpp>
#include <main/utils/time_sync.hpp>
#include <main/utils/watchdog.hpp>
#include <main/config/config.hpp>
#include <main/network/wifi_manager.hpp>
#include <main/network/esp_mqtt_transport.hpp>
#include <main/network/link_supervisor.hpp>
#include <main/runtime/freertos_work_queue.hpp>
#include <main/telemetry/telemetry_publisher.hpp>
#include <nvs_flash.h>

namespace {
    static const char* TAG = "MAIN";
    static constexpr uint32_t kStatusPeriodMs = 30000;
    static constexpr unsigned int kTimeSyncWaitMs = 10000;

    // Static instances (no heap)
    static WiFiManager s_wifi_manager;
    static EspMqttTransport s_transport;
    static FreeRtosWorkQueue s_worker("mqtt_publisher");
    static TelemetryPublisher s_publisher(Config::Telemetry::app_name,
                                          Config::Telemetry::topic,
                                          Config::Device::id,
                                          s_worker,
                                          s_transport,
                                          s_wifi_manager,
                                          &TimeSync::nowEpochMs);
    static LinkSupervisor s_link_supervisor(s_worker, s_wifi_manager, Config::Wifi::reconnect_interval_ms);
}

static void logStatus() {
    const SessionStats stats = s_publisher.session().stats();
    LOG_INFO(TAG, "session=%s wifi=%d cycles=%lu last=%s published=%lu buffered=%lu dropped=%lu",
             toString(s_publisher.session().state()),
             s_wifi_manager.isNetworkUsable() ? 1 : 0,
             static_cast<unsigned long>(s_publisher.scheduler().cycleCount()),
             toString(s_publisher.scheduler().lastOutcome()),
             static_cast<unsigned long>(stats.published + stats.flushed),
             static_cast<unsigned long>(stats.buffered),
             static_cast<unsigned long>(stats.dropped));
}

// Sensor drivers deliver readings into these from their own event context
SensorEventListener& weatherTemperatureListener() {
    return s_publisher.temperatureListener();
}

SensorEventListener& weatherPressureListener() {
    return s_publisher.pressureListener();
}

extern "C" void app_main(void)
{
    Logger::setLevel(Logger::levelFromInt(Config::Logging::default_level));
    LOG_INFO(TAG, "%s", "---Weather telemetry publisher started---");

    // NVS is required by the Wi-Fi driver
    esp_err_t err = nvs_flash_init();
    if (err == ESP_ERR_NVS_NO_FREE_PAGES || err == ESP_ERR_NVS_NEW_VERSION_FOUND) {
        ESP_ERROR_CHECK(nvs_flash_erase());
        err = nvs_flash_init();
    }
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "NVS init failed: %d", static_cast<int>(err));
    }

    Watchdog::init();

    if (!s_wifi_manager.init()) {
        LOG_ERROR(TAG, "%s", "WiFi init failed; publishing will be skipped until the link is up");
    }
    TimeSync::init();
    // Publishing starts regardless; early payloads just carry boot-relative time
    (void)TimeSync::waitForSync(kTimeSyncWaitMs);

    if (!s_publisher.init()) {
        LOG_ERROR(TAG, "%s", "Telemetry publisher could not be created");
        return;
    }
    // Runs on the publisher's worker, so it needs init() first
    if (!s_link_supervisor.start()) {
        LOG_ERROR(TAG, "%s", "Link supervisor could not be started; Wi-Fi will not re-arm after giving up");
    }
    if (!s_publisher.start()) {
        LOG_ERROR(TAG, "%s", "Telemetry publisher could not be started");
        return;
    }

    // Session counters are worker-owned; report them from there
    for (;;) {
        vTaskDelay(pdMS_TO_TICKS(kStatusPeriodMs));
        if (!s_worker.post(logStatus, 0, WorkQueue::NO_TAG)) {
            LOG_WARN(TAG, "%s", "Status report could not be queued");
        }
    }
}
