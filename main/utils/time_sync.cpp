#include <main/utils/time_sync.hpp>
#include <main/utils/logger.hpp>

#include <ctime>
#include <sys/time.h>
#include <esp_sntp.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

namespace {
    static const char* TAG = "TIME_SYNC";
    static bool s_inited = false;

    // 2024-01-01 00:00:00 UTC; anything earlier means the RTC was never set
    static constexpr time_t kEarliestValidEpoch = 1704067200;

    static bool timeIsReasonable() {
        time_t now = 0;
        time(&now);
        return now >= kEarliestValidEpoch;
    }

    static void onTimeSynced(struct timeval* tv) {
        LOG_INFO(TAG, "SNTP time synchronized (epoch %lld)", static_cast<long long>(tv->tv_sec));
    }
}

namespace TimeSync {
    void init() {
        if (s_inited) {
            return;
        }
        esp_sntp_setoperatingmode(ESP_SNTP_OPMODE_POLL);
        esp_sntp_setservername(0, "pool.ntp.org");
        esp_sntp_setservername(1, "time.google.com");
        esp_sntp_set_time_sync_notification_cb(&onTimeSynced);
        esp_sntp_init();
        s_inited = true;
        LOG_INFO(TAG, "%s", "SNTP initialized");
    }

    bool isSynced() {
        if (timeIsReasonable()) {
            return true;
        }
        if (!s_inited) {
            return false;
        }
        return sntp_get_sync_status() == SNTP_SYNC_STATUS_COMPLETED;
    }

    bool waitForSync(unsigned int timeout_ms) {
        if (!s_inited) {
            init();
        }
        LOG_INFO(TAG, "Waiting for time sync (up to %u ms)", timeout_ms);
        const unsigned int interval_ms = 100;
        unsigned int waited = 0;
        while (waited < timeout_ms) {
            if (isSynced()) {
                LOG_INFO(TAG, "%s", "Time sync OK");
                return true;
            }
            vTaskDelay(pdMS_TO_TICKS(interval_ms));
            waited += interval_ms;
        }
        bool ok = isSynced();
        if (!ok) {
            LOG_WARN(TAG, "%s", "Time sync timeout; telemetry timestamps will be relative to boot");
        }
        return ok;
    }

    int64_t nowEpochMs() {
        struct timeval tv = {};
        gettimeofday(&tv, nullptr);
        return static_cast<int64_t>(tv.tv_sec) * 1000LL + static_cast<int64_t>(tv.tv_usec) / 1000LL;
    }
}
