#include <main/utils/time_sync.hpp>
#include <main/utils/logger.hpp>

#include <ctime>
#include <esp_sntp.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

namespace {
    static const char* TAG = "TIME_SYNC";
    static bool s_inited = false;

    // Anything before 2026-01-01T00:00:00Z means the RTC was never set
    static constexpr std::time_t EARLIEST_VALID_EPOCH = 1767225600;

    static bool timeIsReasonable() {
        return std::time(nullptr) >= EARLIEST_VALID_EPOCH;
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
        esp_sntp_set_time_sync_notification_cb([](struct timeval*) {
            LOG_INFO(TAG, "%s", "SNTP time synchronized");
        });
        esp_sntp_init();
        s_inited = true;
        LOG_INFO(TAG, "%s", "SNTP initialized");
    }

    bool isSynced() {
        if (!s_inited) {
            return false;
        }
        if (timeIsReasonable()) {
            return true;
        }
        return sntp_get_sync_status() == SNTP_SYNC_STATUS_COMPLETED;
    }

    bool waitForSync(uint32_t timeout_ms) {
        if (!s_inited) {
            init();
        }
        LOG_INFO(TAG, "Waiting for time sync (up to %lu ms)", static_cast<unsigned long>(timeout_ms));
        const uint32_t interval_ms = 100;
        uint32_t waited = 0;
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
            LOG_WARN(TAG, "%s", "Time sync timeout; timestamps stay near 1970 until SNTP answers");
        }
        return ok;
    }
}
