#include <main/utils/watchdog.hpp>
#include <main/utils/logger.hpp>
#include <esp_task_wdt.h>

namespace {
    static const char* TAG = "WATCHDOG";
}

namespace Watchdog {
    void init(uint32_t timeout_ms) {
        esp_task_wdt_config_t config = {
            .timeout_ms = timeout_ms,
            .idle_core_mask = 0,
            .trigger_panic = true
        };
        esp_err_t err = esp_task_wdt_reconfigure(&config);
        if (err == ESP_ERR_INVALID_STATE) {
            // TWDT not started by sdkconfig
            err = esp_task_wdt_init(&config);
        }
        if (err == ESP_OK) {
            LOG_INFO(TAG, "TWDT configured: %lu ms timeout", static_cast<unsigned long>(timeout_ms));
        } else {
            LOG_ERROR(TAG, "TWDT config failed: %d", static_cast<int>(err));
        }
    }

    void subscribe() {
        esp_err_t err = esp_task_wdt_add(nullptr);
        if (err != ESP_OK) {
            LOG_WARN(TAG, "TWDT subscribe failed: %d", static_cast<int>(err));
        }
    }

    void unsubscribe() {
        esp_err_t err = esp_task_wdt_delete(nullptr);
        if (err != ESP_OK) {
            LOG_WARN(TAG, "TWDT unsubscribe failed: %d", static_cast<int>(err));
        }
    }

    void feed() {
        // ESP_ERR_NOT_FOUND just means the caller never subscribed
        (void)esp_task_wdt_reset();
    }
}
