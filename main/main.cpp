#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <esp_event.h>
#include <esp_system.h>
#include <nvs_flash.h>
#include <main/utils/logger.hpp>
#include <main/utils/esp_log_sink.hpp>
#include <main/utils/clock.hpp>
#include <main/utils/time_sync.hpp>
#include <main/utils/watchdog.hpp>
#include <main/config/config.hpp>
#include <main/ble/device_session.hpp>
#include <main/ble/nimble_link.hpp>
#include <main/network/mqtt_client.hpp>
#include <main/network/publisher.hpp>
#include <main/network/wifi_manager.hpp>
#include <main/pipeline/acquisition_loop.hpp>
#include <main/pipeline/batch_builder.hpp>
#include <main/sensors/sensor_registry.hpp>
#include <main/state/target_address.hpp>
#include <main/tasks/acquisition_task.hpp>
#include <main/tasks/rtos_scheduler.hpp>

namespace {
    static constexpr uint32_t BLE_SYNC_TIMEOUT_MS = 5000;

    static void onShutdown() {
        // esp_restart(): let an in-flight session release its link first
        if (!AcquisitionTask::stop(Config::Tasks::Acquisition::shutdown_timeout_ms)) {
            LOG_WARN("MAIN", "%s", "Restarting with a BLE session still open");
        }
    }
}

extern "C" void app_main(void)
{
    EspLogSink::install();
    Logger::setLevel(LogLevel::INFO);
    LOG_INFO("MAIN", "%s", "---SensorTag bridge started---");

    esp_err_t err = nvs_flash_init();
    if (err == ESP_ERR_NVS_NO_FREE_PAGES || err == ESP_ERR_NVS_NEW_VERSION_FOUND) {
        ESP_ERROR_CHECK(nvs_flash_erase());
        err = nvs_flash_init();
    }
    if (err != ESP_OK) {
        LOG_ERROR("MAIN", "NVS init failed: %d", static_cast<int>(err));
    }
    err = esp_event_loop_create_default();
    if (err != ESP_OK && err != ESP_ERR_INVALID_STATE) {
        LOG_ERROR("MAIN", "Event loop create failed: %d", static_cast<int>(err));
        return;
    }

    if (Config::Features::enable_watchdog) {
        Watchdog::init(Config::Watchdog::timeout_ms);
    }

    // Uplink first so the first batch already carries SNTP time
    static WiFiManager s_wifi;
    if (!s_wifi.init()) {
        LOG_ERROR("MAIN", "%s", "WiFi init failed");
    } else if (s_wifi.waitForIp(Config::Wifi::ip_wait_timeout_ms)) {
        TimeSync::init();
        (void)TimeSync::waitForSync(Config::Time::sync_timeout_ms);
    } else {
        LOG_WARN("MAIN", "%s", "No IP yet; publishing starts once the uplink is up");
    }

    static MqttClient s_mqtt;
    if (!s_mqtt.connect()) {
        LOG_ERROR("MAIN", "%s", "MQTT client start failed; measurements will not be published");
    }

    static NimbleLink s_ble;
    if (!s_ble.startHost(BLE_SYNC_TIMEOUT_MS)) {
        LOG_ERROR("MAIN", "%s", "BLE host unavailable, nothing to poll");
        return;
    }

    static char s_target[TargetAddress::LENGTH + 1];
    TargetAddress::load(s_target, sizeof(s_target));

    char asset_id[32];
    if (!BatchBuilder::assetIdFromAddress(s_target, asset_id, sizeof(asset_id))) {
        LOG_ERROR("MAIN", "Cannot derive asset id from %s", s_target);
        return;
    }

    static SystemClock s_clock;
    static RtosScheduler s_scheduler(Config::Tasks::Acquisition::wait_slice_ms);
    static DeviceSession s_session(s_ble, s_scheduler, s_clock, SensorRegistry::sensorTag());
    static BatchBuilder s_builder(asset_id, Config::Device::location_id);
    static Publisher s_publisher(s_mqtt);
    static AcquisitionLoop s_loop(s_session, s_builder, s_publisher, s_scheduler, s_target,
                                  Config::Tasks::Acquisition::period_ms);

    LOG_INFO("MAIN", "Asset %s at %s", s_builder.assetId(), s_builder.locationId());
    AcquisitionTask::create(s_loop, s_scheduler);

    err = esp_register_shutdown_handler(&onShutdown);
    if (err != ESP_OK) {
        LOG_WARN("MAIN", "Shutdown handler not registered: %d", static_cast<int>(err));
    }

    // Main task has nothing to do after initialization
    for (;;) {
        vTaskDelay(portMAX_DELAY);
    }
}
