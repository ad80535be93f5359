#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstdint>
#include <main/secrets.hpp>

namespace Config {
namespace Wifi {
    // Network credentials sourced from secrets.hpp (git-ignored)
    static constexpr const char* ssid = Secrets::WIFI_SSID;
    static constexpr const char* password = Secrets::WIFI_PASSWORD;

    static constexpr bool auto_connect_on_start = true;
    static constexpr int max_retry_count = 5;           // Reconnect attempts before waiting for the next trigger
    static constexpr uint32_t ip_wait_timeout_ms = 30000;
}

namespace Device {
    // MQTT client id of this bridge
    static constexpr const char* id = "colorsorter-sensor-01";

    // SensorTag polled when NVS holds no override
    static constexpr const char* default_target_mac = "98:07:2D:27:F1:86";

    // Deployment site and asset naming
    static constexpr const char* location_id = "Labor_ColorSorter_Umgebung";
    static constexpr const char* asset_prefix = "TI-SensorTag-";
    static constexpr unsigned asset_suffix_digits = 6;
}

namespace Ble {
    static constexpr uint32_t connect_timeout_ms = 10000;
    // Extra wait past the controller connect timeout before giving up
    static constexpr uint32_t connect_grace_ms = 1000;
    static constexpr uint32_t gatt_timeout_ms = 5000;
    static constexpr uint32_t terminate_timeout_ms = 2000;
    // Blocking BLE waits feed the task watchdog at least this often
    static constexpr uint32_t feed_slice_ms = 1000;

    // Whole-sequence retry on link loss
    static constexpr uint8_t max_retries = 1;
    static constexpr uint32_t retry_delay_ms = 1000;

    // SensorTag sensors are enabled by writing 0x01 to their config register
    static constexpr uint8_t sensor_enable = 0x01;
}

namespace Tasks {
namespace Acquisition {
    static constexpr uint32_t period_ms = 60000;
    static constexpr uint32_t stack_bytes = 6144;
    static constexpr unsigned priority_above_idle = 2;
    // Long waits are split so the task watchdog keeps being fed
    static constexpr uint32_t wait_slice_ms = 2000;

    // Longest stretch a cancel can wait for: a connect that runs into its
    // timeout, the next activation (handle discovery + write), then release
    static constexpr uint32_t shutdown_timeout_ms =
        Ble::connect_timeout_ms + Ble::connect_grace_ms + 2 * Ble::gatt_timeout_ms +
        Ble::terminate_timeout_ms + 1000;
}
}

namespace Watchdog {
    static constexpr uint32_t timeout_ms = 15000;
}

namespace Time {
    static constexpr uint32_t sync_timeout_ms = 10000;
}

namespace Storage {
    static constexpr const char* nvs_namespace = "bridge";
    static constexpr const char* target_mac_key = "target_mac";
}

// Feature toggles to enable/disable subsystems at build time
namespace Features {
    static constexpr bool enable_watchdog = true;
}

namespace Mqtt {
    // Broker endpoint (from secrets)
    static constexpr const char* host = Secrets::MQTT_HOST;
    static constexpr int port = Secrets::MQTT_PORT;

    // Session behavior
    static constexpr bool clean_session = true;
    static constexpr uint16_t keepalive_seconds = 60;

    // Measurements are published fire-and-forget and kept as last value
    static constexpr int telemetry_qos = 0;
    static constexpr bool telemetry_retain = true;

    static constexpr const char* topic_root = "Factory/ColorSorter/ConditionMonitoring";

    // LWT: retained "offline" on {topic_root}/status, "online" after connect
    static constexpr bool lwt_enable = true;
    static constexpr const char* status_suffix = "status";
}
}

#endif // CONFIG_HPP
