#include <main/network/wifi_manager.hpp>
#include <main/utils/logger.hpp>
#include <main/config/config.hpp>

#include <esp_err.h>
#include <cstdio>

static const char* TAG = "WiFiManager";

namespace {
    static constexpr EventBits_t GOT_IP_BIT = BIT0;

    static bool check(esp_err_t err, const char* what) {
        if (err != ESP_OK) {
            LOG_ERROR(TAG, "%s failed: %d", what, static_cast<int>(err));
            return false;
        }
        return true;
    }
}

WiFiManager::WiFiManager()
    : initialized(false),
      retry_count(0),
      state_group_buffer(),
      state_group(nullptr),
      wifi_any_id_instance(nullptr),
      ip_got_ip_instance(nullptr) {}

bool WiFiManager::init() {
    if (initialized) {
        return true;
    }
    state_group = xEventGroupCreateStatic(&state_group_buffer);

    if (!check(esp_netif_init(), "esp_netif_init")) {
        return false;
    }
    esp_netif_create_default_wifi_sta();

    wifi_init_config_t cfg = WIFI_INIT_CONFIG_DEFAULT();
    if (!check(esp_wifi_init(&cfg), "esp_wifi_init")) {
        return false;
    }
    if (!check(esp_event_handler_instance_register(WIFI_EVENT, ESP_EVENT_ANY_ID,
                                                   &WiFiManager::wifiEventHandler, this,
                                                   &wifi_any_id_instance),
               "register WIFI_EVENT")) {
        return false;
    }
    if (!check(esp_event_handler_instance_register(IP_EVENT, IP_EVENT_STA_GOT_IP,
                                                   &WiFiManager::ipEventHandler, this,
                                                   &ip_got_ip_instance),
               "register IP_EVENT")) {
        return false;
    }
    if (!check(esp_wifi_set_mode(WIFI_MODE_STA), "esp_wifi_set_mode")) {
        return false;
    }

    wifi_config_t wifi_config = {};
    std::snprintf(reinterpret_cast<char*>(wifi_config.sta.ssid),
                  sizeof(wifi_config.sta.ssid), "%s", Config::Wifi::ssid);
    std::snprintf(reinterpret_cast<char*>(wifi_config.sta.password),
                  sizeof(wifi_config.sta.password), "%s", Config::Wifi::password);
    wifi_config.sta.threshold.authmode = WIFI_AUTH_WPA2_PSK;
    wifi_config.sta.pmf_cfg.capable = true;
    wifi_config.sta.pmf_cfg.required = false;

    if (!check(esp_wifi_set_config(WIFI_IF_STA, &wifi_config), "esp_wifi_set_config")) {
        return false;
    }
    // Coexistence with the BLE central needs modem sleep enabled
    if (!check(esp_wifi_set_ps(WIFI_PS_MIN_MODEM), "esp_wifi_set_ps")) {
        return false;
    }
    if (!check(esp_wifi_start(), "esp_wifi_start")) {
        return false;
    }
    initialized = true;
    return true;
}

bool WiFiManager::connect() {
    if (!initialized && !init()) {
        return false;
    }
    retry_count = 0;
    xEventGroupClearBits(state_group, GOT_IP_BIT);
    if (!check(esp_wifi_connect(), "esp_wifi_connect")) {
        return false;
    }
    LOG_INFO(TAG, "Connecting to SSID: %s", Config::Wifi::ssid);
    return true;
}

bool WiFiManager::reconnect() {
    esp_err_t err = esp_wifi_disconnect();
    if (err != ESP_OK && err != ESP_ERR_WIFI_NOT_CONNECT) {
        LOG_WARN(TAG, "esp_wifi_disconnect: %d", static_cast<int>(err));
    }
    return connect();
}

bool WiFiManager::waitForIp(uint32_t timeout_ms) {
    if (state_group == nullptr) {
        return false;
    }
    EventBits_t bits = xEventGroupWaitBits(state_group, GOT_IP_BIT, pdFALSE, pdTRUE, pdMS_TO_TICKS(timeout_ms));
    return (bits & GOT_IP_BIT) != 0;
}

bool WiFiManager::hasIp() const {
    return state_group != nullptr && (xEventGroupGetBits(state_group) & GOT_IP_BIT) != 0;
}

void WiFiManager::wifiEventHandler(void* arg, esp_event_base_t, int32_t event_id, void*) {
    WiFiManager* self = static_cast<WiFiManager*>(arg);
    switch (event_id) {
        case WIFI_EVENT_STA_START:
            LOG_INFO(TAG, "%s", "WIFI_EVENT_STA_START");
            if (Config::Wifi::auto_connect_on_start) {
                (void)check(esp_wifi_connect(), "esp_wifi_connect");
            }
            break;
        case WIFI_EVENT_STA_DISCONNECTED:
            xEventGroupClearBits(self->state_group, GOT_IP_BIT);
            if (self->retry_count < Config::Wifi::max_retry_count) {
                self->retry_count++;
                LOG_WARN(TAG, "Disconnected, retrying (%d/%d)", self->retry_count, Config::Wifi::max_retry_count);
                (void)check(esp_wifi_connect(), "esp_wifi_connect");
            } else {
                LOG_ERROR(TAG, "WiFi connect failed after %d retries", Config::Wifi::max_retry_count);
            }
            break;
        default:
            break;
    }
}

void WiFiManager::ipEventHandler(void* arg, esp_event_base_t, int32_t event_id, void*) {
    WiFiManager* self = static_cast<WiFiManager*>(arg);
    if (event_id == IP_EVENT_STA_GOT_IP) {
        self->retry_count = 0;
        xEventGroupSetBits(self->state_group, GOT_IP_BIT);
        LOG_INFO(TAG, "%s", "Got IP address");
    }
}
