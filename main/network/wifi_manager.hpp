#ifndef WIFI_MANAGER_HPP
#define WIFI_MANAGER_HPP

#include <cstdint>
#include <esp_wifi.h>
#include <esp_event.h>
#include <esp_netif.h>
#include <freertos/FreeRTOS.h>
#include <freertos/event_groups.h>

// Station-mode Wi-Fi uplink for the broker connection. Expects NVS and the
// default event loop to be initialized by app_main.
class WiFiManager {
public:
    WiFiManager();

    bool init();
    bool connect();
    bool reconnect();

    // Blocks until an IP is assigned or timeout_ms elapses
    bool waitForIp(uint32_t timeout_ms);

    bool hasIp() const;

private:
    static void wifiEventHandler(void* arg, esp_event_base_t event_base, int32_t event_id, void* event_data);
    static void ipEventHandler(void* arg, esp_event_base_t event_base, int32_t event_id, void* event_data);

    bool initialized;
    int retry_count;

    StaticEventGroup_t state_group_buffer;
    EventGroupHandle_t state_group;

    esp_event_handler_instance_t wifi_any_id_instance;
    esp_event_handler_instance_t ip_got_ip_instance;
};

#endif // WIFI_MANAGER_HPP
