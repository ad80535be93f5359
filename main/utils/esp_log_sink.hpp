#ifndef ESP_LOG_SINK_HPP
#define ESP_LOG_SINK_HPP

#include <esp_log.h>

namespace EspLogSink {
    // Route Logger output through ESP-IDF esp_log (call once from app_main)
    void install();
}

#endif // ESP_LOG_SINK_HPP
