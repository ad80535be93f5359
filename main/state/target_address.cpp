#include <main/state/target_address.hpp>
#include <main/config/config.hpp>
#include <main/utils/logger.hpp>
#include <nvs_flash.h>
#include <nvs.h>
#include <cctype>
#include <cstdio>
#include <cstring>

static const char* TAG = "TARGET_ADDR";

namespace TargetAddress {
    bool isValid(const char* address) {
        if (address == nullptr || std::strlen(address) != LENGTH) {
            return false;
        }
        for (std::size_t i = 0; i < LENGTH; ++i) {
            const unsigned char c = static_cast<unsigned char>(address[i]);
            if (i % 3 == 2) {
                if (c != ':') {
                    return false;
                }
            } else if (!std::isxdigit(c)) {
                return false;
            }
        }
        return true;
    }

    void load(char* out, std::size_t out_size) {
        std::snprintf(out, out_size, "%s", Config::Device::default_target_mac);

        nvs_handle_t handle;
        esp_err_t err = nvs_open(Config::Storage::nvs_namespace, NVS_READONLY, &handle);
        if (err != ESP_OK) {
            LOG_INFO(TAG, "No stored target, using default %s", out);
            return;
        }
        char stored[LENGTH + 1] = {0};
        size_t required_size = sizeof(stored);
        err = nvs_get_str(handle, Config::Storage::target_mac_key, stored, &required_size);
        nvs_close(handle);

        if (err != ESP_OK) {
            LOG_INFO(TAG, "No stored target (%d), using default %s", static_cast<int>(err), out);
            return;
        }
        if (!isValid(stored)) {
            LOG_WARN(TAG, "Ignoring malformed stored target '%s'", stored);
            return;
        }
        std::snprintf(out, out_size, "%s", stored);
        LOG_INFO(TAG, "Using stored target %s", out);
    }
}
