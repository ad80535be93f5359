#ifndef BLE_STATUS_HPP
#define BLE_STATUS_HPP

#include <cstdint>

// Outcome of one BLE link operation. DISCONNECTED is the only class that
// triggers a reconnect; everything else aborts the cycle.
enum class BleStatus : uint8_t {
    OK           = 0,
    DISCONNECTED = 1,
    NOT_FOUND    = 2,   // characteristic not present on the peer
    TIMEOUT      = 3,   // link still up but the peer did not answer
    FAILED       = 4,
};

inline const char* bleStatusName(BleStatus status) {
    switch (status) {
        case BleStatus::OK:           return "ok";
        case BleStatus::DISCONNECTED: return "disconnected";
        case BleStatus::NOT_FOUND:    return "not_found";
        case BleStatus::TIMEOUT:      return "timeout";
        case BleStatus::FAILED:       return "failed";
    }
    return "unknown";
}

#endif // BLE_STATUS_HPP
