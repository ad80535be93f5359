#ifndef BLE_LINK_HPP
#define BLE_LINK_HPP

#include <cstddef>
#include <cstdint>
#include <main/models/ble_status.hpp>
#include <main/models/gatt_uuid.hpp>

// One BLE central connection to a GATT peripheral. Operations block until
// the peer answers or the implementation's timeout expires.
class BleLink {
public:
    virtual ~BleLink() = default;

    // address: "AA:BB:CC:DD:EE:FF"
    virtual BleStatus connect(const char* address) = 0;

    virtual BleStatus write(const GattUuid& characteristic, const uint8_t* data, std::size_t length,
                            bool with_response) = 0;

    // out_length receives the full value length reported by the peer; at most
    // capacity bytes are copied to out.
    virtual BleStatus read(const GattUuid& characteristic, uint8_t* out, std::size_t capacity,
                           std::size_t& out_length) = 0;

    // Idempotent; safe after the peer already dropped the link
    virtual void disconnect() = 0;
};

#endif // BLE_LINK_HPP
