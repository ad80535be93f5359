// Identifier of a GATT characteristic, either a SIG-assigned 16-bit UUID
// or a full 128-bit vendor UUID stored little-endian as sent over the air.
#ifndef GATT_UUID_HPP
#define GATT_UUID_HPP

#include <cstdint>
#include <cstring>

struct GattUuid {
    bool     is_short;
    uint16_t short_value;
    uint8_t  value[16];

    // 16-bit alias used in logs (for TI UUIDs the XXXX in f000XXXX-...)
    uint16_t alias() const {
        if (is_short) {
            return short_value;
        }
        return static_cast<uint16_t>(value[12] | (value[13] << 8));
    }

    bool operator==(const GattUuid& other) const {
        if (is_short != other.is_short) {
            return false;
        }
        if (is_short) {
            return short_value == other.short_value;
        }
        return std::memcmp(value, other.value, sizeof(value)) == 0;
    }

    bool operator!=(const GattUuid& other) const {
        return !(*this == other);
    }
};

// Bluetooth SIG assigned number, e.g. 0x2A19 Battery Level
constexpr GattUuid sigUuid(uint16_t short_value) {
    return GattUuid{true, short_value, {}};
}

// TI SensorTag vendor base f000XXXX-0451-4000-b000-000000000000
constexpr GattUuid sensorTagUuid(uint16_t alias) {
    return GattUuid{false, 0,
                    {0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xB0,
                     0x00, 0x40, 0x51, 0x04,
                     static_cast<uint8_t>(alias & 0xFF), static_cast<uint8_t>(alias >> 8),
                     0x00, 0xF0}};
}

#endif // GATT_UUID_HPP
