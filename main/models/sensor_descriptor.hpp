#ifndef SENSOR_DESCRIPTOR_HPP
#define SENSOR_DESCRIPTOR_HPP

#include <cstddef>
#include <cstdint>
#include <main/models/acquisition_error.hpp>
#include <main/models/gatt_uuid.hpp>
#include <main/models/sensor_kind.hpp>

// Pure raw-to-physical mapping. Returns false and fills error when the
// buffer length does not match the layout; never reads past length.
using DecodeFn = bool (*)(const uint8_t* raw, std::size_t length, double& out_value, DecodeError& error);

static constexpr std::size_t kMaxActivationLength = 4;

struct SensorDescriptor {
    SensorKind  kind;
    uint8_t     activation[kMaxActivationLength];
    std::size_t activation_length;    // 0: characteristic is always readable
    GattUuid    config_char;
    GattUuid    data_char;
    uint32_t    settle_ms;
    const char* unit;                 // UN/CEFACT common code
    std::size_t expected_length;
    DecodeFn    decode;

    bool needsActivation() const { return activation_length > 0; }
};

#endif // SENSOR_DESCRIPTOR_HPP
