// Raw characteristic value decoders for the CC2650 SensorTag sensors.
// All functions are pure and validate the exact buffer length first.
#ifndef CODEC_HPP
#define CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <main/models/acquisition_error.hpp>

namespace Codec {
    // Layout lengths in bytes
    static constexpr std::size_t HDC1000_LENGTH = 4;   // <temp:u16le><humidity:u16le>
    static constexpr std::size_t OPT3001_LENGTH = 2;   // <exp:4|mantissa:12> u16be
    static constexpr std::size_t BMP280_LENGTH  = 6;   // <compensation:3><pressure:u24le>
    static constexpr std::size_t BATTERY_LENGTH = 1;

    // Round to 2 decimals, exact halves to even
    double roundTo2(double value);

    // HDC1000: (raw / 65536) * 165 - 40 degrees Celsius
    bool decodeTemperature(const uint8_t* raw, std::size_t length, double& out_celsius, DecodeError& error);

    // HDC1000: ((raw & ~0b11) / 65536) * 100 %RH; low 2 bits are status flags
    bool decodeHumidity(const uint8_t* raw, std::size_t length, double& out_percent, DecodeError& error);

    // OPT3001: mantissa * 0.01 * 2^exponent lux
    bool decodeIlluminance(const uint8_t* raw, std::size_t length, double& out_lux, DecodeError& error);

    // BMP280: value / 100 hPa
    bool decodePressure(const uint8_t* raw, std::size_t length, double& out_hpa, DecodeError& error);

    // Battery Level characteristic, percent as-is
    bool decodeBatteryLevel(const uint8_t* raw, std::size_t length, double& out_percent, DecodeError& error);
}

#endif // CODEC_HPP
