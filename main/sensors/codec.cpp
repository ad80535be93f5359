#include <main/sensors/codec.hpp>
#include <cmath>

namespace {
    static bool checkLength(SensorKind kind, std::size_t expected, std::size_t length, DecodeError& error) {
        if (length == expected) {
            return true;
        }
        error.kind = kind;
        error.received_length = length;
        error.expected_length = expected;
        return false;
    }

    static uint16_t readU16Le(const uint8_t* p) {
        return static_cast<uint16_t>(p[0] | (p[1] << 8));
    }

    static uint16_t readU16Be(const uint8_t* p) {
        return static_cast<uint16_t>((p[0] << 8) | p[1]);
    }

    static uint32_t readU24Le(const uint8_t* p) {
        return static_cast<uint32_t>(p[0]) |
               (static_cast<uint32_t>(p[1]) << 8) |
               (static_cast<uint32_t>(p[2]) << 16);
    }

    static constexpr uint16_t HDC_STATUS_MASK = 0x0003;
    static constexpr std::size_t BMP_PRESSURE_OFFSET = 3;
}

namespace Codec {
    double roundTo2(double value) {
        // Default FE_TONEAREST: exact halves go to the even neighbour
        return std::nearbyint(value * 100.0) / 100.0;
    }

    bool decodeTemperature(const uint8_t* raw, std::size_t length, double& out_celsius, DecodeError& error) {
        if (!checkLength(SensorKind::TEMPERATURE, HDC1000_LENGTH, length, error)) {
            return false;
        }
        const uint16_t raw_temp = readU16Le(raw);
        out_celsius = roundTo2((static_cast<double>(raw_temp) / 65536.0) * 165.0 - 40.0);
        return true;
    }

    bool decodeHumidity(const uint8_t* raw, std::size_t length, double& out_percent, DecodeError& error) {
        if (!checkLength(SensorKind::HUMIDITY, HDC1000_LENGTH, length, error)) {
            return false;
        }
        const uint16_t raw_hum = static_cast<uint16_t>(readU16Le(raw + 2) & ~HDC_STATUS_MASK);
        out_percent = roundTo2((static_cast<double>(raw_hum) / 65536.0) * 100.0);
        return true;
    }

    bool decodeIlluminance(const uint8_t* raw, std::size_t length, double& out_lux, DecodeError& error) {
        if (!checkLength(SensorKind::ILLUMINANCE, OPT3001_LENGTH, length, error)) {
            return false;
        }
        const uint16_t word = readU16Be(raw);
        const uint32_t exponent = (word >> 12) & 0x0F;
        const uint32_t mantissa = word & 0x0FFF;
        // mantissa * 2^exponent is exact, so the 0.01 scale only happens once
        out_lux = roundTo2(static_cast<double>(mantissa << exponent) / 100.0);
        return true;
    }

    bool decodePressure(const uint8_t* raw, std::size_t length, double& out_hpa, DecodeError& error) {
        if (!checkLength(SensorKind::PRESSURE, BMP280_LENGTH, length, error)) {
            return false;
        }
        const uint32_t value = readU24Le(raw + BMP_PRESSURE_OFFSET);
        out_hpa = roundTo2(static_cast<double>(value) / 100.0);
        return true;
    }

    bool decodeBatteryLevel(const uint8_t* raw, std::size_t length, double& out_percent, DecodeError& error) {
        if (!checkLength(SensorKind::BATTERY, BATTERY_LENGTH, length, error)) {
            return false;
        }
        out_percent = static_cast<double>(raw[0]);
        return true;
    }
}
