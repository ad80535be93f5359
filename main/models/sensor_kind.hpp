#ifndef SENSOR_KIND_HPP
#define SENSOR_KIND_HPP

#include <cstdint>

enum class SensorKind : uint8_t {
    TEMPERATURE = 0,
    HUMIDITY    = 1,
    PRESSURE    = 2,
    ILLUMINANCE = 3,
    BATTERY     = 4,
};

// Sensor type code as published (may contain spaces, e.g. "Battery Level")
inline const char* sensorTypeName(SensorKind kind) {
    switch (kind) {
        case SensorKind::TEMPERATURE: return "Temperature";
        case SensorKind::HUMIDITY:    return "Humidity";
        case SensorKind::PRESSURE:    return "Pressure";
        case SensorKind::ILLUMINANCE: return "Illuminance";
        case SensorKind::BATTERY:     return "Battery Level";
    }
    return "Unknown";
}

#endif // SENSOR_KIND_HPP
