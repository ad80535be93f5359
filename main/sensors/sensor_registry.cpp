#include <main/sensors/sensor_registry.hpp>
#include <main/sensors/codec.hpp>
#include <main/config/config.hpp>
#include <main/utils/logger.hpp>
#include <cstring>

static const char* TAG = "SensorRegistry";

namespace {
    using Config::Ble::sensor_enable;

    // GATT layout of the CC2650 SensorTag firmware
    static constexpr GattUuid HUMIDITY_DATA = sensorTagUuid(0xAA21);
    static constexpr GattUuid HUMIDITY_CONF = sensorTagUuid(0xAA22);
    static constexpr GattUuid BAROMETER_DATA = sensorTagUuid(0xAA41);
    static constexpr GattUuid BAROMETER_CONF = sensorTagUuid(0xAA42);
    static constexpr GattUuid OPTICAL_DATA = sensorTagUuid(0xAA71);
    static constexpr GattUuid OPTICAL_CONF = sensorTagUuid(0xAA72);
    static constexpr GattUuid BATTERY_LEVEL = sigUuid(0x2A19);

    static const SensorDescriptor kSensorTagTable[] = {
        {SensorKind::TEMPERATURE, {sensor_enable}, 1, HUMIDITY_CONF, HUMIDITY_DATA,
         1800, "CEL", Codec::HDC1000_LENGTH, &Codec::decodeTemperature},
        {SensorKind::HUMIDITY, {sensor_enable}, 1, HUMIDITY_CONF, HUMIDITY_DATA,
         1800, "P1", Codec::HDC1000_LENGTH, &Codec::decodeHumidity},
        {SensorKind::ILLUMINANCE, {sensor_enable}, 1, OPTICAL_CONF, OPTICAL_DATA,
         800, "LUX", Codec::OPT3001_LENGTH, &Codec::decodeIlluminance},
        {SensorKind::PRESSURE, {sensor_enable}, 1, BAROMETER_CONF, BAROMETER_DATA,
         1000, "A97", Codec::BMP280_LENGTH, &Codec::decodePressure},
        {SensorKind::BATTERY, {}, 0, BATTERY_LEVEL, BATTERY_LEVEL,
         0, "P1", Codec::BATTERY_LENGTH, &Codec::decodeBatteryLevel},
    };
}

SensorRegistry::SensorRegistry(const SensorDescriptor* descriptors, std::size_t count)
    : descriptors(descriptors),
      count(count) {
    if (count > kMaxSensors) {
        LOG_ERROR(TAG, "Table has %u entries, only the first %u are used",
                  static_cast<unsigned>(count), static_cast<unsigned>(kMaxSensors));
        this->count = kMaxSensors;
    }
}

const SensorRegistry& SensorRegistry::sensorTag() {
    static const SensorRegistry registry(kSensorTagTable, sizeof(kSensorTagTable) / sizeof(kSensorTagTable[0]));
    return registry;
}

const SensorDescriptor* SensorRegistry::find(SensorKind kind) const {
    for (const SensorDescriptor& d : *this) {
        if (d.kind == kind) {
            return &d;
        }
    }
    return nullptr;
}

bool SensorRegistry::sharesRead(const SensorDescriptor& a, const SensorDescriptor& b) {
    return a.data_char == b.data_char &&
           a.config_char == b.config_char &&
           a.activation_length == b.activation_length &&
           std::memcmp(a.activation, b.activation, a.activation_length) == 0 &&
           a.settle_ms == b.settle_ms;
}

std::size_t SensorRegistry::groupLength(std::size_t index) const {
    if (index >= count) {
        return 0;
    }
    std::size_t length = 1;
    while (index + length < count && sharesRead(descriptors[index], descriptors[index + length])) {
        ++length;
    }
    return length;
}
