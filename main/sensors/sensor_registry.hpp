#ifndef SENSOR_REGISTRY_HPP
#define SENSOR_REGISTRY_HPP

#include <cstddef>
#include <main/models/raw_sample.hpp>
#include <main/models/sensor_descriptor.hpp>

// Read-only ordered view over a table of sensor descriptors. The order is
// the read order within one acquisition cycle.
class SensorRegistry {
public:
    // The table must outlive the registry; at most kMaxSensors entries are used.
    SensorRegistry(const SensorDescriptor* descriptors, std::size_t count);

    // Temperature, Humidity, Illuminance, Pressure, Battery Level
    static const SensorRegistry& sensorTag();

    std::size_t size() const { return count; }
    const SensorDescriptor& at(std::size_t index) const { return descriptors[index]; }
    const SensorDescriptor* begin() const { return descriptors; }
    const SensorDescriptor* end() const { return descriptors + count; }

    // nullptr if the kind is not registered
    const SensorDescriptor* find(SensorKind kind) const;

    // Number of consecutive entries starting at index that are served by the
    // same activation and data read (e.g. HDC1000 temperature + humidity).
    std::size_t groupLength(std::size_t index) const;

    static bool sharesRead(const SensorDescriptor& a, const SensorDescriptor& b);

private:
    const SensorDescriptor* descriptors;
    std::size_t count;
};

#endif // SENSOR_REGISTRY_HPP
