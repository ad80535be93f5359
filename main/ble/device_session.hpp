#ifndef DEVICE_SESSION_HPP
#define DEVICE_SESSION_HPP

#include <cstdint>
#include <main/ble/ble_link.hpp>
#include <main/config/config.hpp>
#include <main/models/acquisition_error.hpp>
#include <main/models/raw_sample.hpp>
#include <main/sensors/sensor_registry.hpp>
#include <main/utils/clock.hpp>
#include <main/utils/scheduler.hpp>

// Retry of the whole read sequence after the link dropped
struct RetryPolicy {
    uint8_t  max_retries = Config::Ble::max_retries;
    uint32_t retry_delay_ms = Config::Ble::retry_delay_ms;
};

// Runs activate -> settle -> read for every registry entry over one BLE link.
// Each attempt opens its own link and releases it before returning, whatever
// the outcome. A dropped link restarts the whole sequence (partial samples
// are discarded) up to policy.max_retries times.
class DeviceSession {
public:
    DeviceSession(BleLink& link, Scheduler& scheduler, const Clock& clock,
                  const SensorRegistry& registry, RetryPolicy policy = RetryPolicy());

    // On success out holds one sample per registry entry, in order.
    // On failure out is empty and error describes the cause.
    bool acquire(const char* address, SampleSet& out, AcquisitionError& error);

private:
    bool attempt(const char* address, SampleSet& out, AcquisitionError& error);
    bool readGroup(std::size_t first, std::size_t length, SampleSet& out, AcquisitionError& error);

    static ErrorKind classify(BleStatus status);

    BleLink& link;
    Scheduler& scheduler;
    const Clock& clock;
    const SensorRegistry& registry;
    RetryPolicy retry_policy;
};

#endif // DEVICE_SESSION_HPP
