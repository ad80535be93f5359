#include <main/ble/device_session.hpp>
#include <main/utils/logger.hpp>
#include <algorithm>
#include <cstring>

static const char* TAG = "DeviceSession";

namespace {
    // Releases the link exactly once when the attempt leaves scope. A failed
    // connect is released too: the peer may have come up after the link
    // layer gave up, and disconnect() is a no-op when nothing is open.
    class ScopedLink {
    public:
        explicit ScopedLink(BleLink& link) : link(link), attempted(false) {}
        ~ScopedLink() {
            if (attempted) {
                link.disconnect();
            }
        }
        ScopedLink(const ScopedLink&) = delete;
        ScopedLink& operator=(const ScopedLink&) = delete;

        BleStatus connect(const char* address) {
            BleStatus status = link.connect(address);
            attempted = true;
            return status;
        }

    private:
        BleLink& link;
        bool attempted;
    };

    static AcquisitionError makeError(ErrorKind kind, SensorKind sensor, BleStatus status) {
        AcquisitionError error = AcquisitionError::none();
        error.kind = kind;
        error.sensor = sensor;
        error.ble_status = status;
        return error;
    }
}

DeviceSession::DeviceSession(BleLink& link, Scheduler& scheduler, const Clock& clock,
                             const SensorRegistry& registry, RetryPolicy policy)
    : link(link),
      scheduler(scheduler),
      clock(clock),
      registry(registry),
      retry_policy(policy) {}

ErrorKind DeviceSession::classify(BleStatus status) {
    return status == BleStatus::DISCONNECTED ? ErrorKind::DISCONNECT : ErrorKind::GATT;
}

bool DeviceSession::acquire(const char* address, SampleSet& out, AcquisitionError& error) {
    out.clear();
    error = AcquisitionError::none();
    if (scheduler.isCancelled()) {
        error.kind = ErrorKind::CANCELLED;
        return false;
    }

    const unsigned max_attempts = static_cast<unsigned>(retry_policy.max_retries) + 1U;
    for (unsigned attempt_no = 1;; ++attempt_no) {
        if (attempt(address, out, error)) {
            if (attempt_no > 1) {
                LOG_INFO(TAG, "Read sequence recovered on attempt %u", attempt_no);
            }
            return true;
        }
        out.clear();
        error.attempts = attempt_no;

        if (error.kind != ErrorKind::DISCONNECT) {
            return false;
        }
        if (attempt_no >= max_attempts) {
            LOG_ERROR(TAG, "Link to %s lost on all %u attempts", address, attempt_no);
            return false;
        }
        LOG_WARN(TAG, "Link to %s lost during %s, retrying (%u/%u) in %lu ms", address,
                 sensorTypeName(error.sensor), attempt_no, max_attempts - 1U,
                 static_cast<unsigned long>(retry_policy.retry_delay_ms));
        if (!scheduler.sleepFor(retry_policy.retry_delay_ms)) {
            error.kind = ErrorKind::CANCELLED;
            return false;
        }
    }
}

bool DeviceSession::attempt(const char* address, SampleSet& out, AcquisitionError& error) {
    ScopedLink scoped(link);
    BleStatus status = scoped.connect(address);
    if (status != BleStatus::OK) {
        LOG_ERROR(TAG, "Connect to %s failed: %s", address, bleStatusName(status));
        error = makeError(ErrorKind::CONNECTION, SensorKind::TEMPERATURE, status);
        return false;
    }
    LOG_DEBUG(TAG, "Connected to %s", address);

    for (std::size_t index = 0; index < registry.size();) {
        const std::size_t group = registry.groupLength(index);
        if (!readGroup(index, group, out, error)) {
            return false;
        }
        index += group;
    }
    return true;
}

bool DeviceSession::readGroup(std::size_t first, std::size_t length, SampleSet& out, AcquisitionError& error) {
    const SensorDescriptor& lead = registry.at(first);

    if (lead.needsActivation()) {
        BleStatus status = link.write(lead.config_char, lead.activation, lead.activation_length, true);
        if (status != BleStatus::OK) {
            LOG_WARN(TAG, "Enable %s (0x%04X) failed: %s", sensorTypeName(lead.kind),
                     lead.config_char.alias(), bleStatusName(status));
            error = makeError(classify(status), lead.kind, status);
            return false;
        }
        if (!scheduler.sleepFor(lead.settle_ms)) {
            error = makeError(ErrorKind::CANCELLED, lead.kind, BleStatus::OK);
            return false;
        }
    }

    uint8_t buffer[kMaxRawLength];
    std::size_t value_length = 0;
    BleStatus status = link.read(lead.data_char, buffer, sizeof(buffer), value_length);
    if (status != BleStatus::OK) {
        LOG_WARN(TAG, "Read %s (0x%04X) failed: %s", sensorTypeName(lead.kind),
                 lead.data_char.alias(), bleStatusName(status));
        error = makeError(classify(status), lead.kind, status);
        return false;
    }
    const std::time_t captured_at = clock.now();
    const std::size_t kept = std::min(value_length, kMaxRawLength);

    for (std::size_t k = 0; k < length; ++k) {
        RawSample& sample = out.samples[out.count++];
        sample.descriptor = &registry.at(first + k);
        std::memcpy(sample.bytes, buffer, kept);
        sample.length = value_length;
        sample.captured_at = captured_at;
    }
    LOG_DEBUG(TAG, "Read %s: %u bytes", sensorTypeName(lead.kind), static_cast<unsigned>(value_length));
    return true;
}
