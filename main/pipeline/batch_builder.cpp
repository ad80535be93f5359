#include <main/pipeline/batch_builder.hpp>
#include <main/config/config.hpp>
#include <main/utils/clock.hpp>
#include <main/utils/logger.hpp>
#include <cctype>
#include <cstdio>
#include <cstring>

static const char* TAG = "BatchBuilder";

BatchBuilder::BatchBuilder(const char* asset_id, const char* location_id) {
    std::snprintf(this->asset_id, sizeof(this->asset_id), "%s", asset_id);
    std::snprintf(this->location_id, sizeof(this->location_id), "%s", location_id);
}

bool BatchBuilder::assetIdFromAddress(const char* address, char* out, std::size_t out_size) {
    const unsigned digits = Config::Device::asset_suffix_digits;
    char hex[18] = {0};
    std::size_t n = 0;
    for (const char* p = address; *p != '\0' && n < sizeof(hex) - 1; ++p) {
        if (std::isxdigit(static_cast<unsigned char>(*p))) {
            hex[n++] = *p;
        }
    }
    if (n < digits) {
        if (out_size > 0) {
            out[0] = '\0';
        }
        return false;
    }
    int written = std::snprintf(out, out_size, "%s%s", Config::Device::asset_prefix, hex + (n - digits));
    return written > 0 && static_cast<std::size_t>(written) < out_size;
}

bool BatchBuilder::build(const SampleSet& samples, MeasurementBatch& out, AcquisitionError& error) const {
    out.clear();
    error = AcquisitionError::none();

    for (std::size_t i = 0; i < samples.count; ++i) {
        const RawSample& sample = samples.samples[i];
        const SensorDescriptor& descriptor = *sample.descriptor;

        double value = 0.0;
        DecodeError decode_error{descriptor.kind, sample.length, descriptor.expected_length};
        if (!descriptor.decode(sample.bytes, sample.length, value, decode_error)) {
            LOG_ERROR(TAG, "%s: got %u bytes, layout needs %u; dropping batch of %u",
                      sensorTypeName(decode_error.kind),
                      static_cast<unsigned>(decode_error.received_length),
                      static_cast<unsigned>(decode_error.expected_length),
                      static_cast<unsigned>(samples.count));
            out.clear();
            error = AcquisitionError::fromDecode(decode_error);
            return false;
        }

        MeasurementRecord& record = out.records[out.count];
        std::snprintf(record.asset_id, sizeof(record.asset_id), "%s", asset_id);
        std::snprintf(record.location_id, sizeof(record.location_id), "%s", location_id);
        record.kind = descriptor.kind;
        record.sensor_type = sensorTypeName(descriptor.kind);
        record.value = value;
        record.unit = descriptor.unit;
        if (!TimeFormat::formatIso8601(sample.captured_at, record.timestamp, sizeof(record.timestamp))) {
            LOG_WARN(TAG, "%s: capture time %lld not representable", record.sensor_type,
                     static_cast<long long>(sample.captured_at));
        }
        ++out.count;
    }
    return true;
}
