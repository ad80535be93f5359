#ifndef RAW_SAMPLE_HPP
#define RAW_SAMPLE_HPP

#include <cstddef>
#include <cstdint>
#include <ctime>
#include <main/models/sensor_descriptor.hpp>

// Largest characteristic value readable without a long read (ATT MTU 23 - 3)
static constexpr std::size_t kMaxRawLength = 20;
static constexpr std::size_t kMaxSensors = 8;

// Bytes of one characteristic read, as captured right after the read.
// length is the length reported by the peer and may exceed kMaxRawLength;
// only the first kMaxRawLength bytes are kept in that case.
struct RawSample {
    const SensorDescriptor* descriptor;
    uint8_t     bytes[kMaxRawLength];
    std::size_t length;
    std::time_t captured_at;
};

// Ordered samples of one acquisition cycle (registry order)
struct SampleSet {
    RawSample   samples[kMaxSensors];
    std::size_t count;

    void clear() { count = 0; }
};

#endif // RAW_SAMPLE_HPP
