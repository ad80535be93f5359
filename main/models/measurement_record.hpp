#ifndef MEASUREMENT_RECORD_HPP
#define MEASUREMENT_RECORD_HPP

#include <cstddef>
#include <main/models/raw_sample.hpp>
#include <main/models/sensor_kind.hpp>

// One decoded measurement ready for publishing
struct MeasurementRecord {
    char        asset_id[32];
    char        location_id[48];
    SensorKind  kind;
    const char* sensor_type;   // e.g. "Temperature"
    double      value;
    const char* unit;
    char        timestamp[24]; // YYYY-MM-DDTHH:MM:SSZ
};

struct MeasurementBatch {
    MeasurementRecord records[kMaxSensors];
    std::size_t       count;

    void clear() { count = 0; }
};

#endif // MEASUREMENT_RECORD_HPP
