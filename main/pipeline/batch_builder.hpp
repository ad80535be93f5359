#ifndef BATCH_BUILDER_HPP
#define BATCH_BUILDER_HPP

#include <cstddef>
#include <main/models/acquisition_error.hpp>
#include <main/models/measurement_record.hpp>
#include <main/models/raw_sample.hpp>

class BatchBuilder {
public:
    BatchBuilder(const char* asset_id, const char* location_id);

    // "TI-SensorTag-" + last 6 hex digits of the MAC without separators.
    // Returns false if the address has fewer than 6 hex digits.
    static bool assetIdFromAddress(const char* address, char* out, std::size_t out_size);

    // Decodes every sample in order. The first decode failure discards the
    // whole batch: out.count is 0 and error is a DECODE error.
    bool build(const SampleSet& samples, MeasurementBatch& out, AcquisitionError& error) const;

    const char* assetId() const { return asset_id; }
    const char* locationId() const { return location_id; }

private:
    char asset_id[32];
    char location_id[48];
};

#endif // BATCH_BUILDER_HPP
