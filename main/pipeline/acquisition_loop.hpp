#ifndef ACQUISITION_LOOP_HPP
#define ACQUISITION_LOOP_HPP

#include <cstddef>
#include <cstdint>
#include <main/ble/device_session.hpp>
#include <main/models/acquisition_error.hpp>
#include <main/network/publisher.hpp>
#include <main/pipeline/batch_builder.hpp>
#include <main/utils/scheduler.hpp>

struct CycleReport {
    bool             ok;          // batch acquired and handed to the publisher
    AcquisitionError error;       // cycle-fatal cause when !ok; PUBLISH when ok but
                                  // some records were not published
    std::size_t      records;
    PublishReport    publish;
};

// Drives acquisition cycles: session -> batch -> publish, then waits for the
// next period. A failed cycle is logged and the loop carries on; only
// cancellation of the scheduler ends run().
class AcquisitionLoop {
public:
    AcquisitionLoop(DeviceSession& session, const BatchBuilder& builder, Publisher& publisher,
                    Scheduler& scheduler, const char* address, uint32_t period_ms);

    CycleReport runCycle();

    // Blocks until the scheduler is cancelled
    void run();

    uint32_t cycleCount() const { return cycles; }
    uint32_t failedCycleCount() const { return failed_cycles; }
    uint32_t consecutiveFailures() const { return consecutive_failures; }

private:
    void logFailure(const AcquisitionError& error) const;

    DeviceSession& session;
    const BatchBuilder& builder;
    Publisher& publisher;
    Scheduler& scheduler;
    const char* address;
    uint32_t period_ms;

    SampleSet samples;
    MeasurementBatch batch;

    uint32_t cycles;
    uint32_t failed_cycles;
    uint32_t consecutive_failures;
};

#endif // ACQUISITION_LOOP_HPP
