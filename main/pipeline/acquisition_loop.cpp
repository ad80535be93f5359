#include <main/pipeline/acquisition_loop.hpp>
#include <main/utils/logger.hpp>

static const char* TAG = "AcquisitionLoop";

AcquisitionLoop::AcquisitionLoop(DeviceSession& session, const BatchBuilder& builder, Publisher& publisher,
                                 Scheduler& scheduler, const char* address, uint32_t period_ms)
    : session(session),
      builder(builder),
      publisher(publisher),
      scheduler(scheduler),
      address(address),
      period_ms(period_ms),
      samples(),
      batch(),
      cycles(0),
      failed_cycles(0),
      consecutive_failures(0) {}

void AcquisitionLoop::logFailure(const AcquisitionError& error) const {
    switch (error.kind) {
        case ErrorKind::CONNECTION:
            LOG_ERROR(TAG, "Cycle %lu failed: %s (%s) to %s", static_cast<unsigned long>(cycles),
                      errorKindName(error.kind), bleStatusName(error.ble_status), address);
            break;
        case ErrorKind::DISCONNECT:
            LOG_ERROR(TAG, "Cycle %lu failed: %s after %u attempts (last at %s)",
                      static_cast<unsigned long>(cycles), errorKindName(error.kind),
                      static_cast<unsigned>(error.attempts), sensorTypeName(error.sensor));
            break;
        case ErrorKind::GATT:
            LOG_ERROR(TAG, "Cycle %lu failed: %s on %s (%s)", static_cast<unsigned long>(cycles),
                      errorKindName(error.kind), sensorTypeName(error.sensor), bleStatusName(error.ble_status));
            break;
        case ErrorKind::DECODE:
            LOG_ERROR(TAG, "Cycle %lu failed: %s on %s, %u bytes received, %u expected",
                      static_cast<unsigned long>(cycles), errorKindName(error.kind), sensorTypeName(error.sensor),
                      static_cast<unsigned>(error.received_length), static_cast<unsigned>(error.expected_length));
            break;
        default:
            LOG_ERROR(TAG, "Cycle %lu failed: %s", static_cast<unsigned long>(cycles), errorKindName(error.kind));
            break;
    }
}

CycleReport AcquisitionLoop::runCycle() {
    CycleReport report{false, AcquisitionError::none(), 0, PublishReport{0, 0}};
    ++cycles;

    if (!session.acquire(address, samples, report.error)) {
        if (report.error.kind != ErrorKind::CANCELLED) {
            logFailure(report.error);
            ++failed_cycles;
            ++consecutive_failures;
        }
        return report;
    }

    if (!builder.build(samples, batch, report.error)) {
        logFailure(report.error);
        ++failed_cycles;
        ++consecutive_failures;
        return report;
    }

    report.ok = true;
    report.records = batch.count;
    report.publish = publisher.publishBatch(batch);
    consecutive_failures = 0;

    if (report.publish.failed > 0) {
        report.error.kind = ErrorKind::PUBLISH;
        LOG_WARN(TAG, "Cycle %lu: %u of %u records not published", static_cast<unsigned long>(cycles),
                 static_cast<unsigned>(report.publish.failed), static_cast<unsigned>(report.records));
    } else {
        LOG_INFO(TAG, "Cycle %lu: %u records published", static_cast<unsigned long>(cycles),
                 static_cast<unsigned>(report.records));
    }
    return report;
}

void AcquisitionLoop::run() {
    LOG_INFO(TAG, "Polling %s every %lu ms", address, static_cast<unsigned long>(period_ms));
    while (!scheduler.isCancelled()) {
        CycleReport report = runCycle();
        if (!report.ok && consecutive_failures > 1) {
            LOG_WARN(TAG, "%lu consecutive failed cycles", static_cast<unsigned long>(consecutive_failures));
        }
        if (!scheduler.sleepFor(period_ms)) {
            break;
        }
    }
    LOG_INFO(TAG, "Stopped after %lu cycles (%lu failed)", static_cast<unsigned long>(cycles),
             static_cast<unsigned long>(failed_cycles));
}
