#ifndef ACQUISITION_TASK_HPP
#define ACQUISITION_TASK_HPP

#include <cstdint>
#include <main/pipeline/acquisition_loop.hpp>
#include <main/utils/scheduler.hpp>

namespace AcquisitionTask {
    // Creates a static FreeRTOS task that runs the acquisition loop until the
    // scheduler is cancelled. Both objects must outlive the task.
    void create(AcquisitionLoop& loop, Scheduler& scheduler);

    // Cancels the scheduler and waits until the task has released its BLE
    // link and left the loop. Returns false on timeout.
    bool stop(uint32_t timeout_ms);
}

#endif // ACQUISITION_TASK_HPP
