#ifndef RTOS_SCHEDULER_HPP
#define RTOS_SCHEDULER_HPP

#include <cstdint>
#include <freertos/FreeRTOS.h>
#include <freertos/event_groups.h>
#include <main/utils/scheduler.hpp>

// Scheduler backed by a FreeRTOS event group. cancel() may be called from
// any task and wakes a pending sleepFor() immediately. Waits are sliced so
// the sleeping task keeps feeding the task watchdog.
class RtosScheduler : public Scheduler {
public:
    explicit RtosScheduler(uint32_t slice_ms);

    bool sleepFor(uint32_t ms) override;
    void cancel() override;
    bool isCancelled() const override;

private:
    StaticEventGroup_t group_buffer;
    EventGroupHandle_t group;
    uint32_t slice_ms;
};

#endif // RTOS_SCHEDULER_HPP
