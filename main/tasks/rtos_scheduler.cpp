#include <main/tasks/rtos_scheduler.hpp>
#include <main/utils/watchdog.hpp>
#include <algorithm>

namespace {
    static constexpr EventBits_t CANCEL_BIT = BIT0;
}

RtosScheduler::RtosScheduler(uint32_t slice_ms)
    : group_buffer(),
      group(xEventGroupCreateStatic(&group_buffer)),
      slice_ms(slice_ms > 0 ? slice_ms : 1) {}

bool RtosScheduler::sleepFor(uint32_t ms) {
    uint32_t remaining = ms;
    do {
        Watchdog::feed();
        const uint32_t slice = std::min(remaining, slice_ms);
        EventBits_t bits = xEventGroupWaitBits(group, CANCEL_BIT, pdFALSE, pdTRUE, pdMS_TO_TICKS(slice));
        if ((bits & CANCEL_BIT) != 0) {
            return false;
        }
        remaining -= slice;
    } while (remaining > 0);
    Watchdog::feed();
    return true;
}

void RtosScheduler::cancel() {
    xEventGroupSetBits(group, CANCEL_BIT);
}

bool RtosScheduler::isCancelled() const {
    return (xEventGroupGetBits(group) & CANCEL_BIT) != 0;
}
