#ifndef WATCHDOG_HPP
#define WATCHDOG_HPP

#include <cstdint>

// Task watchdog for the acquisition task. A BLE stack hang blocks the task
// past the timeout and resets the chip.
namespace Watchdog {
    // Call once from app_main before tasks start
    void init(uint32_t timeout_ms);
    // Subscribe / unsubscribe the calling task
    void subscribe();
    void unsubscribe();
    // No-op for tasks that are not subscribed
    void feed();
}

#endif // WATCHDOG_HPP
