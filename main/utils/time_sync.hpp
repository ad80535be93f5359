// SNTP time sync so capture timestamps are real UTC.
#ifndef TIME_SYNC_HPP
#define TIME_SYNC_HPP

#include <cstdint>

namespace TimeSync {
    // Initialize SNTP once (idempotent). Requires an IP.
    void init();

    // True once system time is plausible (SNTP synced or RTC kept it)
    bool isSynced();

    // Block until time is synced or timeout_ms elapses. Returns true if synced.
    bool waitForSync(uint32_t timeout_ms);
}

#endif // TIME_SYNC_HPP
