// SNTP wall-clock sync and epoch-millisecond timestamps for telemetry.
#ifndef TIME_SYNC_HPP
#define TIME_SYNC_HPP

#include <cstdint>

namespace TimeSync {
    // Initialize SNTP once (idempotent). Safe to call repeatedly.
    void init();

    // Returns true if system time is considered valid (SNTP synced or RTC set).
    bool isSynced();

    // Block until time is synced or timeout_ms elapses. Returns true if synced.
    bool waitForSync(unsigned int timeout_ms);

    // Current wall-clock time in milliseconds since the Unix epoch.
    // Returns whatever the system clock holds, synced or not.
    int64_t nowEpochMs();
}

#endif // TIME_SYNC_HPP
