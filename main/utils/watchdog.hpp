#ifndef WATCHDOG_HPP
#define WATCHDOG_HPP

#include <cstdint>
#include <main/config/config.hpp>

namespace Watchdog {
    // Longest a subscribed task may go without feeding
    static constexpr uint32_t TIMEOUT_MS = Config::Tasks::watchdog_timeout_ms;

    // Initialize TWDT (call once from app_main before tasks start)
    void init();
    // Subscribe calling task to TWDT; returns false if the TWDT rejected it
    bool subscribe();
    // Remove calling task from TWDT (must be called before a subscribed task exits)
    void unsubscribe();
    // Feed the watchdog (reset timer) - call in task loop
    void feed();
}

#endif // WATCHDOG_HPP
