#ifndef FAKE_WATCHDOG_HPP
#define FAKE_WATCHDOG_HPP

#include <atomic>

// Counters behind the linux build's Watchdog functions (fake_watchdog.cpp)
namespace FakeWatchdog {
    extern std::atomic<int> subscribed;
    extern std::atomic<int> unsubscribed;
    extern std::atomic<int> feeds;
}

#endif // FAKE_WATCHDOG_HPP
