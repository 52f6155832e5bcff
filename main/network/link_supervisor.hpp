#ifndef LINK_SUPERVISOR_HPP
#define LINK_SUPERVISOR_HPP

#include <cstdint>
#include <main/network/wifi_link.hpp>
#include <main/runtime/periodic_timer.hpp>
#include <main/runtime/work_queue.hpp>

// Re-arms Wi-Fi after the driver has used up its retry budget.
// Every interval, on the worker: no IP and no attempt in flight -> connect().
class LinkSupervisor {
public:
    LinkSupervisor(WorkQueue& worker, WifiLink& link, uint32_t interval_ms);

    LinkSupervisor(const LinkSupervisor&) = delete;
    LinkSupervisor& operator=(const LinkSupervisor&) = delete;

    bool start();
    void stop();
    bool isRunning() const { return timer.isRunning(); }

    // One check; returns true if a reconnect was issued
    bool checkLink();

    uint32_t reconnectAttempts() const { return attempts; }

private:
    WifiLink& link;
    PeriodicTimer timer;
    uint32_t attempts;
};

#endif // LINK_SUPERVISOR_HPP
