#include <main/network/link_supervisor.hpp>
#include <main/utils/logger.hpp>

static const char* TAG = "LinkSupervisor";

LinkSupervisor::LinkSupervisor(WorkQueue& worker, WifiLink& link, uint32_t interval_ms)
    : link(link),
      timer(worker, interval_ms, [this]() { (void)checkLink(); }),
      attempts(0) {}

bool LinkSupervisor::start() {
    LOG_INFO(TAG, "Checking link every %lu ms", static_cast<unsigned long>(timer.intervalMs()));
    return timer.start();
}

void LinkSupervisor::stop() {
    timer.stop();
}

bool LinkSupervisor::checkLink() {
    if (link.hasIp() || link.isConnecting()) {
        return false;
    }
    ++attempts;
    LOG_WARN(TAG, "No IP and no attempt in flight; reconnecting (#%lu)", static_cast<unsigned long>(attempts));
    if (!link.connect()) {
        LOG_ERROR(TAG, "%s", "Reconnect could not be issued; retrying next interval");
    }
    return true;
}
