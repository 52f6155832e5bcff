#ifndef WIFI_MANAGER_HPP
#define WIFI_MANAGER_HPP

#include <atomic>
#include <cstdint>
#include <esp_wifi.h>
#include <esp_event.h>
#include <esp_netif.h>
#include <main/network/connectivity_gate.hpp>
#include <main/network/wifi_link.hpp>

// Station-mode Wi-Fi bring-up. Doubles as the publisher's connectivity gate:
// the link counts as usable while connected or while an attempt is in flight.
// After max_retry_count failed attempts the driver stops; LinkSupervisor
// calls connect() again later.
class WiFiManager : public ConnectivityGate, public WifiLink {
public:
    WiFiManager();

    bool init();
    bool connect() override;

    bool isConnected() const { return connected.load(); }
    bool hasIp() const override { return got_ip.load(); }
    bool isConnecting() const override { return connecting.load(); }

    bool isNetworkUsable() const override;

private:
    static void wifiEventHandler(void* arg, esp_event_base_t event_base, int32_t event_id, void* event_data);
    static void ipEventHandler(void* arg, esp_event_base_t event_base, int32_t event_id, void* event_data);

    bool initialized;
    // Written from the default event loop task, read by the publisher worker
    std::atomic<bool> connected;
    std::atomic<bool> got_ip;
    std::atomic<bool> connecting;
    std::atomic<int> retry_count;

    esp_event_handler_instance_t wifi_any_id_instance;
    esp_event_handler_instance_t ip_got_ip_instance;
};

#endif // WIFI_MANAGER_HPP
