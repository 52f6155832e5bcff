#include <main/network/wifi_manager.hpp>
#include <main/utils/logger.hpp>
#include <main/config/config.hpp>

#include <esp_err.h>
#include <cstdio>

static const char* TAG = "WiFiManager";

WiFiManager::WiFiManager()
    : initialized(false),
      connected(false),
      got_ip(false),
      connecting(false),
      retry_count(0),
      wifi_any_id_instance(nullptr),
      ip_got_ip_instance(nullptr) {}

bool WiFiManager::isNetworkUsable() const {
    return connected.load() || got_ip.load() || connecting.load();
}

bool WiFiManager::init() {
    if (initialized) {
        return true;
    }

    // NVS is initialized by app_main before networking comes up
    esp_err_t err = esp_netif_init();
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "esp_netif_init failed: %d", static_cast<int>(err));
        return false;
    }
    err = esp_event_loop_create_default();
    if (err != ESP_OK && err != ESP_ERR_INVALID_STATE) {
        LOG_ERROR(TAG, "Event loop create failed: %d", static_cast<int>(err));
        return false;
    }

    esp_netif_create_default_wifi_sta();

    wifi_init_config_t cfg = WIFI_INIT_CONFIG_DEFAULT();
    err = esp_wifi_init(&cfg);
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "esp_wifi_init failed: %d", static_cast<int>(err));
        return false;
    }

    err = esp_event_handler_instance_register(
        WIFI_EVENT, ESP_EVENT_ANY_ID, &WiFiManager::wifiEventHandler, this, &wifi_any_id_instance);
    if (err == ESP_OK) {
        err = esp_event_handler_instance_register(
            IP_EVENT, IP_EVENT_STA_GOT_IP, &WiFiManager::ipEventHandler, this, &ip_got_ip_instance);
    }
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "Event handler registration failed: %d", static_cast<int>(err));
        return false;
    }

    wifi_config_t wifi_config = {};
    snprintf(reinterpret_cast<char*>(wifi_config.sta.ssid),
             sizeof(wifi_config.sta.ssid), "%s", Config::Wifi::ssid);
    snprintf(reinterpret_cast<char*>(wifi_config.sta.password),
             sizeof(wifi_config.sta.password), "%s", Config::Wifi::password);
    wifi_config.sta.threshold.authmode = WIFI_AUTH_WPA2_PSK;
    wifi_config.sta.pmf_cfg.capable = true;
    wifi_config.sta.pmf_cfg.required = false;

    err = esp_wifi_set_mode(WIFI_MODE_STA);
    if (err == ESP_OK) {
        err = esp_wifi_set_config(WIFI_IF_STA, &wifi_config);
    }
    if (err == ESP_OK) {
        err = esp_wifi_start();
    }
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "Wi-Fi start failed: %d", static_cast<int>(err));
        return false;
    }

    initialized = true;
    // With auto-connect, WIFI_EVENT_STA_START issues the first attempt
    if (Config::Wifi::auto_connect_on_start) {
        connecting.store(true);
    }
    return true;
}

bool WiFiManager::connect() {
    if (!initialized) {
        return init();
    }
    retry_count.store(0);
    got_ip.store(false);
    connecting.store(true);
    esp_err_t err = esp_wifi_connect();
    if (err != ESP_OK) {
        connecting.store(false);
        LOG_ERROR(TAG, "esp_wifi_connect failed: %d", static_cast<int>(err));
        return false;
    }
    LOG_INFO(TAG, "Connecting to SSID: %s", Config::Wifi::ssid);
    return true;
}

void WiFiManager::wifiEventHandler(void* arg, esp_event_base_t, int32_t event_id, void*) {
    WiFiManager* self = static_cast<WiFiManager*>(arg);
    switch (event_id) {
        case WIFI_EVENT_STA_START:
            LOG_INFO(TAG, "%s", "WIFI_EVENT_STA_START");
            if (Config::Wifi::auto_connect_on_start) {
                if (esp_wifi_connect() != ESP_OK) {
                    self->connecting.store(false);
                }
            }
            break;
        case WIFI_EVENT_STA_CONNECTED:
            LOG_INFO(TAG, "%s", "WIFI_EVENT_STA_CONNECTED");
            self->connected.store(true);
            break;
        case WIFI_EVENT_STA_DISCONNECTED:
            LOG_WARN(TAG, "%s", "WIFI_EVENT_STA_DISCONNECTED");
            self->connected.store(false);
            self->got_ip.store(false);
            if (self->retry_count.load() < Config::Wifi::max_retry_count) {
                const int attempt = self->retry_count.fetch_add(1) + 1;
                LOG_INFO(TAG, "Retrying WiFi (%d/%d)", attempt, Config::Wifi::max_retry_count);
                self->connecting.store(esp_wifi_connect() == ESP_OK);
            } else {
                self->connecting.store(false);
                LOG_ERROR(TAG, "WiFi connect failed after %d retries; waiting for the next reconnect",
                          Config::Wifi::max_retry_count);
            }
            break;
        case WIFI_EVENT_STA_STOP:
            LOG_INFO(TAG, "%s", "WIFI_EVENT_STA_STOP");
            self->connected.store(false);
            self->got_ip.store(false);
            self->connecting.store(false);
            break;
        default:
            break;
    }
}

void WiFiManager::ipEventHandler(void* arg, esp_event_base_t, int32_t event_id, void*) {
    WiFiManager* self = static_cast<WiFiManager*>(arg);
    if (event_id == IP_EVENT_STA_GOT_IP) {
        self->got_ip.store(true);
        self->connected.store(true);
        self->connecting.store(false);
        self->retry_count.store(0);
        LOG_INFO(TAG, "%s", "Got IP address");
    }
}
