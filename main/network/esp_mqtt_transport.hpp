#ifndef ESP_MQTT_TRANSPORT_HPP
#define ESP_MQTT_TRANSPORT_HPP

#include <cstdint>
#include <mqtt_client.h>
#include <main/config/config.hpp>
#include <main/network/mqtt_transport.hpp>

// esp-mqtt backed transport: persistent session (no clean session),
// automatic reconnect, non-blocking enqueue into the client outbox.
class EspMqttTransport : public MqttTransport {
public:
    // Construct using values from Config::Mqtt
    EspMqttTransport();
    EspMqttTransport(const char* broker_uri, const char* client_id_prefix);
    ~EspMqttTransport() override;

    bool init() override;
    void setListener(Listener* listener) override;
    esp_err_t start() override;
    int enqueue(const char* topic, const char* payload, std::size_t len, int qos) override;
    esp_err_t setAutoReconnect(bool enabled) override;
    esp_err_t stop() override;

    // "<prefix>-<8 hex digits>", valid after init()
    const char* clientId() const { return client_id; }

private:
    static void mqttEventHandler(void* handler_args, esp_event_base_t base, int32_t event_id, void* event_data);
    void handleEvent(esp_mqtt_event_handle_t event);

    esp_mqtt_client_handle_t client;
    esp_mqtt_client_config_t cfg;
    const char* broker_uri;
    const char* client_id_prefix;
    char client_id[Config::Mqtt::max_client_id_len];
    bool started;
    Listener* listener;
};

#endif // ESP_MQTT_TRANSPORT_HPP
