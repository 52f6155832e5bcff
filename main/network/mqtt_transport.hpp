#ifndef MQTT_TRANSPORT_HPP
#define MQTT_TRANSPORT_HPP

#include <cstddef>
#include <esp_err.h>

// Broker wire client as seen by BrokerSession.
// Listener callbacks arrive on the transport's own task.
class MqttTransport {
public:
    class Listener {
    public:
        virtual ~Listener() = default;
        virtual void onConnecting() = 0;
        virtual void onConnected(bool session_present) = 0;
        virtual void onDisconnected() = 0;
        virtual void onPublished(int msg_id) = 0;
        virtual void onError(int error_code) = 0;
    };

    virtual ~MqttTransport() = default;

    // Create the client from its endpoint/identity. False means it can never connect.
    virtual bool init() = 0;
    virtual void setListener(Listener* listener) = 0;

    // Begin connecting; reconnects on its own while auto-reconnect is on
    virtual esp_err_t start() = 0;

    // Hand a message to the client without waiting for the broker.
    // Returns a message id (>= 0) or a negative code if rejected.
    virtual int enqueue(const char* topic, const char* payload, std::size_t len, int qos) = 0;

    virtual esp_err_t setAutoReconnect(bool enabled) = 0;

    // Disconnect and release the client
    virtual esp_err_t stop() = 0;
};

#endif // MQTT_TRANSPORT_HPP
