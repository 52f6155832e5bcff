#ifndef FAKE_TRANSPORT_HPP
#define FAKE_TRANSPORT_HPP

#include <cstddef>
#include <string>
#include <vector>
#include <main/network/mqtt_transport.hpp>

// Records what the session hands over; tests raise broker events by hand.
class FakeTransport : public MqttTransport {
public:
    struct Sent {
        std::string topic;
        std::string payload;
        int qos;
    };

    bool init() override {
        ++init_calls;
        return init_result;
    }

    void setListener(Listener* l) override { listener = l; }

    esp_err_t start() override {
        ++start_calls;
        return start_result;
    }

    int enqueue(const char* topic, const char* payload, std::size_t len, int qos) override {
        if (reject_enqueue) {
            return -1;
        }
        sent.push_back(Sent{topic, std::string(payload, len), qos});
        return next_mid++;
    }

    esp_err_t setAutoReconnect(bool enabled) override {
        auto_reconnect = enabled;
        return ESP_OK;
    }

    esp_err_t stop() override {
        ++stop_calls;
        return ESP_OK;
    }

    void fireConnected() { if (listener) listener->onConnected(false); }
    void fireDisconnected() { if (listener) listener->onDisconnected(); }
    void fireConnecting() { if (listener) listener->onConnecting(); }
    void fireError(int code) { if (listener) listener->onError(code); }

    Listener* listener = nullptr;
    std::vector<Sent> sent;
    bool init_result = true;
    esp_err_t start_result = ESP_OK;
    bool reject_enqueue = false;
    bool auto_reconnect = false;
    int init_calls = 0;
    int start_calls = 0;
    int stop_calls = 0;
    int next_mid = 1;
};

#endif // FAKE_TRANSPORT_HPP
