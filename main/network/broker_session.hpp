#ifndef BROKER_SESSION_HPP
#define BROKER_SESSION_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <esp_err.h>
#include <main/config/config.hpp>
#include <main/models/outgoing_message.hpp>
#include <main/network/mqtt_transport.hpp>
#include <main/runtime/work_queue.hpp>
#include <main/utils/circular_buffer.hpp>

enum class SessionState : uint8_t {
    DISCONNECTED = 0,
    CONNECTING = 1,
    CONNECTED = 2,
    RECONNECT_PENDING = 3
};

const char* toString(SessionState state);

struct SessionStats {
    uint32_t published; // handed to the transport directly
    uint32_t flushed;   // handed to the transport from the backlog
    uint32_t buffered;  // currently waiting in the backlog
    uint32_t dropped;   // rejected because the backlog was full
};

// Connection lifecycle to the broker plus the disconnected-message backlog.
//
// All public operations run on the publisher worker context. Transport
// events arrive on the transport task; they only touch atomics and post
// work back to the worker.
//
// The backlog is enabled by the first successful connect. Once full it
// keeps its oldest messages and rejects new ones. It is flushed in FIFO
// order after every (re)connect, and before any direct publish.
class BrokerSession : private MqttTransport::Listener {
public:
    using Backlog = CircularBuffer<OutgoingMessage, Config::Telemetry::disconnected_buffer_capacity>;

    BrokerSession(MqttTransport& transport, WorkQueue& worker);
    ~BrokerSession() override;

    BrokerSession(const BrokerSession&) = delete;
    BrokerSession& operator=(const BrokerSession&) = delete;

    // Start the transport with auto-reconnect. Errors are also logged.
    esp_err_t connect();

    // ESP_OK: handed to the transport or buffered.
    // ESP_ERR_INVALID_STATE: never connected yet, or disconnected for good.
    // ESP_ERR_NO_MEM: disconnected and the backlog is full; message dropped.
    // ESP_ERR_INVALID_SIZE: topic/payload larger than a message slot.
    esp_err_t publish(const char* topic, const char* payload, std::size_t len, int qos);

    // Push backlog to the transport while connected. ESP_FAIL if the transport refused.
    esp_err_t flushBacklog();

    void setReconnectPolicy(bool enabled);

    // Stop the transport and discard the backlog. Terminal.
    void disconnect();

    SessionState state() const { return session_state.load(); }
    bool isBufferEnabled() const { return buffer_enabled.load(); }
    SessionStats stats() const;

private:
    void onConnecting() override;
    void onConnected(bool session_present) override;
    void onDisconnected() override;
    void onPublished(int msg_id) override;
    void onError(int error_code) override;

    esp_err_t bufferMessage(const char* topic, const char* payload, std::size_t len, int qos);

    MqttTransport& transport;
    WorkQueue& worker;

    std::atomic<SessionState> session_state;
    std::atomic<bool> buffer_enabled;
    std::atomic<bool> auto_reconnect;
    std::atomic<bool> closed;
    std::atomic<uint32_t> connect_count;

    // Worker-only state
    Backlog backlog;
    uint32_t published_count;
    uint32_t flushed_count;
};

#endif // BROKER_SESSION_HPP
