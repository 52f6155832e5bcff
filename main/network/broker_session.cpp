#include <main/network/broker_session.hpp>
#include <main/utils/logger.hpp>
#include <cstdio>
#include <cstring>

static const char* TAG = "BrokerSession";

const char* toString(SessionState state) {
    switch (state) {
        case SessionState::DISCONNECTED:      return "DISCONNECTED";
        case SessionState::CONNECTING:        return "CONNECTING";
        case SessionState::CONNECTED:         return "CONNECTED";
        case SessionState::RECONNECT_PENDING: return "RECONNECT_PENDING";
        default:                              return "UNKNOWN";
    }
}

BrokerSession::BrokerSession(MqttTransport& transport, WorkQueue& worker)
    : transport(transport),
      worker(worker),
      session_state(SessionState::DISCONNECTED),
      buffer_enabled(false),
      auto_reconnect(Config::Mqtt::auto_reconnect),
      closed(false),
      connect_count(0),
      backlog(Config::Telemetry::disconnected_buffer_delete_oldest ? OverflowPolicy::DROP_OLDEST
                                                                   : OverflowPolicy::DROP_NEWEST),
      published_count(0),
      flushed_count(0) {
    transport.setListener(this);
}

BrokerSession::~BrokerSession() {
    transport.setListener(nullptr);
}

esp_err_t BrokerSession::connect() {
    if (closed.load()) {
        return ESP_ERR_INVALID_STATE;
    }
    session_state.store(SessionState::CONNECTING);
    esp_err_t err = transport.start();
    if (err != ESP_OK) {
        session_state.store(SessionState::DISCONNECTED);
        LOG_ERROR(TAG, "MQTT connection failure: start rc=%d", static_cast<int>(err));
    }
    return err;
}

esp_err_t BrokerSession::publish(const char* topic, const char* payload, std::size_t len, int qos) {
    if (closed.load()) {
        LOG_WARN(TAG, "Publish after disconnect rejected topic=%s", topic);
        return ESP_ERR_INVALID_STATE;
    }
    if (std::strlen(topic) >= Config::Telemetry::max_topic_len || len > Config::Telemetry::max_payload_len) {
        LOG_ERROR(TAG, "Message too large topic=%s len=%u", topic, static_cast<unsigned>(len));
        return ESP_ERR_INVALID_SIZE;
    }

    if (session_state.load() == SessionState::CONNECTED) {
        // Older buffered messages go out first
        if (!backlog.isEmpty()) {
            (void)flushBacklog();
        }
        if (backlog.isEmpty()) {
            int mid = transport.enqueue(topic, payload, len, qos);
            if (mid >= 0) {
                ++published_count;
                return ESP_OK;
            }
            LOG_WARN(TAG, "Transport rejected publish rc=%d; buffering", mid);
        }
    }

    return bufferMessage(topic, payload, len, qos);
}

esp_err_t BrokerSession::bufferMessage(const char* topic, const char* payload, std::size_t len, int qos) {
    if (!buffer_enabled.load()) {
        LOG_WARN(TAG, "Not connected and buffering not enabled; dropped topic=%s", topic);
        return ESP_ERR_INVALID_STATE;
    }

    OutgoingMessage message{};
    std::snprintf(message.topic, sizeof(message.topic), "%s", topic);
    std::memcpy(message.payload, payload, len);
    message.payload_len = static_cast<uint16_t>(len);
    message.qos = static_cast<uint8_t>(qos);

    if (!backlog.push(message)) {
        LOG_WARN(TAG, "Disconnected buffer full (%u); dropped topic=%s",
                 static_cast<unsigned>(backlog.getCapacity()), topic);
        return ESP_ERR_NO_MEM;
    }
    LOG_DEBUG(TAG, "Buffered topic=%s (%u/%u)", topic,
              static_cast<unsigned>(backlog.getCount()), static_cast<unsigned>(backlog.getCapacity()));
    return ESP_OK;
}

esp_err_t BrokerSession::flushBacklog() {
    uint32_t sent = 0;
    esp_err_t result = ESP_OK;
    while (session_state.load() == SessionState::CONNECTED) {
        const OutgoingMessage* message = backlog.front();
        if (message == nullptr) {
            break;
        }
        int mid = transport.enqueue(message->topic, message->payload, message->payload_len, message->qos);
        if (mid < 0) {
            LOG_WARN(TAG, "Backlog flush stopped rc=%d, %u left", mid, static_cast<unsigned>(backlog.getCount()));
            result = ESP_FAIL;
            break;
        }
        backlog.dropFront();
        ++sent;
    }
    if (sent > 0) {
        flushed_count += sent;
        LOG_INFO(TAG, "Flushed %lu buffered message(s)", static_cast<unsigned long>(sent));
    }
    return result;
}

void BrokerSession::setReconnectPolicy(bool enabled) {
    auto_reconnect.store(enabled);
    esp_err_t err = transport.setAutoReconnect(enabled);
    if (err != ESP_OK) {
        LOG_WARN(TAG, "Reconnect policy change failed: %d", static_cast<int>(err));
    }
    if (!enabled) {
        SessionState expected = SessionState::RECONNECT_PENDING;
        (void)session_state.compare_exchange_strong(expected, SessionState::DISCONNECTED);
    }
}

void BrokerSession::disconnect() {
    if (closed.exchange(true)) {
        return;
    }
    const std::size_t discarded = backlog.getCount();
    backlog.clear();
    esp_err_t err = transport.stop();
    if (err != ESP_OK) {
        LOG_WARN(TAG, "Error disconnecting MQTT client: %d", static_cast<int>(err));
    }
    session_state.store(SessionState::DISCONNECTED);
    LOG_INFO(TAG, "Session closed (published=%lu flushed=%lu discarded=%u dropped=%u)",
             static_cast<unsigned long>(published_count), static_cast<unsigned long>(flushed_count),
             static_cast<unsigned>(discarded), static_cast<unsigned>(backlog.droppedCount()));
}

SessionStats BrokerSession::stats() const {
    SessionStats s{};
    s.published = published_count;
    s.flushed = flushed_count;
    s.buffered = static_cast<uint32_t>(backlog.getCount());
    s.dropped = static_cast<uint32_t>(backlog.droppedCount());
    return s;
}

void BrokerSession::onConnecting() {
    if (closed.load()) {
        return;
    }
    session_state.store(SessionState::CONNECTING);
}

void BrokerSession::onConnected(bool session_present) {
    if (closed.load()) {
        return;
    }
    session_state.store(SessionState::CONNECTED);
    const uint32_t count = connect_count.fetch_add(1) + 1U;
    if (!buffer_enabled.exchange(true)) {
        LOG_INFO(TAG, "MQTT connection complete; disconnected buffer enabled (capacity %u, %s)",
                 static_cast<unsigned>(Config::Telemetry::disconnected_buffer_capacity),
                 Config::Telemetry::disconnected_buffer_delete_oldest ? "drop oldest" : "drop newest");
    } else {
        LOG_INFO(TAG, "MQTT reconnected (#%lu, session_present=%d)",
                 static_cast<unsigned long>(count), session_present ? 1 : 0);
    }
    if (!worker.post([this]() { (void)flushBacklog(); }, 0, WorkQueue::NO_TAG)) {
        LOG_WARN(TAG, "%s", "Could not schedule backlog flush; next publish will flush");
    }
}

void BrokerSession::onDisconnected() {
    if (closed.load()) {
        return;
    }
    session_state.store(auto_reconnect.load() ? SessionState::RECONNECT_PENDING : SessionState::DISCONNECTED);
    LOG_WARN(TAG, "%s", "MQTT connection lost");
}

void BrokerSession::onPublished(int msg_id) {
    LOG_DEBUG(TAG, "MQTT delivery complete mid=%d", msg_id);
}

void BrokerSession::onError(int error_code) {
    if (closed.load()) {
        return;
    }
    LOG_WARN(TAG, "MQTT connection failure: code=%d", error_code);
    SessionState expected = SessionState::CONNECTING;
    (void)session_state.compare_exchange_strong(
        expected, auto_reconnect.load() ? SessionState::RECONNECT_PENDING : SessionState::DISCONNECTED);
}
