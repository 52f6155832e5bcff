#include <main/network/esp_mqtt_transport.hpp>
#include <main/utils/logger.hpp>
#include <esp_random.h>
#include <inttypes.h>
#include <cstdio>

static const char* TAG_MQTT = "EspMqttTransport";

EspMqttTransport::EspMqttTransport()
    : EspMqttTransport(Config::Mqtt::broker_uri, Config::Mqtt::client_id_prefix) {}

EspMqttTransport::EspMqttTransport(const char* broker_uri, const char* client_id_prefix)
    : client(nullptr),
      cfg{},
      broker_uri(broker_uri),
      client_id_prefix(client_id_prefix),
      client_id{},
      started(false),
      listener(nullptr) {}

EspMqttTransport::~EspMqttTransport() {
    if (client != nullptr) {
        (void)stop();
    }
}

bool EspMqttTransport::init() {
    if (client != nullptr) {
        return true;
    }

    // Fresh identity per instance, as the broker sees it
    std::snprintf(client_id, sizeof(client_id), "%s-%08" PRIx32, client_id_prefix, esp_random());

    cfg = {};
    cfg.broker.address.uri = broker_uri;
    cfg.credentials.client_id = client_id;
    cfg.session.keepalive = Config::Mqtt::keepalive_seconds;
    cfg.session.disable_clean_session = !Config::Mqtt::clean_session;
    cfg.network.disable_auto_reconnect = !Config::Mqtt::auto_reconnect;
    cfg.network.reconnect_timeout_ms = Config::Mqtt::reconnect_timeout_ms;
    cfg.network.timeout_ms = Config::Mqtt::network_timeout_ms;

    client = esp_mqtt_client_init(&cfg);
    if (!client) {
        LOG_ERROR(TAG_MQTT, "esp_mqtt_client_init failed for %s", broker_uri);
        return false;
    }
    esp_err_t err = esp_mqtt_client_register_event(client, MQTT_EVENT_ANY, &EspMqttTransport::mqttEventHandler, this);
    if (err != ESP_OK) {
        LOG_ERROR(TAG_MQTT, "esp_mqtt_client_register_event failed: %d", static_cast<int>(err));
        (void)esp_mqtt_client_destroy(client);
        client = nullptr;
        return false;
    }
    LOG_INFO(TAG_MQTT, "Client %s ready for %s", client_id, broker_uri);
    return true;
}

void EspMqttTransport::setListener(Listener* l) {
    listener = l;
}

esp_err_t EspMqttTransport::start() {
    if (!client) {
        return ESP_ERR_INVALID_STATE;
    }
    if (started) {
        return ESP_OK;
    }
    LOG_INFO(TAG_MQTT, "Connecting to %s as %s", broker_uri, client_id);
    esp_err_t err = esp_mqtt_client_start(client);
    if (err != ESP_OK) {
        LOG_ERROR(TAG_MQTT, "esp_mqtt_client_start failed: %d", static_cast<int>(err));
        return err;
    }
    started = true;
    return ESP_OK;
}

int EspMqttTransport::enqueue(const char* topic, const char* payload, std::size_t len, int qos) {
    if (!client) {
        return -1;
    }
    // store=true keeps QoS>0 messages in the outbox until acknowledged
    int mid = esp_mqtt_client_enqueue(client, topic, payload, static_cast<int>(len), qos, 0, true);
    if (mid >= 0) {
        LOG_DEBUG(TAG_MQTT, "Enqueue topic=%s len=%d qos=%d mid=%d", topic, static_cast<int>(len), qos, mid);
    } else {
        LOG_ERROR(TAG_MQTT, "Enqueue failed topic=%s rc=%d", topic, mid);
    }
    return mid;
}

esp_err_t EspMqttTransport::setAutoReconnect(bool enabled) {
    cfg.network.disable_auto_reconnect = !enabled;
    if (!client) {
        return ESP_OK;
    }
    esp_err_t err = esp_mqtt_set_config(client, &cfg);
    if (err != ESP_OK) {
        LOG_ERROR(TAG_MQTT, "esp_mqtt_set_config failed: %d", static_cast<int>(err));
    }
    return err;
}

esp_err_t EspMqttTransport::stop() {
    if (!client) {
        return ESP_OK;
    }
    esp_err_t result = ESP_OK;
    if (started) {
        result = esp_mqtt_client_stop(client);
        if (result != ESP_OK) {
            LOG_WARN(TAG_MQTT, "esp_mqtt_client_stop failed: %d", static_cast<int>(result));
        }
    }
    esp_err_t err = esp_mqtt_client_destroy(client);
    if (err != ESP_OK) {
        LOG_WARN(TAG_MQTT, "esp_mqtt_client_destroy failed: %d", static_cast<int>(err));
        result = err;
    }
    client = nullptr;
    started = false;
    return result;
}

void EspMqttTransport::mqttEventHandler(void* handler_args, esp_event_base_t, int32_t, void* event_data) {
    auto* self = static_cast<EspMqttTransport*>(handler_args);
    esp_mqtt_event_handle_t event = static_cast<esp_mqtt_event_handle_t>(event_data);
    self->handleEvent(event);
}

void EspMqttTransport::handleEvent(esp_mqtt_event_handle_t event) {
    switch (event->event_id) {
        case MQTT_EVENT_BEFORE_CONNECT:
            if (listener) {
                listener->onConnecting();
            }
            break;
        case MQTT_EVENT_CONNECTED:
            if (listener) {
                listener->onConnected(event->session_present != 0);
            }
            break;
        case MQTT_EVENT_DISCONNECTED:
            if (listener) {
                listener->onDisconnected();
            }
            break;
        case MQTT_EVENT_PUBLISHED:
            if (listener) {
                listener->onPublished(event->msg_id);
            }
            break;
        case MQTT_EVENT_DATA:
            // No subscriptions; anything arriving is only logged
            LOG_DEBUG(TAG_MQTT, "RX topic=%.*s len=%d", event->topic_len, event->topic, event->data_len);
            break;
        case MQTT_EVENT_ERROR: {
            int code = -1;
            if (event->error_handle != nullptr) {
                if (event->error_handle->error_type == MQTT_ERROR_TYPE_CONNECTION_REFUSED) {
                    code = static_cast<int>(event->error_handle->connect_return_code);
                } else {
                    code = event->error_handle->esp_transport_sock_errno;
                }
            }
            if (listener) {
                listener->onError(code);
            }
            break;
        }
        default:
            break;
    }
}
