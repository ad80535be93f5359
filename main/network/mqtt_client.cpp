#include <main/network/mqtt_client.hpp>
#include <main/utils/logger.hpp>
#include <main/config/config.hpp>
#include <cstring>
#include <cstdio>

static const char* TAG_MQTT = "MqttClient";

MqttClient::MqttClient()
    : MqttClient(Config::Mqtt::host, Config::Mqtt::port, Config::Device::id) {}

MqttClient::MqttClient(const char* host, int port, const char* client_id)
    : client(nullptr),
      host(host),
      port(port),
      client_id(client_id),
      connected(false),
      uri{},
      status_topic{} {
    std::snprintf(uri, sizeof(uri), "mqtt://%s:%d", host, port);
    std::snprintf(status_topic, sizeof(status_topic), "%s/%s",
                  Config::Mqtt::topic_root, Config::Mqtt::status_suffix);
}

MqttClient::~MqttClient() {
    disconnect();
}

bool MqttClient::connect() {
    if (client != nullptr) {
        return true;
    }

    esp_mqtt_client_config_t cfg = {};
    cfg.broker.address.uri = uri;
    cfg.credentials.client_id = client_id;
    cfg.session.keepalive = Config::Mqtt::keepalive_seconds;
    cfg.session.disable_clean_session = !Config::Mqtt::clean_session;

    // LWT: retained "offline" if the bridge drops off the network
    if (Config::Mqtt::lwt_enable) {
        cfg.session.last_will.topic = status_topic;
        cfg.session.last_will.msg = "offline";
        cfg.session.last_will.qos = Config::Mqtt::telemetry_qos;
        cfg.session.last_will.retain = true;
    }

    LOG_INFO(TAG_MQTT, "Connecting to %s as %s", uri, client_id);

    client = esp_mqtt_client_init(&cfg);
    if (!client) {
        LOG_ERROR(TAG_MQTT, "%s", "esp_mqtt_client_init failed");
        return false;
    }
    esp_err_t err = esp_mqtt_client_register_event(client, MQTT_EVENT_ANY, &MqttClient::mqttEventHandler, this);
    if (err != ESP_OK) {
        LOG_ERROR(TAG_MQTT, "esp_mqtt_client_register_event failed: %d", static_cast<int>(err));
        disconnect();
        return false;
    }
    // esp-mqtt reconnects on its own from here; publish() never re-handshakes
    err = esp_mqtt_client_start(client);
    if (err != ESP_OK) {
        LOG_ERROR(TAG_MQTT, "esp_mqtt_client_start failed: %d", static_cast<int>(err));
        disconnect();
        return false;
    }
    return true;
}

void MqttClient::disconnect() {
    if (client) {
        if (connected && Config::Mqtt::lwt_enable) {
            publishStatus("offline");
        }
        esp_err_t err = esp_mqtt_client_stop(client);
        if (err != ESP_OK) {
            LOG_WARN(TAG_MQTT, "esp_mqtt_client_stop: %d", static_cast<int>(err));
        }
        err = esp_mqtt_client_destroy(client);
        if (err != ESP_OK) {
            LOG_WARN(TAG_MQTT, "esp_mqtt_client_destroy: %d", static_cast<int>(err));
        }
        client = nullptr;
        connected = false;
    }
}

bool MqttClient::isConnected() const {
    return connected;
}

int MqttClient::publish(const char* topic, const char* payload, int qos, bool retain) {
    if (!client || !connected) {
        LOG_WARN(TAG_MQTT, "Skip publish (not connected) topic=%s", topic);
        return -1;
    }
    int length = static_cast<int>(std::strlen(payload));
    int mid = esp_mqtt_client_publish(client, topic, payload, length, qos, retain ? 1 : 0);
    if (mid >= 0) {
        LOG_DEBUG(TAG_MQTT, "Publish topic=%s len=%d qos=%d retain=%d mid=%d", topic, length, qos, retain ? 1 : 0, mid);
    } else {
        LOG_ERROR(TAG_MQTT, "Publish failed topic=%s rc=%d", topic, mid);
    }
    return mid;
}

void MqttClient::publishStatus(const char* state) {
    int mid = esp_mqtt_client_publish(client, status_topic, state, 0, Config::Mqtt::telemetry_qos, 1);
    if (mid < 0) {
        LOG_WARN(TAG_MQTT, "Status %s not published: %d", state, mid);
    }
}

void MqttClient::mqttEventHandler(void* handler_args, esp_event_base_t, int32_t, void* event_data) {
    auto* self = static_cast<MqttClient*>(handler_args);
    esp_mqtt_event_handle_t event = static_cast<esp_mqtt_event_handle_t>(event_data);
    self->handleEvent(event);
}

void MqttClient::handleEvent(esp_mqtt_event_handle_t event) {
    switch (event->event_id) {
        case MQTT_EVENT_CONNECTED:
            connected = true;
            if (Config::Mqtt::lwt_enable) {
                publishStatus("online");
            }
            LOG_INFO(TAG_MQTT, "%s", "MQTT connected");
            break;
        case MQTT_EVENT_DISCONNECTED:
            connected = false;
            LOG_WARN(TAG_MQTT, "%s", "MQTT disconnected");
            break;
        case MQTT_EVENT_ERROR:
            if (event->error_handle != nullptr) {
                LOG_ERROR(TAG_MQTT, "MQTT error type=%d", static_cast<int>(event->error_handle->error_type));
            } else {
                LOG_ERROR(TAG_MQTT, "%s", "MQTT error");
            }
            break;
        default:
            break;
    }
}
