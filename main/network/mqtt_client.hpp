#ifndef MQTT_CLIENT_HPP
#define MQTT_CLIENT_HPP

#include <cstdint>
#include <mqtt_client.h>
#include <main/network/broker.hpp>

// esp-mqtt session kept open across acquisition cycles
class MqttClient : public Broker {
public:
    // Construct using values from Config::Mqtt and Config::Device
    MqttClient();
    MqttClient(const char* host, int port, const char* client_id);
    ~MqttClient() override;

    MqttClient(const MqttClient&) = delete;
    MqttClient& operator=(const MqttClient&) = delete;

    bool connect();
    void disconnect();
    bool isConnected() const override;

    int publish(const char* topic, const char* payload, int qos, bool retain) override;

private:
    static void mqttEventHandler(void* handler_args, esp_event_base_t base, int32_t event_id, void* event_data);
    void handleEvent(esp_mqtt_event_handle_t event);
    void publishStatus(const char* state);

    esp_mqtt_client_handle_t client;
    const char* host;
    int port;
    const char* client_id;
    volatile bool connected;
    char uri[128];
    char status_topic[128];
};

#endif // MQTT_CLIENT_HPP
