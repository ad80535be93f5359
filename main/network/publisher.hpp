#ifndef PUBLISHER_HPP
#define PUBLISHER_HPP

#include <cstddef>
#include <main/config/config.hpp>
#include <main/models/measurement_record.hpp>
#include <main/network/broker.hpp>

struct PublishReport {
    std::size_t published;
    std::size_t failed;
};

// Maps measurement records to {root}/{SensorType} topics and Observation
// JSON payloads. Always QoS 0, retained.
class Publisher {
public:
    static constexpr std::size_t TOPIC_MAX = 128;
    static constexpr std::size_t PAYLOAD_MAX = 320;

    explicit Publisher(Broker& broker, const char* topic_root = Config::Mqtt::topic_root);

    // {root}/{sensor_type with whitespace removed}
    static bool formatTopic(const char* root, const char* sensor_type, char* out, std::size_t out_size);

    // {"Observation":{"AssetID":..,"SensorTypeCode":..,"LocationID":..,
    //  "MeasureContent":..,"MeasureUnitCode":..,"DateTime":..}}
    static bool formatPayload(const MeasurementRecord& record, char* out, std::size_t out_size);

    bool publish(const MeasurementRecord& record);

    // A failed message is logged and counted; the rest of the batch is still sent.
    // Nothing is attempted while the broker session is down.
    PublishReport publishBatch(const MeasurementBatch& batch);

private:
    Broker& broker;
    const char* topic_root;
};

#endif // PUBLISHER_HPP
