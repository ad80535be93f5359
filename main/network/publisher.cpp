#include <main/network/publisher.hpp>
#include <main/utils/logger.hpp>
#include <mjson.h>
#include <cctype>
#include <cstdio>

static const char* TAG = "Publisher";

namespace {
    // Enough digits for every decoded value (at most 2 decimals)
    static constexpr int VALUE_PRECISION = 10;
}

Publisher::Publisher(Broker& broker, const char* topic_root)
    : broker(broker),
      topic_root(topic_root) {}

bool Publisher::formatTopic(const char* root, const char* sensor_type, char* out, std::size_t out_size) {
    int written = std::snprintf(out, out_size, "%s/", root);
    if (written < 0 || static_cast<std::size_t>(written) >= out_size) {
        return false;
    }
    std::size_t pos = static_cast<std::size_t>(written);
    for (const char* p = sensor_type; *p != '\0'; ++p) {
        if (std::isspace(static_cast<unsigned char>(*p))) {
            continue;
        }
        if (pos + 1 >= out_size) {
            out[pos] = '\0';
            return false;
        }
        out[pos++] = *p;
    }
    out[pos] = '\0';
    return true;
}

bool Publisher::formatPayload(const MeasurementRecord& record, char* out, std::size_t out_size) {
    if (out_size < 2) {
        return false;
    }
    int n = mjson_snprintf(out, out_size,
                           "{%Q:{%Q:%Q,%Q:%Q,%Q:%Q,%Q:%.*g,%Q:%Q,%Q:%Q}}",
                           "Observation",
                           "AssetID", record.asset_id,
                           "SensorTypeCode", record.sensor_type,
                           "LocationID", record.location_id,
                           "MeasureContent", VALUE_PRECISION, record.value,
                           "MeasureUnitCode", record.unit,
                           "DateTime", record.timestamp);
    // mjson truncates silently at out_size - 1
    return n > 0 && static_cast<std::size_t>(n) < out_size - 1;
}

bool Publisher::publish(const MeasurementRecord& record) {
    char topic[TOPIC_MAX];
    char payload[PAYLOAD_MAX];
    if (!formatTopic(topic_root, record.sensor_type, topic, sizeof(topic))) {
        LOG_ERROR(TAG, "Topic too long for %s", record.sensor_type);
        return false;
    }
    if (!formatPayload(record, payload, sizeof(payload))) {
        LOG_ERROR(TAG, "Payload too long for %s", record.sensor_type);
        return false;
    }
    int mid = broker.publish(topic, payload, Config::Mqtt::telemetry_qos, Config::Mqtt::telemetry_retain);
    if (mid < 0) {
        LOG_WARN(TAG, "PublishError topic=%s rc=%d", topic, mid);
        return false;
    }
    LOG_INFO(TAG, "MQTT TX topic=%s payload=%s", topic, payload);
    return true;
}

PublishReport Publisher::publishBatch(const MeasurementBatch& batch) {
    PublishReport report{0, 0};
    if (!broker.isConnected()) {
        LOG_WARN(TAG, "PublishError broker offline, dropping %u records", static_cast<unsigned>(batch.count));
        report.failed = batch.count;
        return report;
    }
    for (std::size_t i = 0; i < batch.count; ++i) {
        if (publish(batch.records[i])) {
            ++report.published;
        } else {
            ++report.failed;
        }
    }
    return report;
}
