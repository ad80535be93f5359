#include <gtest/gtest.h>
#include <cstdio>
#include <cstring>
#include <mjson.h>
#include <main/network/publisher.hpp>
#include "fakes.hpp"

namespace {
    static const char* ROOT = "Factory/ColorSorter/ConditionMonitoring";

    MeasurementRecord makeRecord(SensorKind kind, double value, const char* unit) {
        MeasurementRecord record{};
        std::snprintf(record.asset_id, sizeof(record.asset_id), "%s", "TI-SensorTag-27F186");
        std::snprintf(record.location_id, sizeof(record.location_id), "%s", "Labor_ColorSorter_Umgebung");
        record.kind = kind;
        record.sensor_type = sensorTypeName(kind);
        record.value = value;
        record.unit = unit;
        std::snprintf(record.timestamp, sizeof(record.timestamp), "%s", "2026-01-01T00:00:00Z");
        return record;
    }

    std::string field(const std::string& json, const char* path) {
        char out[64];
        int n = mjson_get_string(json.c_str(), static_cast<int>(json.size()), path, out, sizeof(out));
        return n < 0 ? std::string("<missing>") : std::string(out);
    }
}

TEST(Publisher, TopicDropsWhitespaceFromSensorType) {
    char topic[Publisher::TOPIC_MAX];
    ASSERT_TRUE(Publisher::formatTopic(ROOT, "Battery Level", topic, sizeof(topic)));
    EXPECT_STREQ("Factory/ColorSorter/ConditionMonitoring/BatteryLevel", topic);

    ASSERT_TRUE(Publisher::formatTopic(ROOT, "Temperature", topic, sizeof(topic)));
    EXPECT_STREQ("Factory/ColorSorter/ConditionMonitoring/Temperature", topic);
}

TEST(Publisher, TopicTooLongIsRejected) {
    char topic[16];
    EXPECT_FALSE(Publisher::formatTopic(ROOT, "Temperature", topic, sizeof(topic)));
}

TEST(Publisher, PayloadIsObservationDocument) {
    char payload[Publisher::PAYLOAD_MAX];
    MeasurementRecord record = makeRecord(SensorKind::TEMPERATURE, 23.81, "CEL");
    ASSERT_TRUE(Publisher::formatPayload(record, payload, sizeof(payload)));

    const std::string json(payload);
    EXPECT_EQ("TI-SensorTag-27F186", field(json, "$.Observation.AssetID"));
    EXPECT_EQ("Temperature", field(json, "$.Observation.SensorTypeCode"));
    EXPECT_EQ("Labor_ColorSorter_Umgebung", field(json, "$.Observation.LocationID"));
    EXPECT_EQ("CEL", field(json, "$.Observation.MeasureUnitCode"));
    EXPECT_EQ("2026-01-01T00:00:00Z", field(json, "$.Observation.DateTime"));

    double value = 0.0;
    ASSERT_EQ(1, mjson_get_number(json.c_str(), static_cast<int>(json.size()),
                                  "$.Observation.MeasureContent", &value));
    EXPECT_DOUBLE_EQ(23.81, value);
}

TEST(Publisher, PayloadKeepsSpaceInSensorTypeCode) {
    char payload[Publisher::PAYLOAD_MAX];
    MeasurementRecord record = makeRecord(SensorKind::BATTERY, 87.0, "P1");
    ASSERT_TRUE(Publisher::formatPayload(record, payload, sizeof(payload)));
    EXPECT_EQ("Battery Level", field(payload, "$.Observation.SensorTypeCode"));
}

TEST(Publisher, PayloadTooLongIsRejected) {
    char payload[32];
    MeasurementRecord record = makeRecord(SensorKind::PRESSURE, 1009.4, "A97");
    EXPECT_FALSE(Publisher::formatPayload(record, payload, sizeof(payload)));
}

TEST(Publisher, PublishesRetainedAtQosZero) {
    FakeBroker broker;
    Publisher publisher(broker, ROOT);

    ASSERT_TRUE(publisher.publish(makeRecord(SensorKind::ILLUMINANCE, 2.0, "LUX")));
    ASSERT_EQ(1u, broker.messages.size());
    EXPECT_EQ("Factory/ColorSorter/ConditionMonitoring/Illuminance", broker.messages[0].topic);
    EXPECT_EQ(0, broker.messages[0].qos);
    EXPECT_TRUE(broker.messages[0].retain);
}

TEST(Publisher, FailedMessageDoesNotStopBatch) {
    FakeBroker broker;
    broker.failing_calls.push_back(1);
    Publisher publisher(broker, ROOT);

    MeasurementBatch batch{};
    batch.records[0] = makeRecord(SensorKind::TEMPERATURE, 23.81, "CEL");
    batch.records[1] = makeRecord(SensorKind::HUMIDITY, 18.75, "P1");
    batch.records[2] = makeRecord(SensorKind::BATTERY, 87.0, "P1");
    batch.count = 3;

    PublishReport report = publisher.publishBatch(batch);
    EXPECT_EQ(2u, report.published);
    EXPECT_EQ(1u, report.failed);
    ASSERT_EQ(2u, broker.messages.size());
    EXPECT_EQ("Factory/ColorSorter/ConditionMonitoring/Temperature", broker.messages[0].topic);
    EXPECT_EQ("Factory/ColorSorter/ConditionMonitoring/BatteryLevel", broker.messages[1].topic);
}

TEST(Publisher, OfflineBrokerCountsWholeBatchAsFailed) {
    FakeBroker broker;
    broker.connected = false;
    Publisher publisher(broker, ROOT);

    MeasurementBatch batch{};
    batch.records[0] = makeRecord(SensorKind::TEMPERATURE, 23.81, "CEL");
    batch.records[1] = makeRecord(SensorKind::BATTERY, 87.0, "P1");
    batch.count = 2;

    PublishReport report = publisher.publishBatch(batch);
    EXPECT_EQ(0u, report.published);
    EXPECT_EQ(2u, report.failed);
    EXPECT_TRUE(broker.messages.empty());
}
