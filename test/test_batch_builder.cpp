#include <gtest/gtest.h>
#include <cstring>
#include <main/pipeline/batch_builder.hpp>
#include <main/sensors/sensor_registry.hpp>

namespace {
    static const std::time_t CAPTURED_AT = 1767225600;  // 2026-01-01T00:00:00Z

    void addSample(SampleSet& set, SensorKind kind, std::initializer_list<uint8_t> bytes,
                   std::time_t at = CAPTURED_AT) {
        RawSample& sample = set.samples[set.count++];
        sample.descriptor = SensorRegistry::sensorTag().find(kind);
        sample.length = 0;
        for (uint8_t b : bytes) {
            sample.bytes[sample.length++] = b;
        }
        sample.captured_at = at;
    }
}

TEST(BatchBuilder, AssetIdUsesLastSixHexDigits) {
    char out[32];
    ASSERT_TRUE(BatchBuilder::assetIdFromAddress("98:07:2D:27:F1:86", out, sizeof(out)));
    EXPECT_STREQ("TI-SensorTag-27F186", out);

    ASSERT_TRUE(BatchBuilder::assetIdFromAddress("a4-c1-38-0b-7e-e2", out, sizeof(out)));
    EXPECT_STREQ("TI-SensorTag-0b7ee2", out);
}

TEST(BatchBuilder, AssetIdRejectsShortAddressOrBuffer) {
    char out[32];
    EXPECT_FALSE(BatchBuilder::assetIdFromAddress("F1:86", out, sizeof(out)));
    EXPECT_STREQ("", out);

    char small[8];
    EXPECT_FALSE(BatchBuilder::assetIdFromAddress("98:07:2D:27:F1:86", small, sizeof(small)));
}

TEST(BatchBuilder, BuildsOneRecordPerSample) {
    BatchBuilder builder("TI-SensorTag-27F186", "Labor_ColorSorter_Umgebung");
    SampleSet samples{};
    addSample(samples, SensorKind::TEMPERATURE, {0x00, 0x63, 0x00, 0x30});
    addSample(samples, SensorKind::HUMIDITY, {0x00, 0x63, 0x00, 0x30});
    addSample(samples, SensorKind::ILLUMINANCE, {0x10, 0x64}, CAPTURED_AT + 61);

    MeasurementBatch batch{};
    AcquisitionError error = AcquisitionError::none();
    ASSERT_TRUE(builder.build(samples, batch, error));
    ASSERT_EQ(3u, batch.count);

    const MeasurementRecord& temperature = batch.records[0];
    EXPECT_STREQ("TI-SensorTag-27F186", temperature.asset_id);
    EXPECT_STREQ("Labor_ColorSorter_Umgebung", temperature.location_id);
    EXPECT_STREQ("Temperature", temperature.sensor_type);
    EXPECT_STREQ("CEL", temperature.unit);
    EXPECT_DOUBLE_EQ(23.81, temperature.value);
    EXPECT_STREQ("2026-01-01T00:00:00Z", temperature.timestamp);

    EXPECT_DOUBLE_EQ(18.75, batch.records[1].value);
    EXPECT_STREQ("P1", batch.records[1].unit);
    EXPECT_STREQ(temperature.timestamp, batch.records[1].timestamp);

    EXPECT_DOUBLE_EQ(2.00, batch.records[2].value);
    EXPECT_STREQ("LUX", batch.records[2].unit);
    EXPECT_STREQ("2026-01-01T00:01:01Z", batch.records[2].timestamp);
}

TEST(BatchBuilder, ShortSampleDropsWholeBatch) {
    BatchBuilder builder("TI-SensorTag-27F186", "Labor_ColorSorter_Umgebung");
    SampleSet samples{};
    addSample(samples, SensorKind::ILLUMINANCE, {0x10, 0x64});
    addSample(samples, SensorKind::PRESSURE, {0x00, 0x00, 0x00, 0x4C});
    addSample(samples, SensorKind::BATTERY, {87});

    MeasurementBatch batch{};
    AcquisitionError error = AcquisitionError::none();
    EXPECT_FALSE(builder.build(samples, batch, error));
    EXPECT_EQ(0u, batch.count);
    EXPECT_EQ(ErrorKind::DECODE, error.kind);
    EXPECT_EQ(SensorKind::PRESSURE, error.sensor);
    EXPECT_EQ(4u, error.received_length);
    EXPECT_EQ(6u, error.expected_length);
}

TEST(BatchBuilder, BatteryLevelRecord) {
    BatchBuilder builder("TI-SensorTag-27F186", "Labor_ColorSorter_Umgebung");
    SampleSet samples{};
    addSample(samples, SensorKind::BATTERY, {100});

    MeasurementBatch batch{};
    AcquisitionError error = AcquisitionError::none();
    ASSERT_TRUE(builder.build(samples, batch, error));
    ASSERT_EQ(1u, batch.count);
    EXPECT_STREQ("Battery Level", batch.records[0].sensor_type);
    EXPECT_DOUBLE_EQ(100.0, batch.records[0].value);
}
