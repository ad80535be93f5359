#include <gtest/gtest.h>
#include <main/sensors/codec.hpp>
#include <main/sensors/sensor_registry.hpp>

TEST(SensorRegistry, SensorTagOrderAndUnits) {
    const SensorRegistry& registry = SensorRegistry::sensorTag();
    ASSERT_EQ(5u, registry.size());

    const SensorKind order[] = {SensorKind::TEMPERATURE, SensorKind::HUMIDITY, SensorKind::ILLUMINANCE,
                                SensorKind::PRESSURE, SensorKind::BATTERY};
    const char* units[] = {"CEL", "P1", "LUX", "A97", "P1"};
    for (std::size_t i = 0; i < registry.size(); ++i) {
        EXPECT_EQ(order[i], registry.at(i).kind) << i;
        EXPECT_STREQ(units[i], registry.at(i).unit) << i;
    }
}

TEST(SensorRegistry, SensorTagCharacteristics) {
    const SensorRegistry& registry = SensorRegistry::sensorTag();

    const SensorDescriptor* humidity = registry.find(SensorKind::HUMIDITY);
    ASSERT_NE(nullptr, humidity);
    EXPECT_EQ(0xAA22, humidity->config_char.alias());
    EXPECT_EQ(0xAA21, humidity->data_char.alias());
    EXPECT_EQ(sensorTagUuid(0xAA21), humidity->data_char);
    EXPECT_EQ(1800u, humidity->settle_ms);
    ASSERT_EQ(1u, humidity->activation_length);
    EXPECT_EQ(0x01, humidity->activation[0]);

    const SensorDescriptor* light = registry.find(SensorKind::ILLUMINANCE);
    ASSERT_NE(nullptr, light);
    EXPECT_EQ(0xAA71, light->data_char.alias());
    EXPECT_EQ(Codec::OPT3001_LENGTH, light->expected_length);

    const SensorDescriptor* battery = registry.find(SensorKind::BATTERY);
    ASSERT_NE(nullptr, battery);
    EXPECT_FALSE(battery->needsActivation());
    EXPECT_EQ(sigUuid(0x2A19), battery->data_char);
    EXPECT_NE(sensorTagUuid(0x2A19), battery->data_char);
}

TEST(SensorRegistry, TemperatureAndHumidityShareOneRead) {
    const SensorRegistry& registry = SensorRegistry::sensorTag();
    EXPECT_EQ(2u, registry.groupLength(0));
    EXPECT_EQ(1u, registry.groupLength(1));
    EXPECT_EQ(1u, registry.groupLength(2));
    EXPECT_EQ(1u, registry.groupLength(3));
    EXPECT_EQ(1u, registry.groupLength(4));
    EXPECT_EQ(0u, registry.groupLength(5));
}

TEST(SensorRegistry, FindReturnsNullForUnregisteredKind) {
    const SensorDescriptor table[] = {
        {SensorKind::BATTERY, {}, 0, sigUuid(0x2A19), sigUuid(0x2A19), 0, "P1",
         Codec::BATTERY_LENGTH, &Codec::decodeBatteryLevel},
    };
    SensorRegistry registry(table, 1);
    EXPECT_EQ(&table[0], registry.find(SensorKind::BATTERY));
    EXPECT_EQ(nullptr, registry.find(SensorKind::PRESSURE));
}

TEST(SensorRegistry, OversizedTableIsClamped) {
    SensorDescriptor table[kMaxSensors + 2] = {};
    for (SensorDescriptor& d : table) {
        d = SensorDescriptor{SensorKind::BATTERY, {}, 0, sigUuid(0x2A19), sigUuid(0x2A19), 0, "P1",
                             Codec::BATTERY_LENGTH, &Codec::decodeBatteryLevel};
    }
    SensorRegistry registry(table, kMaxSensors + 2);
    EXPECT_EQ(kMaxSensors, registry.size());
}
