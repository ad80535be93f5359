#include <gtest/gtest.h>
#include <main/sensors/codec.hpp>

namespace {
    DecodeError blankError() {
        return DecodeError{SensorKind::TEMPERATURE, 0, 0};
    }
}

TEST(Codec, HdcSampleDecodesTemperatureAndHumidity) {
    const uint8_t raw[] = {0x00, 0x63, 0x00, 0x30};
    DecodeError error = blankError();
    double celsius = 0.0;
    double percent = 0.0;

    ASSERT_TRUE(Codec::decodeTemperature(raw, sizeof(raw), celsius, error));
    ASSERT_TRUE(Codec::decodeHumidity(raw, sizeof(raw), percent, error));
    EXPECT_DOUBLE_EQ(23.81, celsius);
    EXPECT_DOUBLE_EQ(18.75, percent);
}

TEST(Codec, TemperatureStaysInsideSensorRange) {
    DecodeError error = blankError();
    double celsius = 0.0;

    const uint8_t low[] = {0x00, 0x00, 0x00, 0x00};
    ASSERT_TRUE(Codec::decodeTemperature(low, sizeof(low), celsius, error));
    EXPECT_DOUBLE_EQ(-40.0, celsius);

    const uint8_t high[] = {0xFF, 0xFF, 0x00, 0x00};
    ASSERT_TRUE(Codec::decodeTemperature(high, sizeof(high), celsius, error));
    EXPECT_GE(celsius, -40.0);
    EXPECT_LE(celsius, 125.0);
}

TEST(Codec, HumidityIgnoresStatusBits) {
    DecodeError error = blankError();
    double reference = 0.0;
    const uint8_t clean[] = {0x00, 0x00, 0x00, 0x80};
    ASSERT_TRUE(Codec::decodeHumidity(clean, sizeof(clean), reference, error));

    for (uint8_t bits = 1; bits < 4; ++bits) {
        const uint8_t flagged[] = {0x00, 0x00, bits, 0x80};
        double value = 0.0;
        ASSERT_TRUE(Codec::decodeHumidity(flagged, sizeof(flagged), value, error));
        EXPECT_DOUBLE_EQ(reference, value) << "status bits " << static_cast<int>(bits);
    }

    const uint8_t full[] = {0x00, 0x00, 0xFF, 0xFF};
    double value = 0.0;
    ASSERT_TRUE(Codec::decodeHumidity(full, sizeof(full), value, error));
    EXPECT_GE(value, 0.0);
    EXPECT_LT(value, 100.0);
}

TEST(Codec, IlluminanceUsesExponentAndMantissa) {
    DecodeError error = blankError();
    double lux = 0.0;

    const uint8_t raw[] = {0x10, 0x64};
    ASSERT_TRUE(Codec::decodeIlluminance(raw, sizeof(raw), lux, error));
    EXPECT_DOUBLE_EQ(2.00, lux);

    const uint8_t zero[] = {0x00, 0x00};
    ASSERT_TRUE(Codec::decodeIlluminance(zero, sizeof(zero), lux, error));
    EXPECT_DOUBLE_EQ(0.0, lux);
}

TEST(Codec, IlluminanceDoublesPerExponentStep) {
    DecodeError error = blankError();
    const uint16_t mantissa = 0x0123;
    double previous = 0.0;

    for (uint16_t exponent = 0; exponent < 15; ++exponent) {
        const uint16_t word = static_cast<uint16_t>((exponent << 12) | mantissa);
        const uint8_t raw[] = {static_cast<uint8_t>(word >> 8), static_cast<uint8_t>(word & 0xFF)};
        double lux = 0.0;
        ASSERT_TRUE(Codec::decodeIlluminance(raw, sizeof(raw), lux, error));
        if (exponent > 0) {
            EXPECT_NEAR(previous * 2.0, lux, 0.011) << "exponent " << exponent;
        }
        previous = lux;
    }
}

TEST(Codec, IlluminanceGrowsWithMantissa) {
    DecodeError error = blankError();
    double previous = -1.0;
    for (uint16_t mantissa = 0; mantissa < 0x1000; mantissa += 0x111) {
        const uint16_t word = static_cast<uint16_t>((0x3 << 12) | mantissa);
        const uint8_t raw[] = {static_cast<uint8_t>(word >> 8), static_cast<uint8_t>(word & 0xFF)};
        double lux = 0.0;
        ASSERT_TRUE(Codec::decodeIlluminance(raw, sizeof(raw), lux, error));
        EXPECT_GT(lux, previous);
        previous = lux;
    }
}

TEST(Codec, PressureReadsTrailingLittleEndianWord) {
    DecodeError error = blankError();
    double hpa = 0.0;

    const uint8_t raw[] = {0xAA, 0xBB, 0xCC, 0x4C, 0x8A, 0x01};
    ASSERT_TRUE(Codec::decodePressure(raw, sizeof(raw), hpa, error));
    EXPECT_DOUBLE_EQ(1009.40, hpa);
}

TEST(Codec, BatteryLevelIsRawPercent) {
    DecodeError error = blankError();
    double percent = 0.0;
    const uint8_t raw[] = {87};
    ASSERT_TRUE(Codec::decodeBatteryLevel(raw, sizeof(raw), percent, error));
    EXPECT_DOUBLE_EQ(87.0, percent);
}

TEST(Codec, WrongLengthIsRejectedWithLengths) {
    const uint8_t raw[] = {0x00, 0x63, 0x00};
    DecodeError error = blankError();
    double value = 123.0;

    EXPECT_FALSE(Codec::decodeHumidity(raw, sizeof(raw), value, error));
    EXPECT_EQ(SensorKind::HUMIDITY, error.kind);
    EXPECT_EQ(3u, error.received_length);
    EXPECT_EQ(Codec::HDC1000_LENGTH, error.expected_length);
    EXPECT_DOUBLE_EQ(123.0, value);

    const uint8_t longer[] = {0, 0, 0, 0, 0, 0, 0};
    EXPECT_FALSE(Codec::decodePressure(longer, sizeof(longer), value, error));
    EXPECT_EQ(SensorKind::PRESSURE, error.kind);
    EXPECT_EQ(7u, error.received_length);

    EXPECT_FALSE(Codec::decodeBatteryLevel(raw, 0, value, error));
    EXPECT_EQ(SensorKind::BATTERY, error.kind);
    EXPECT_EQ(0u, error.received_length);

    EXPECT_FALSE(Codec::decodeIlluminance(raw, 1, value, error));
    EXPECT_EQ(Codec::OPT3001_LENGTH, error.expected_length);
}

TEST(Codec, RoundsToTwoDecimals) {
    EXPECT_DOUBLE_EQ(1.23, Codec::roundTo2(1.234));
    EXPECT_DOUBLE_EQ(1.24, Codec::roundTo2(1.2351));
    EXPECT_DOUBLE_EQ(-40.0, Codec::roundTo2(-40.001));
}

TEST(Codec, ExactHalvesRoundToEven) {
    // 0xA000 -> 63.125 CEL, 0x0800 -> 3.125 %RH
    const uint8_t raw[] = {0x00, 0xA0, 0x00, 0x08};
    DecodeError error = blankError();
    double celsius = 0.0;
    double percent = 0.0;

    ASSERT_TRUE(Codec::decodeTemperature(raw, sizeof(raw), celsius, error));
    ASSERT_TRUE(Codec::decodeHumidity(raw, sizeof(raw), percent, error));
    EXPECT_DOUBLE_EQ(63.12, celsius);
    EXPECT_DOUBLE_EQ(3.12, percent);

    EXPECT_DOUBLE_EQ(0.12, Codec::roundTo2(0.125));
    EXPECT_DOUBLE_EQ(0.38, Codec::roundTo2(0.375));
}
