#include <gtest/gtest.h>
#include <main/utils/clock.hpp>

TEST(TimeFormat, FormatsUtcSecondPrecision) {
    char out[24];
    ASSERT_TRUE(TimeFormat::formatIso8601(1767225600, out, sizeof(out)));
    EXPECT_STREQ("2026-01-01T00:00:00Z", out);

    ASSERT_TRUE(TimeFormat::formatIso8601(1767225600 + 86399, out, sizeof(out)));
    EXPECT_STREQ("2026-01-01T23:59:59Z", out);
}

TEST(TimeFormat, RejectsSmallBuffer) {
    char out[TimeFormat::ISO8601_LENGTH];
    EXPECT_FALSE(TimeFormat::formatIso8601(1767225600, out, sizeof(out)));
    EXPECT_STREQ("", out);
}

TEST(SystemClock, ReturnsCurrentTime) {
    SystemClock clock;
    const std::time_t before = std::time(nullptr);
    const std::time_t now = clock.now();
    EXPECT_GE(now, before);
}
