#include <gtest/gtest.h>
#include <string>
#include <vector>
#include <main/utils/logger.hpp>

namespace {
    struct Line {
        LogLevel level;
        std::string tag;
        std::string message;
    };
    std::vector<Line> g_lines;

    void captureSink(LogLevel level, const char* tag, const char* message) {
        g_lines.push_back(Line{level, tag, message});
    }

    class LoggerTest : public ::testing::Test {
    protected:
        void SetUp() override {
            g_lines.clear();
            saved_level = Logger::getLevel();
            Logger::setSink(&captureSink);
        }
        void TearDown() override {
            Logger::setSink(nullptr);
            Logger::setLevel(saved_level);
        }
        LogLevel saved_level = LogLevel::INFO;
    };
}

TEST_F(LoggerTest, FormatsIntoSink) {
    Logger::setLevel(LogLevel::INFO);
    LOG_INFO("TEST", "value=%d name=%s", 42, "tag");

    ASSERT_EQ(1u, g_lines.size());
    EXPECT_EQ(LogLevel::INFO, g_lines[0].level);
    EXPECT_EQ("TEST", g_lines[0].tag);
    EXPECT_EQ("value=42 name=tag", g_lines[0].message);
}

TEST_F(LoggerTest, LevelFiltersMoreVerboseMessages) {
    Logger::setLevel(LogLevel::WARN);
    LOG_DEBUG("TEST", "%s", "hidden");
    LOG_INFO("TEST", "%s", "hidden");
    LOG_WARN("TEST", "%s", "shown");
    LOG_ERROR("TEST", "%s", "shown");

    ASSERT_EQ(2u, g_lines.size());
    EXPECT_EQ(LogLevel::WARN, g_lines[0].level);
    EXPECT_EQ(LogLevel::ERROR, g_lines[1].level);
}

TEST_F(LoggerTest, LongMessageIsTruncated) {
    Logger::setLevel(LogLevel::INFO);
    const std::string longText(LOGGER_MAX_MESSAGE_LEN * 2, 'x');
    LOG_INFO("TEST", "%s", longText.c_str());

    ASSERT_EQ(1u, g_lines.size());
    EXPECT_EQ(static_cast<std::size_t>(LOGGER_MAX_MESSAGE_LEN - 1), g_lines[0].message.size());
}
