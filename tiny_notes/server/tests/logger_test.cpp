#include "logger.hpp"
#include "time_format.hpp"

#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <regex>

using namespace tinynotes::server;
using tinynotes::test::read_text;

class LoggerTest : public tinynotes::test::TempDirTest {};

TEST_F(LoggerTest, WritesTimestampedLines) {
    const auto file = test_dir / "logs" / "notes.log";
    {
        Logger logger(file.string(), LogLevel::kDebug, false);
        logger.info("created group Math");
        logger.error("disk full");
    }
    const auto text = read_text(file);
    EXPECT_TRUE(std::regex_search(
        text, std::regex(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2} \[INFO\] created group Math\n)")))
        << text;
    EXPECT_NE(text.find("[ERROR] disk full\n"), std::string::npos);
}

TEST_F(LoggerTest, DropsMessagesBelowMinimumLevel) {
    const auto file = test_dir / "notes.log";
    {
        Logger logger(file.string(), LogLevel::kWarn, false);
        logger.debug("noise");
        logger.info("chatter");
        logger.warn("careful");
    }
    const auto text = read_text(file);
    EXPECT_EQ(text.find("noise"), std::string::npos);
    EXPECT_EQ(text.find("chatter"), std::string::npos);
    EXPECT_NE(text.find("[WARN] careful"), std::string::npos);
}

TEST_F(LoggerTest, AppendsAcrossInstances) {
    const auto file = test_dir / "notes.log";
    Logger(file.string(), LogLevel::kInfo, false).info("first");
    Logger(file.string(), LogLevel::kInfo, false).info("second");
    const auto text = read_text(file);
    EXPECT_LT(text.find("first"), text.find("second"));
}

TEST(LogLevelTest, ParsesNames) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::kDebug);
    EXPECT_EQ(parse_log_level("INFO"), LogLevel::kInfo);
    EXPECT_EQ(parse_log_level("Warning"), LogLevel::kWarn);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::kWarn);
    EXPECT_EQ(parse_log_level("error"), LogLevel::kError);
    EXPECT_FALSE(parse_log_level("trace").has_value());
    EXPECT_FALSE(parse_log_level("").has_value());
}

TEST(TimeFormatTest, Iso8601IsUtcWithMilliseconds) {
    const std::chrono::system_clock::time_point epoch{};
    EXPECT_EQ(to_iso8601(epoch), "1970-01-01T00:00:00.000Z");
    EXPECT_EQ(to_iso8601(epoch + std::chrono::milliseconds(86400123)), "1970-01-02T00:00:00.123Z");
}
