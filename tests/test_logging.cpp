#include <gtest/gtest.h>
#include <common/logging.hpp>

using namespace diffgrowth;

TEST(LoggingTest, ParsesLevelNames) {
    EXPECT_EQ(logging::parse_log_level("trace"), spdlog::level::trace);
    EXPECT_EQ(logging::parse_log_level("debug"), spdlog::level::debug);
    EXPECT_EQ(logging::parse_log_level("info"), spdlog::level::info);
    EXPECT_EQ(logging::parse_log_level("warn"), spdlog::level::warn);
    EXPECT_EQ(logging::parse_log_level("warning"), spdlog::level::warn);
    EXPECT_EQ(logging::parse_log_level("error"), spdlog::level::err);
    EXPECT_EQ(logging::parse_log_level("critical"), spdlog::level::critical);
    EXPECT_EQ(logging::parse_log_level("off"), spdlog::level::off);
}

TEST(LoggingTest, MissingOrUnknownLevelFallsBackToInfo) {
    EXPECT_EQ(logging::parse_log_level(nullptr), spdlog::level::info);
    EXPECT_EQ(logging::parse_log_level(""), spdlog::level::info);
    EXPECT_EQ(logging::parse_log_level("verbose"), spdlog::level::info);
    EXPECT_EQ(logging::parse_log_level("OFF"), spdlog::level::info);
}

TEST(LoggingTest, LoggerIsSharedAndRegistered) {
    auto first = logging::get_logger();
    auto second = logging::get_logger();
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first->name(), "diffgrowth");
    EXPECT_EQ(spdlog::get("diffgrowth"), first);
}
