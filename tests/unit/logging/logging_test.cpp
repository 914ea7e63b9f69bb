#include <gtest/gtest.h>
#include <snipvault/logging/logging.h>
#include <spdlog/spdlog.h>

#include <filesystem>

#include "../../common/store_fixture.h"

using namespace snipvault;
using namespace snipvault::logging;

TEST(LoggingTest, ParsesLevelNames) {
    EXPECT_EQ(parseLevel("DEBUG"), spdlog::level::debug);
    EXPECT_EQ(parseLevel("warning"), spdlog::level::warn);
    EXPECT_EQ(parseLevel("err"), spdlog::level::err);
    EXPECT_FALSE(parseLevel("verbose").has_value());
}

TEST(LoggingTest, RejectsUnknownLevel) {
    LoggingConfig config;
    config.level = "chatty";
    auto r = configureLogging(config);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
}

TEST(LoggingTest, WritesRotatingFile) {
    const auto dir = test::uniqueTempPath("snipvault_logs", "");
    LoggingConfig config;
    config.level = "debug";
    config.file = dir / "store.log";
    config.loggerName = "snipvault-test";

    ASSERT_TRUE(configureLogging(config));
    EXPECT_EQ(spdlog::get_level(), spdlog::level::debug);
    spdlog::warn("logging test line");
    spdlog::default_logger()->flush();
    EXPECT_TRUE(std::filesystem::exists(config.file));

    LoggingConfig reset;
    reset.level = "warn";
    ASSERT_TRUE(configureLogging(reset));
    std::filesystem::remove_all(dir);
}
