// LevelForge Core Tests
// logger_test.cpp - Category logger tests

#include <gtest/gtest.h>

#include <levelforge/core/logger.hpp>
#include <levelforge/platform/file_io.hpp>

namespace levelforge::core {
namespace {

class LoggerTest : public ::testing::Test {
protected:
    void TearDown() override { Logger::shutdown(); }
};

TEST_F(LoggerTest, LevelNamesRoundTrip) {
    EXPECT_STREQ(log_level_to_string(LogLevel::Trace), "trace");
    EXPECT_STREQ(log_level_to_string(LogLevel::Critical), "critical");

    EXPECT_EQ(log_level_from_string("debug"), LogLevel::Debug);
    EXPECT_EQ(log_level_from_string("warning"), LogLevel::Warn);
    EXPECT_EQ(log_level_from_string("off"), LogLevel::Off);
    EXPECT_FALSE(log_level_from_string("loud").has_value());
}

// Test: Logging before initialize goes to spdlog's default logger
TEST_F(LoggerTest, UsableBeforeInitialize) {
    EXPECT_FALSE(Logger::is_initialized());
    LEVELFORGE_LOG_INFO(log_category::GENERATION, "message before init {}", 1);
    EXPECT_FALSE(Logger::is_initialized());
}

TEST_F(LoggerTest, InitializeConsoleOnly) {
    LoggerConfig config;
    config.file_output = false;
    config.console_level = LogLevel::Warn;
    Logger::initialize(config);

    EXPECT_TRUE(Logger::is_initialized());
    EXPECT_EQ(Logger::get_global_level(), LogLevel::Warn);
    LEVELFORGE_LOG_WARN(log_category::VALIDATION, "warning {}", "text");
}

TEST_F(LoggerTest, InitializeWithFileSink) {
    auto log_dir = platform::FileSystem::get_temp_directory() / "levelforge_logger_test";
    LoggerConfig config;
    config.log_directory = log_dir;
    Logger::initialize(config);

    LEVELFORGE_LOG_INFO(log_category::EXPORT, "written to file");
    Logger::flush();
    EXPECT_TRUE(platform::FileSystem::exists(log_dir / config.log_filename));

    Logger::shutdown();
    platform::FileSystem::remove_all(log_dir);
}

TEST_F(LoggerTest, CategoryLevelOverridesGlobal) {
    LoggerConfig config;
    config.file_output = false;
    Logger::initialize(config);

    Logger::set_category_level(log_category::GEOMETRY, LogLevel::Trace);
    EXPECT_EQ(Logger::get_category_level(log_category::GEOMETRY), LogLevel::Trace);
    EXPECT_EQ(Logger::get_category_level(log_category::CLI), Logger::get_global_level());
}

TEST_F(LoggerTest, ShutdownResetsState) {
    LoggerConfig config;
    config.file_output = false;
    Logger::initialize(config);
    Logger::set_global_level(LogLevel::Error);

    Logger::shutdown();
    EXPECT_FALSE(Logger::is_initialized());
    EXPECT_EQ(Logger::get_global_level(), LogLevel::Info);
}

}  // namespace
}  // namespace levelforge::core
