// LevelForge Core Tests
// config_test.cpp - Sectioned settings store tests

#include <gtest/gtest.h>

#include <levelforge/core/config.hpp>
#include <levelforge/platform/file_io.hpp>

#include <string>
#include <vector>

namespace levelforge::core {
namespace {

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        test_dir_ = platform::FileSystem::get_temp_directory() / "levelforge_config_test";
        platform::FileSystem::create_directories(test_dir_);
    }

    void TearDown() override { platform::FileSystem::remove_all(test_dir_); }
};

// Test: A fresh store carries the generation defaults
TEST_F(ConfigTest, DefaultsPresent) {
    Config config;
    EXPECT_EQ(config.get_int(config_section::GENERATION, config_key::MAX_PLACEMENT_ATTEMPTS), 20);
    EXPECT_EQ(config.get_int(config_section::GENERATION, config_key::TIMEOUT_MS, -1), 0);
    EXPECT_DOUBLE_EQ(config.get_double(config_section::GENERATION, config_key::MIN_REACHABLE_FRACTION), 0.8);
    EXPECT_EQ(config.get_int(config_section::GENERATION, config_key::CONNECTIVITY_FLOOR), 10);
    EXPECT_EQ(config.get_int(config_section::EXPORT, config_key::INDENT), 2);
    EXPECT_EQ(config.get_string(config_section::DEBUG, config_key::LOG_LEVEL), "info");
}

// Test: Missing keys and type mismatches return the supplied default
TEST_F(ConfigTest, GettersFallBackToDefault) {
    Config config;
    EXPECT_EQ(config.get_int("generation", "no_such_key", 7), 7);
    EXPECT_EQ(config.get_string("no_section", "key", "fallback"), "fallback");

    config.set_string(config_section::GENERATION, config_key::STREET_WIDTH, "wide");
    EXPECT_EQ(config.get_int(config_section::GENERATION, config_key::STREET_WIDTH, 3), 3);
    EXPECT_FALSE(config.get_bool(config_section::GENERATION, config_key::STREET_WIDTH, false));
}

TEST_F(ConfigTest, SetAndGetRoundTrip) {
    Config config;
    config.set_int(config_section::GENERATION, config_key::CASTLE_WALL_THICKNESS, 3);
    config.set_double(config_section::GENERATION, config_key::MIN_REACHABLE_FRACTION, 0.65);
    config.set_bool(config_section::DEBUG, "verbose", true);
    config.set_string(config_section::EXPORT, config_key::DIRECTORY, "levels");

    EXPECT_EQ(config.get_int(config_section::GENERATION, config_key::CASTLE_WALL_THICKNESS), 3);
    EXPECT_DOUBLE_EQ(config.get_double(config_section::GENERATION, config_key::MIN_REACHABLE_FRACTION), 0.65);
    EXPECT_TRUE(config.get_bool(config_section::DEBUG, "verbose"));
    EXPECT_EQ(config.get_string(config_section::EXPORT, config_key::DIRECTORY), "levels");
}

TEST_F(ConfigTest, DirtyTrackingAndCallback) {
    Config config;
    config.mark_clean();
    EXPECT_FALSE(config.is_dirty());

    std::vector<std::string> changed;
    config.set_change_callback([&](std::string_view section, std::string_view key) {
        changed.push_back(std::string(section) + "." + std::string(key));
    });

    config.set_int(config_section::GENERATION, config_key::TIMEOUT_MS, 500);
    EXPECT_TRUE(config.is_dirty());
    ASSERT_EQ(changed.size(), 1u);
    EXPECT_EQ(changed[0], "generation.timeout_ms");
}

TEST_F(ConfigTest, RemoveKeyAndSection) {
    Config config;
    EXPECT_TRUE(config.remove(config_section::EXPORT, config_key::INDENT));
    EXPECT_FALSE(config.has(config_section::EXPORT, config_key::INDENT));
    EXPECT_FALSE(config.remove(config_section::EXPORT, config_key::INDENT));

    EXPECT_TRUE(config.remove_section(config_section::DEBUG));
    EXPECT_FALSE(config.has_section(config_section::DEBUG));
}

TEST_F(ConfigTest, LoadFromString) {
    Config config;
    ASSERT_TRUE(config.load_from_string(R"({"generation": {"street_width": 4}})"));
    EXPECT_EQ(config.get_int(config_section::GENERATION, config_key::STREET_WIDTH), 4);
    // Keys absent from the document use the caller's default
    EXPECT_EQ(config.get_int(config_section::GENERATION, config_key::MAX_PLACEMENT_ATTEMPTS, 20), 20);
}

TEST_F(ConfigTest, LoadRejectsMalformedDocuments) {
    Config config;
    EXPECT_FALSE(config.load_from_string("{not json"));
    EXPECT_FALSE(config.load_from_string("[1, 2, 3]"));
    EXPECT_FALSE(config.load(test_dir_ / "missing.json"));
}

TEST_F(ConfigTest, SaveAndLoadFile) {
    auto path = test_dir_ / "nested" / "settings.json";
    {
        Config config;
        config.set_int(config_section::GENERATION, config_key::TIMEOUT_MS, 250);
        ASSERT_TRUE(config.save(path));
    }

    Config loaded;
    ASSERT_TRUE(loaded.load(path));
    EXPECT_EQ(loaded.get_path(), path);
    EXPECT_EQ(loaded.get_int(config_section::GENERATION, config_key::TIMEOUT_MS), 250);
}

TEST_F(ConfigTest, LoadOrCreateDefaultWritesFile) {
    auto path = test_dir_ / "fresh.json";
    ASSERT_FALSE(platform::FileSystem::exists(path));

    Config config;
    EXPECT_TRUE(config.load_or_create_default(path));
    EXPECT_TRUE(platform::FileSystem::exists(path));
    EXPECT_EQ(config.get_int(config_section::GENERATION, config_key::STREET_WIDTH), 2);
}

TEST_F(ConfigTest, SaveWithoutPathFails) {
    Config config;
    EXPECT_FALSE(config.save());
}

}  // namespace
}  // namespace levelforge::core
