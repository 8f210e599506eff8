// LevelForge Generation Tests
// exporter_test.cpp - tpt_level_v1 documents on disk

#include <gtest/gtest.h>

#include <levelforge/gen/exporter.hpp>
#include <levelforge/gen/scaffold.hpp>
#include <levelforge/platform/file_io.hpp>

#include <chrono>
#include <filesystem>

namespace levelforge::gen {
namespace {

using json = nlohmann::json;
using platform::FileSystem;

class ExporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = FileSystem::get_temp_directory() / "levelforge_exporter_test";
        FileSystem::create_directories(test_dir_);

        config_.width = 8;
        config_.height = 6;
        config_.biome_name = "town";
        config_.seed = 17;
        Rng rng(17);
        level_ = create_scaffold(config_, rng, "2024-03-09T14:05:00.250Z");
    }

    void TearDown() override { FileSystem::remove_all(test_dir_); }

    std::filesystem::path test_dir_;
    LevelConfig config_;
    Level level_;
    core::WallClock clock_ = core::fixed_wall_clock(core::WallTime{std::chrono::milliseconds(1709993100250LL)});
};

TEST_F(ExporterTest, DocumentCarriesFormatAndDate) {
    Exporter exporter({}, clock_);
    json document = exporter.to_json(level_, config_);

    EXPECT_EQ(document["format"], "tpt_level_v1");
    EXPECT_EQ(document["exportDate"], "2024-03-09T14:05:00.250Z");
    EXPECT_EQ(document["level"]["name"], level_.name);
    EXPECT_EQ(document["config"]["biomeType"], "town");
    EXPECT_EQ(document["config"]["seed"], 17);
}

TEST_F(ExporterTest, IndentControlsLayout) {
    ExportSettings compact;
    compact.indent = -1;
    EXPECT_EQ(Exporter(compact, clock_).to_string(level_, config_).find('\n'), std::string::npos);
    EXPECT_NE(Exporter({}, clock_).to_string(level_, config_).find("\n  \""), std::string::npos);
}

// Test: Writing the same level twice produces identical bytes
TEST_F(ExporterTest, OutputIsStable) {
    Exporter exporter({}, clock_);
    EXPECT_EQ(exporter.to_string(level_, config_), exporter.to_string(level_, config_));
}

TEST_F(ExporterTest, FileRoundTrip) {
    Exporter exporter({}, clock_);
    auto path = test_dir_ / "nested" / "town.json";
    ASSERT_TRUE(exporter.export_to_file(level_, config_, path));
    EXPECT_TRUE(FileSystem::is_file(path));

    auto loaded = Exporter::load_from_file(path);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->level, level_);
    EXPECT_EQ(loaded->config, config_);
    EXPECT_EQ(loaded->export_date, "2024-03-09T14:05:00.250Z");
}

TEST_F(ExporterTest, RejectsWrongFormat) {
    Exporter exporter({}, clock_);
    json document = exporter.to_json(level_, config_);
    document["format"] = "tpt_level_v2";
    EXPECT_FALSE(Exporter::from_json(document).has_value());

    document.erase("format");
    EXPECT_FALSE(Exporter::from_json(document).has_value());
}

TEST_F(ExporterTest, RejectsIncompleteDocument) {
    Exporter exporter({}, clock_);
    json document = exporter.to_json(level_, config_);
    document.erase("config");
    EXPECT_FALSE(Exporter::from_json(document).has_value());
    EXPECT_FALSE(Exporter::from_json(json("tpt_level_v1")).has_value());
}

TEST_F(ExporterTest, LoadFailsOnMissingOrMalformedFile) {
    EXPECT_FALSE(Exporter::load_from_file(test_dir_ / "absent.json").has_value());

    auto path = test_dir_ / "broken.json";
    ASSERT_TRUE(FileSystem::write_text(path, "{\"format\": \"tpt_level_v1\", "));
    EXPECT_FALSE(Exporter::load_from_file(path).has_value());
}

}  // namespace
}  // namespace levelforge::gen
