// LevelForge Generation Tests
// scaffold_test.cpp - Level allocation and config validation

#include <gtest/gtest.h>

#include <levelforge/gen/errors.hpp>
#include <levelforge/gen/scaffold.hpp>

#include <algorithm>
#include <regex>
#include <set>

namespace levelforge::gen {
namespace {

class ScaffoldTest : public ::testing::Test {
protected:
    LevelConfig config_;
    const std::string timestamp_ = "2024-01-01T00:00:00.000Z";
};

TEST_F(ScaffoldTest, AllocatesSixUnassignedLayers) {
    config_.width = 12;
    config_.height = 7;
    Rng rng(1);
    Level level = create_scaffold(config_, rng, timestamp_);

    EXPECT_EQ(level.dimensions, (Dimensions{12, 7, 32}));
    for (LayerId id : ALL_LAYERS) {
        const auto& layer = level.layer(id);
        EXPECT_EQ(layer.width(), 12);
        EXPECT_EQ(layer.height(), 7);
        EXPECT_TRUE(std::all_of(layer.cells().begin(), layer.cells().end(),
                                [](TileId tile) { return tile == TILE_NONE; }))
            << layer_id_to_string(id);
    }
    EXPECT_TRUE(level.entities.empty());
    EXPECT_FALSE(level.metadata.start_point.has_value());
}

TEST_F(ScaffoldTest, MetadataPopulated) {
    Rng rng(77);
    Level level = create_scaffold(config_, rng, timestamp_);

    EXPECT_EQ(level.metadata.generated_at, timestamp_);
    EXPECT_EQ(level.metadata.seed, 77u);
    EXPECT_EQ(level.metadata.version, "1.0");
    EXPECT_FALSE(level.metadata.description.empty());

    const auto& objectives = level.metadata.objectives;
    EXPECT_GE(objectives.size(), 1u);
    EXPECT_LE(objectives.size(), 3u);
    std::set<std::string> unique(objectives.begin(), objectives.end());
    EXPECT_EQ(unique.size(), objectives.size());
}

TEST_F(ScaffoldTest, IdIsUuidShaped) {
    Rng rng(5);
    Level level = create_scaffold(config_, rng, timestamp_);
    std::regex uuid("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
    EXPECT_TRUE(std::regex_match(level.id, uuid)) << level.id;
}

// Test: Same seed yields the same id, name and metadata
TEST_F(ScaffoldTest, DeterministicForSeed) {
    Rng a(2024);
    Rng b(2024);
    EXPECT_EQ(create_scaffold(config_, a, timestamp_), create_scaffold(config_, b, timestamp_));
}

TEST_F(ScaffoldTest, NameFromConfigOrGenerated) {
    Rng rng(8);
    Level generated = create_scaffold(config_, rng, timestamp_);
    EXPECT_NE(generated.name.find(' '), std::string::npos);

    config_.name = "The Sunken Vault";
    Rng rng2(8);
    EXPECT_EQ(create_scaffold(config_, rng2, timestamp_).name, "The Sunken Vault");
}

TEST_F(ScaffoldTest, CopiesConfigFields) {
    config_.biome_name = "forest";
    config_.theme = "autumn";
    config_.difficulty = "hard";
    Rng rng(3);
    Level level = create_scaffold(config_, rng, timestamp_);
    EXPECT_EQ(level.biome, BiomeType::Forest);
    EXPECT_EQ(level.theme, "autumn");
    EXPECT_EQ(level.difficulty, "hard");
}

TEST_F(ScaffoldTest, RejectsNonPositiveDimensions) {
    Rng rng(1);

    config_.width = 0;
    EXPECT_THROW((void)create_scaffold(config_, rng, timestamp_), ConfigError);

    config_.width = 10;
    config_.height = -4;
    EXPECT_THROW(validate_config(config_), ConfigError);

    config_.height = 10;
    config_.tile_size = 0;
    EXPECT_THROW(validate_config(config_), ConfigError);

    config_.tile_size = 16;
    EXPECT_NO_THROW(validate_config(config_));
}

}  // namespace
}  // namespace levelforge::gen
