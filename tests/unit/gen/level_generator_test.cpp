// LevelForge Generation Tests
// level_generator_test.cpp - End-to-end generation

#include <gtest/gtest.h>

#include <levelforge/core/config.hpp>
#include <levelforge/gen/errors.hpp>
#include <levelforge/gen/exporter.hpp>
#include <levelforge/gen/level_generator.hpp>
#include <levelforge/gen/serialization.hpp>
#include <levelforge/gen/tile.hpp>

#include <chrono>
#include <set>
#include <string>

namespace levelforge::gen {
namespace {

class LevelGeneratorTest : public ::testing::Test {
protected:
    LevelConfig make_config(const std::string& biome, uint64_t seed, int32_t width = 32, int32_t height = 24) {
        LevelConfig config;
        config.biome_name = biome;
        config.width = width;
        config.height = height;
        config.seed = seed;
        return config;
    }

    core::WallClock clock_ = core::fixed_wall_clock(core::WallTime{std::chrono::seconds(1700000000LL)});
    LevelGenerator generator_{GenerationSettings{}, clock_};
};

// Test: A seeded 32x24 dungeon is connected and within the room range
TEST_F(LevelGeneratorTest, DungeonEndToEnd) {
    auto result = generator_.generate(make_config("dungeon", 42));
    ASSERT_TRUE(result.ok());

    const Level& level = *result.level;
    EXPECT_EQ(level.dimensions, (Dimensions{32, 24, 32}));
    EXPECT_EQ(level.biome, BiomeType::Dungeon);
    EXPECT_GE(result.regions.at("room"), 5u);
    EXPECT_LE(result.regions.at("room"), 11u);
    EXPECT_GE(level.count_walkable(), 10u);
    EXPECT_TRUE(result.validation.is_connected);
    EXPECT_EQ(result.completed_phases.size(), SYNTHESIS_PHASE_COUNT);
    EXPECT_EQ(result.config.seed, 42u);
    EXPECT_EQ(level.metadata.seed, 42u);
    EXPECT_EQ(level.metadata.generated_at, "2023-11-14T22:13:20.000Z");
}

TEST_F(LevelGeneratorTest, EveryBiomeCompletes) {
    for (const char* biome : {"dungeon", "cave", "forest", "town", "castle"}) {
        auto result = generator_.generate(make_config(biome, 5, 40, 30));
        ASSERT_TRUE(result.ok()) << biome;
        EXPECT_EQ(biome_type_to_string(result.level->biome), std::string(biome));
        EXPECT_TRUE(result.validation.has_start_point) << biome;
        EXPECT_GE(result.validation.score, 0) << biome;
        EXPECT_LE(result.validation.score, 100) << biome;
    }
}

TEST_F(LevelGeneratorTest, CaveUsesCaveVocabulary) {
    auto result = generator_.generate(make_config("cave", 7, 40, 40));
    ASSERT_TRUE(result.ok());

    const auto& registry = TileRegistry::instance();
    const std::set<std::string> foreign = {"dungeon_floor", "dungeon_wall", "forest_grass", "town_street",
                                           "castle_stone"};
    for (LayerId id : ALL_LAYERS) {
        for (TileId tile : result.level->layer(id).cells()) {
            EXPECT_EQ(foreign.count(std::string(registry.name_of(tile))), 0u) << registry.name_of(tile);
        }
    }
}

TEST_F(LevelGeneratorTest, UnknownBiomeFallsBackToDungeon) {
    auto result = generator_.generate(make_config("swamp", 3));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.level->biome, BiomeType::Dungeon);
    EXPECT_EQ(result.regions.count("room"), 1u);
}

// Test: Fixed seed and clock give byte-identical documents
TEST_F(LevelGeneratorTest, ReproducibleForSeed) {
    Exporter exporter({}, clock_);
    for (const char* biome : {"dungeon", "cave", "forest", "town", "castle"}) {
        auto first = generator_.generate(make_config(biome, 2024));
        auto second = generator_.generate(make_config(biome, 2024));
        ASSERT_TRUE(first.ok() && second.ok());
        EXPECT_EQ(exporter.to_string(*first.level, first.config), exporter.to_string(*second.level, second.config))
            << biome;
        EXPECT_EQ(validation_report_to_json(first.validation), validation_report_to_json(second.validation));
    }
}

TEST_F(LevelGeneratorTest, MissingSeedIsResolved) {
    LevelConfig config;
    auto result = generator_.generate(config);
    ASSERT_TRUE(result.ok());
    ASSERT_TRUE(result.config.seed.has_value());
    EXPECT_EQ(result.level->metadata.seed, *result.config.seed);
}

TEST_F(LevelGeneratorTest, InvalidDimensionsThrow) {
    LevelConfig config = make_config("dungeon", 1, 0, 10);
    EXPECT_THROW((void)generator_.generate(config), ConfigError);

    config = make_config("dungeon", 1, 10, 10);
    config.tile_size = -1;
    EXPECT_THROW((void)generator_.generate(config), ConfigError);
}

TEST_F(LevelGeneratorTest, CancelledTokenStopsBeforeFirstPhase) {
    CancellationToken token;
    token.cancel();
    auto result = generator_.generate(make_config("forest", 9), token);

    EXPECT_EQ(result.status, GenerationStatus::Cancelled);
    EXPECT_FALSE(result.ok());
    EXPECT_FALSE(result.level.has_value());
    EXPECT_TRUE(result.completed_phases.empty());
}

TEST_F(LevelGeneratorTest, TokenCopiesShareState) {
    CancellationToken token;
    CancellationToken copy = token;
    EXPECT_FALSE(copy.is_cancelled());
    token.cancel();
    EXPECT_TRUE(copy.is_cancelled());
}

TEST_F(LevelGeneratorTest, AsyncMatchesSync) {
    auto future = generator_.generate_async(make_config("town", 11));
    auto async_result = future.get();
    auto sync_result = generator_.generate(make_config("town", 11));

    ASSERT_TRUE(async_result.ok());
    EXPECT_EQ(*async_result.level, *sync_result.level);
}

TEST_F(LevelGeneratorTest, AsyncSurfacesConfigError) {
    auto future = generator_.generate_async(make_config("town", 11, -5, 10));
    EXPECT_THROW((void)future.get(), ConfigError);
}

// Test: A one millisecond budget cannot cover every phase of a large cave
TEST_F(LevelGeneratorTest, ExpiredDeadlineTimesOut) {
    GenerationSettings settings;
    settings.timeout = std::chrono::milliseconds(1);
    LevelGenerator generator(settings, clock_);

    auto result = generator.generate(make_config("cave", 9, 512, 512));
    EXPECT_EQ(result.status, GenerationStatus::TimedOut);
    EXPECT_FALSE(result.ok());
    EXPECT_FALSE(result.level.has_value());
    EXPECT_LT(result.completed_phases.size(), SYNTHESIS_PHASE_COUNT);
}

// Test: The returned future stays valid after the generator is gone
TEST_F(LevelGeneratorTest, AsyncOutlivesGenerator) {
    auto future = LevelGenerator(GenerationSettings{}, clock_).generate_async(make_config("town", 11));
    auto async_result = future.get();
    auto sync_result = generator_.generate(make_config("town", 11));

    ASSERT_TRUE(async_result.ok());
    ASSERT_TRUE(sync_result.ok());
    EXPECT_EQ(*async_result.level, *sync_result.level);
}

TEST_F(LevelGeneratorTest, StatusNames) {
    EXPECT_STREQ(generation_status_to_string(GenerationStatus::Completed), "completed");
    EXPECT_STREQ(generation_status_to_string(GenerationStatus::Cancelled), "cancelled");
    EXPECT_STREQ(generation_status_to_string(GenerationStatus::TimedOut), "timed_out");
}

TEST_F(LevelGeneratorTest, SettingsFromConfig) {
    core::Config config;
    config.set_int(core::config_section::GENERATION, core::config_key::MAX_PLACEMENT_ATTEMPTS, 0);
    config.set_int(core::config_section::GENERATION, core::config_key::STREET_WIDTH, 3);
    config.set_int(core::config_section::GENERATION, core::config_key::TIMEOUT_MS, 250);
    config.set_double(core::config_section::GENERATION, core::config_key::MIN_REACHABLE_FRACTION, 0.6);

    auto settings = GenerationSettings::from_config(config);
    EXPECT_EQ(settings.synthesis.max_placement_attempts, 1);
    EXPECT_EQ(settings.synthesis.street_width, 3);
    EXPECT_EQ(settings.timeout.count(), 250);
    EXPECT_DOUBLE_EQ(settings.post_process.min_reachable_fraction, 0.6);
}

}  // namespace
}  // namespace levelforge::gen
