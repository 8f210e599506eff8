// LevelForge Generation
// scaffold.cpp - Empty level allocation

#include <levelforge/core/logger.hpp>
#include <levelforge/gen/errors.hpp>
#include <levelforge/gen/scaffold.hpp>

#include <algorithm>
#include <array>
#include <fmt/format.h>

namespace levelforge::gen {

namespace {

constexpr std::array<const char*, 5> NAME_PREFIXES = {"Ancient", "Dark", "Forgotten", "Mysterious", "Cursed"};
constexpr std::array<const char*, 5> NAME_SUFFIXES = {"Dungeon", "Caverns", "Ruins", "Temple", "Fortress"};

constexpr std::array<const char*, 5> OBJECTIVES = {"Find the treasure chamber", "Defeat the dungeon boss",
                                                   "Rescue the prisoners", "Collect ancient artifacts",
                                                   "Escape the collapsing dungeon"};

constexpr std::array<const char*, 5> DESCRIPTIONS = {
    "A dark and dangerous dungeon filled with traps and treasures.",
    "An ancient underground complex shrouded in mystery.",
    "A labyrinth of stone corridors and hidden chambers.",
    "A forgotten ruin teeming with supernatural forces.",
    "A vast cavern system with untold secrets."};

// Version-4 layout (8-4-4-4-12 hex digits) built from the seeded stream
std::string make_level_id(Rng& rng) {
    std::array<uint32_t, 4> words{};
    for (auto& word : words) {
        word = rng.next_u32();
    }
    words[1] = (words[1] & 0xFFFF0FFFu) | 0x00004000u;  // version nibble
    words[2] = (words[2] & 0x3FFFFFFFu) | 0x80000000u;  // RFC 4122 variant
    return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:04x}{:08x}", words[0], words[1] >> 16, words[1] & 0xFFFFu,
                       words[2] >> 16, words[2] & 0xFFFFu, words[3]);
}

std::vector<std::string> pick_objectives(Rng& rng) {
    std::vector<std::string> selected;
    int32_t count = rng.range(1, 3);
    for (int32_t i = 0; i < count; ++i) {
        std::string objective = rng.pick(OBJECTIVES);
        if (std::find(selected.begin(), selected.end(), objective) == selected.end()) {
            selected.push_back(std::move(objective));
        }
    }
    return selected;
}

}  // namespace

void validate_config(const LevelConfig& config) {
    if (config.width <= 0 || config.height <= 0) {
        throw ConfigError(fmt::format("Level dimensions must be positive, got {}x{}", config.width, config.height));
    }
    if (config.tile_size <= 0) {
        throw ConfigError(fmt::format("Tile size must be positive, got {}", config.tile_size));
    }
}

Level create_scaffold(const LevelConfig& config, Rng& rng, const std::string& generated_at) {
    validate_config(config);

    Level level;
    level.id = make_level_id(rng);
    if (config.name.has_value()) {
        level.name = *config.name;
    } else {
        const char* prefix = rng.pick(NAME_PREFIXES);
        const char* suffix = rng.pick(NAME_SUFFIXES);
        level.name = fmt::format("{} {}", prefix, suffix);
    }
    level.biome = config.biome();
    level.theme = config.theme;
    level.difficulty = config.difficulty;
    level.dimensions = Dimensions{config.width, config.height, config.tile_size};

    for (auto& layer : level.layers) {
        layer = TileLayer(config.width, config.height, TILE_NONE);
    }

    level.metadata.generated_at = generated_at;
    level.metadata.seed = rng.seed();
    level.metadata.objectives = pick_objectives(rng);
    level.metadata.description = rng.pick(DESCRIPTIONS);

    LEVELFORGE_LOG_DEBUG(core::log_category::GENERATION, "Scaffold '{}' allocated ({}x{}, {} objectives)", level.name,
                         config.width, config.height, level.metadata.objectives.size());
    return level;
}

}  // namespace levelforge::gen
