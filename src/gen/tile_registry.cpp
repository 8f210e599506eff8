// LevelForge Generation
// tile_registry.cpp - Tile registry singleton implementation

#include <levelforge/core/logger.hpp>
#include <levelforge/gen/tile.hpp>
#include <unordered_map>
#include <vector>

namespace levelforge::gen {

// ============================================================================
// TileType Implementation
// ============================================================================

TileType::TileType(TileId id, const TileTypeDesc& desc)
    : id_(id), name_(desc.name), layer_(desc.layer), flags_(desc.flags) {}

// ============================================================================
// TileRegistry Implementation
// ============================================================================

struct TileRegistry::Impl {
    std::vector<std::unique_ptr<TileType>> tiles;  // index == id, slot 0 empty
    std::unordered_map<std::string, TileId> name_to_id;
};

TileRegistry::TileRegistry() : impl_(std::make_unique<Impl>()) {
    impl_->tiles.reserve(160);
    impl_->tiles.push_back(nullptr);  // TILE_NONE
    register_defaults();
}

TileRegistry::~TileRegistry() = default;

const TileRegistry& TileRegistry::instance() {
    static TileRegistry instance;
    return instance;
}

TileId TileRegistry::register_tile(const TileTypeDesc& desc) {
    auto existing = impl_->name_to_id.find(desc.name);
    if (existing != impl_->name_to_id.end()) {
        LEVELFORGE_LOG_WARN(core::log_category::GENERATION, "Tile '{}' already registered", desc.name);
        return existing->second;
    }

    TileId id = static_cast<TileId>(impl_->tiles.size());
    if (id >= TILE_INVALID) {
        LEVELFORGE_LOG_ERROR(core::log_category::GENERATION, "Tile registry full, cannot register '{}'", desc.name);
        return TILE_INVALID;
    }

    std::unique_ptr<TileType> tile(new TileType(id, desc));
    impl_->tiles.push_back(std::move(tile));
    impl_->name_to_id.emplace(desc.name, id);
    return id;
}

void TileRegistry::register_defaults() {
    auto reg = [this](const char* name, LayerId layer, TileFlags flags) {
        TileTypeDesc desc;
        desc.name = name;
        desc.layer = layer;
        desc.flags = flags;
        register_tile(desc);
    };

    const TileFlags walk = TileFlags::Walkable;
    const TileFlags block = TileFlags::Blocking;
    const TileFlags none = TileFlags::None;
    const TileFlags light = TileFlags::Emissive;

    // Background ground (two tones per biome)
    for (const char* name : {"dungeon_bedrock", "dungeon_bedrock_cracked", "cave_bedrock", "cave_bedrock_damp",
                             "forest_soil", "forest_soil_mossy", "town_soil", "town_soil_packed",
                             "castle_foundation", "castle_foundation_worn"}) {
        reg(name, LayerId::Background, none);
    }

    // Terrain
    for (const char* name : {"dungeon_floor", "cave_floor", "forest_grass", "forest_clearing", "forest_path",
                             "town_dirt", "town_street", "castle_stone", "castle_stone_mossy",
                             "castle_cobblestone", "castle_keep_floor", "castle_section_floor"}) {
        reg(name, LayerId::Terrain, walk);
    }
    reg("cave_water", LayerId::Terrain, walk | TileFlags::Liquid);

    // Blocking structures
    for (const char* name : {// dungeon and cave
                             "dungeon_wall", "cave_wall", "stalagmite", "pillar",
                             // forest
                             "oak_tree", "pine_tree", "birch_tree", "willow_tree", "ancient_tree", "ruins", "shrine",
                             "statue", "well", "wagon",
                             // town
                             "town_building", "town_window", "town_well", "town_statue", "town_fountain", "town_cart",
                             "market_stall",
                             // castle
                             "castle_wall", "castle_tower", "castle_keep", "castle_bed", "weapon_rack", "dining_table",
                             "castle_statue", "castle_fountain"}) {
        reg(name, LayerId::Structures, block);
    }

    // Passable structures and decorations
    for (const char* name : {"stalactite", "flowstone", "crystal_cluster", "cave_mushroom", "bush", "flowers",
                             "mushrooms", "ferns", "berries", "campsite", "town_bench", "castle_banner", "castle_bench",
                             "castle_urn"}) {
        reg(name, LayerId::Structures, none);
    }

    // Interactive
    for (const char* name : {"dungeon_door", "town_door", "castle_door", "castle_main_door"}) {
        reg(name, LayerId::Interactive, TileFlags::Door);
    }
    reg("treasure_chest", LayerId::Interactive, TileFlags::Treasure);
    for (const char* name : {"lever", "switch", "rune", "portal"}) {
        reg(name, LayerId::Interactive, none);
    }
    reg("level_entrance", LayerId::Interactive, TileFlags::Marker);
    reg("level_exit", LayerId::Interactive, TileFlags::Marker);

    // Lighting
    for (const char* name : {"torch", "glowing_mushroom", "crystal_light", "campfire", "street_lantern",
                             "building_light", "candle", "wall_torch", "tower_light", "courtyard_lantern",
                             "interior_light"}) {
        reg(name, LayerId::Lighting, light);
    }

    // Effects
    for (const char* name : {"ambient_dark", "light_glow", "cave_drip", "forest_mist", "town_smoke",
                             "castle_draft"}) {
        reg(name, LayerId::Effects, TileFlags::Ambient);
    }

    LEVELFORGE_LOG_DEBUG(core::log_category::GENERATION, "Registered {} tile types", count());
}

const TileType* TileRegistry::get(TileId id) const {
    if (id == TILE_NONE || id >= impl_->tiles.size()) {
        return nullptr;
    }
    return impl_->tiles[id].get();
}

const TileType* TileRegistry::get(std::string_view name) const {
    auto it = impl_->name_to_id.find(std::string(name));
    if (it == impl_->name_to_id.end()) {
        return nullptr;
    }
    return impl_->tiles[it->second].get();
}

std::optional<TileId> TileRegistry::find_id(std::string_view name) const {
    auto it = impl_->name_to_id.find(std::string(name));
    if (it == impl_->name_to_id.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string_view TileRegistry::name_of(TileId id) const {
    const TileType* type = get(id);
    return type != nullptr ? std::string_view(type->get_name()) : std::string_view{};
}

size_t TileRegistry::count() const {
    return impl_->tiles.size() - 1;
}

void TileRegistry::for_each(const std::function<void(const TileType&)>& callback) const {
    for (const auto& tile : impl_->tiles) {
        if (tile) {
            callback(*tile);
        }
    }
}

bool TileRegistry::is_walkable(TileId id) const {
    const TileType* type = get(id);
    return type != nullptr && type->is_walkable();
}

bool TileRegistry::is_blocking(TileId id) const {
    const TileType* type = get(id);
    return type != nullptr && type->is_blocking();
}

bool TileRegistry::is_emissive(TileId id) const {
    const TileType* type = get(id);
    return type != nullptr && type->is_emissive();
}

}  // namespace levelforge::gen
