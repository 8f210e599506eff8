// LevelForge Generation
// tile.hpp - Tile type system and registry

#pragma once

#include "types.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace levelforge::gen {

// ============================================================================
// Tile Type Descriptor (for registration)
// ============================================================================

struct TileTypeDesc {
    std::string name;  // Unique tag "dungeon_floor"
    LayerId layer = LayerId::Structures;
    TileFlags flags = TileFlags::None;
};

// ============================================================================
// Tile Type (immutable, registered)
// ============================================================================

class TileType {
public:
    [[nodiscard]] TileId get_id() const { return id_; }
    [[nodiscard]] const std::string& get_name() const { return name_; }
    [[nodiscard]] LayerId get_layer() const { return layer_; }
    [[nodiscard]] TileFlags get_flags() const { return flags_; }

    // Flag checks
    [[nodiscard]] bool is_walkable() const { return has_flag(flags_, TileFlags::Walkable); }
    [[nodiscard]] bool is_blocking() const { return has_flag(flags_, TileFlags::Blocking); }
    [[nodiscard]] bool is_liquid() const { return has_flag(flags_, TileFlags::Liquid); }
    [[nodiscard]] bool is_emissive() const { return has_flag(flags_, TileFlags::Emissive); }
    [[nodiscard]] bool is_treasure() const { return has_flag(flags_, TileFlags::Treasure); }
    [[nodiscard]] bool is_door() const { return has_flag(flags_, TileFlags::Door); }
    [[nodiscard]] bool is_marker() const { return has_flag(flags_, TileFlags::Marker); }

private:
    friend class TileRegistry;
    TileType(TileId id, const TileTypeDesc& desc);

    TileId id_;
    std::string name_;
    LayerId layer_;
    TileFlags flags_;
};

// ============================================================================
// Tile Registry (singleton)
// ============================================================================

// The full tag vocabulary is registered on first access and never changes
// afterwards, so lookups need no locking and are safe from any generation
// thread. ID 0 is reserved for "unassigned".
class TileRegistry {
public:
    [[nodiscard]] static const TileRegistry& instance();

    // Non-copyable, non-movable
    TileRegistry(const TileRegistry&) = delete;
    TileRegistry& operator=(const TileRegistry&) = delete;
    TileRegistry(TileRegistry&&) = delete;
    TileRegistry& operator=(TileRegistry&&) = delete;

    // Lookup (nullptr for TILE_NONE and unknown ids or names)
    [[nodiscard]] const TileType* get(TileId id) const;
    [[nodiscard]] const TileType* get(std::string_view name) const;
    [[nodiscard]] std::optional<TileId> find_id(std::string_view name) const;

    // Tag for an id, or an empty view for TILE_NONE
    [[nodiscard]] std::string_view name_of(TileId id) const;

    // Iteration (registered types only, excludes TILE_NONE)
    [[nodiscard]] size_t count() const;
    void for_each(const std::function<void(const TileType&)>& callback) const;

    // Convenience flag queries; TILE_NONE reports false
    [[nodiscard]] bool is_walkable(TileId id) const;
    [[nodiscard]] bool is_blocking(TileId id) const;
    [[nodiscard]] bool is_emissive(TileId id) const;

private:
    TileRegistry();
    ~TileRegistry();

    TileId register_tile(const TileTypeDesc& desc);
    void register_defaults();

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace levelforge::gen
