// LevelForge Generation
// synthesizer.hpp - Biome synthesis pipeline interface

#pragma once

#include "geometry.hpp"
#include "level.hpp"
#include "rng.hpp"

#include <array>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace levelforge::gen {

// ============================================================================
// Synthesis Settings and Context
// ============================================================================

struct SynthesisSettings {
    int32_t max_placement_attempts = geometry::DEFAULT_MAX_ATTEMPTS;
    int32_t castle_wall_thickness = 2;
    int32_t street_width = 2;
};

// Everything one phase may touch. The level and rng are owned by the
// in-flight generation call.
struct SynthesisContext {
    Level& level;
    Rng& rng;
    const LevelConfig& config;
    const SynthesisSettings& settings;
};

enum class SynthesisPhase : uint8_t {
    Layout = 0,
    Terrain,
    Structures,
    Interactive,
    Lighting,
    Entities,
    Count
};

inline constexpr size_t SYNTHESIS_PHASE_COUNT = static_cast<size_t>(SynthesisPhase::Count);

inline constexpr std::array<SynthesisPhase, SYNTHESIS_PHASE_COUNT> ALL_SYNTHESIS_PHASES = {
    SynthesisPhase::Layout,      SynthesisPhase::Terrain,  SynthesisPhase::Structures,
    SynthesisPhase::Interactive, SynthesisPhase::Lighting, SynthesisPhase::Entities};

[[nodiscard]] const char* synthesis_phase_to_string(SynthesisPhase phase);

// ============================================================================
// Synthesizer
// ============================================================================

// One biome pipeline. An instance keeps its transient regions (rooms,
// clearings, districts, ...) between phases and is discarded after a single
// generation, so regions never outlive synthesis.
class Synthesizer {
public:
    virtual ~Synthesizer() = default;

    Synthesizer(const Synthesizer&) = delete;
    Synthesizer& operator=(const Synthesizer&) = delete;

    [[nodiscard]] virtual BiomeType biome() const = 0;

    // Runs one phase. The terrain phase also paints the background ground.
    void run_phase(SynthesisPhase phase, SynthesisContext& ctx);

    // Runs all phases in order
    void run_all(SynthesisContext& ctx);

    virtual void layout(SynthesisContext& ctx) = 0;
    virtual void terrain(SynthesisContext& ctx) = 0;
    virtual void structures(SynthesisContext& ctx) = 0;
    virtual void interactive(SynthesisContext& ctx) = 0;
    virtual void lighting(SynthesisContext& ctx) = 0;
    virtual void entities(SynthesisContext& ctx) = 0;

    // Region counts by kind ("room" -> 7, ...)
    [[nodiscard]] virtual std::map<std::string, size_t> region_summary() const = 0;

protected:
    Synthesizer() = default;

    // Registered id for a tag; logs and returns TILE_NONE for unknown tags
    [[nodiscard]] static TileId tile(std::string_view name);

    [[nodiscard]] static geometry::Rect bounds(const Level& level);

    // Sets terrain unless a blocking structure occupies the cell
    static void paint_floor(Level& level, TilePos pos, TileId floor);

    // Sets a blocking structure and clears the walkable terrain beneath it
    static void place_blocking(Level& level, TilePos pos, TileId structure);

    // place_blocking for blocking tags, a plain structure write otherwise
    static void place_structure(Level& level, TilePos pos, TileId structure);

    // Removes a blocking structure and lays floor in its place
    static void clear_to_floor(Level& level, TilePos pos, TileId floor);

    // Every unassigned in-bounds 8-neighbor of a walkable cell becomes a wall.
    // A walkable cell on the map edge becomes a wall itself.
    static void infer_walls(Level& level, TileId wall);

    // Bounded retry over the whole level with the configured attempt limit
    [[nodiscard]] static geometry::PlacementResult place(SynthesisContext& ctx,
                                                         const geometry::ExclusionPredicate& excluded);

    static void add_enemy(Level& level, std::string id, std::string subtype, TilePos pos, std::string level_tag);
    static void add_npc(Level& level, std::string id, std::string subtype, TilePos pos, std::string dialogue);

    // Closest walkable cell by Chebyshev ring, row-major within a ring
    [[nodiscard]] static std::optional<TilePos> nearest_walkable(const Level& level, TilePos near);

    // Walkable cell with the greatest 4-directional step distance from start
    [[nodiscard]] static std::optional<TilePos> farthest_reachable(const Level& level, TilePos start);

    // Snaps both points to walkable cells, records them in the metadata and
    // tags them in the interactive layer
    static void mark_entry_exit(Level& level, std::optional<TilePos> entry, std::optional<TilePos> exit);
};

// Lookup-table factory; Count maps to the dungeon pipeline
[[nodiscard]] std::unique_ptr<Synthesizer> create_synthesizer(BiomeType biome);

}  // namespace levelforge::gen
