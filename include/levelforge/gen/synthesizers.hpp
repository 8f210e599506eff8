// LevelForge Generation
// synthesizers.hpp - The five biome pipelines

#pragma once

#include "geometry.hpp"
#include "synthesizer.hpp"

#include <string>
#include <vector>

namespace levelforge::gen {

// Rectangular region with a flavor subtype (room type, district type, ...)
struct TypedRegion {
    std::string id;
    geometry::Rect rect;
    std::string type;
};

// Rasterized connector between two anchor centers
struct Connector {
    TilePos start;
    TilePos end;
    int32_t width = 1;
};

// ============================================================================
// Dungeon: overlapping rooms joined in sequence by L-shaped corridors
// ============================================================================

class DungeonSynthesizer final : public Synthesizer {
public:
    [[nodiscard]] BiomeType biome() const override { return BiomeType::Dungeon; }

    void layout(SynthesisContext& ctx) override;
    void terrain(SynthesisContext& ctx) override;
    void structures(SynthesisContext& ctx) override;
    void interactive(SynthesisContext& ctx) override;
    void lighting(SynthesisContext& ctx) override;
    void entities(SynthesisContext& ctx) override;

    [[nodiscard]] std::map<std::string, size_t> region_summary() const override;

    [[nodiscard]] const std::vector<TypedRegion>& rooms() const { return rooms_; }
    [[nodiscard]] const std::vector<Connector>& corridors() const { return corridors_; }

private:
    std::vector<TypedRegion> rooms_;
    std::vector<Connector> corridors_;
};

// ============================================================================
// Cave: cellular automata smoothed into chambers and tunnels
// ============================================================================

class CaveSynthesizer final : public Synthesizer {
public:
    static constexpr double INITIAL_ROCK_CHANCE = 0.45;
    static constexpr int32_t SMOOTHING_ITERATIONS = 5;
    static constexpr int32_t ROCK_SURVIVAL_NEIGHBORS = 4;
    static constexpr int32_t ROCK_BIRTH_NEIGHBORS = 5;

    [[nodiscard]] BiomeType biome() const override { return BiomeType::Cave; }

    void layout(SynthesisContext& ctx) override;
    void terrain(SynthesisContext& ctx) override;
    void structures(SynthesisContext& ctx) override;
    void interactive(SynthesisContext& ctx) override;
    void lighting(SynthesisContext& ctx) override;
    void entities(SynthesisContext& ctx) override;

    [[nodiscard]] std::map<std::string, size_t> region_summary() const override;

    // One automaton step: rock survives with >= 4 rock neighbors, open cells
    // fill with >= 5. Out-of-bounds neighbors count as rock.
    [[nodiscard]] static BoolGrid smooth(const BoolGrid& rock);

    [[nodiscard]] const BoolGrid& rock() const { return rock_; }
    [[nodiscard]] const geometry::ClassifiedRegions& regions() const { return regions_; }

private:
    [[nodiscard]] bool is_rock(TilePos pos) const { return rock_.get_or(pos, 1) != 0; }

    BoolGrid rock_;
    geometry::ClassifiedRegions regions_;
};

// ============================================================================
// Forest: clearings linked by trails through dense vegetation
// ============================================================================

class ForestSynthesizer final : public Synthesizer {
public:
    [[nodiscard]] BiomeType biome() const override { return BiomeType::Forest; }

    void layout(SynthesisContext& ctx) override;
    void terrain(SynthesisContext& ctx) override;
    void structures(SynthesisContext& ctx) override;
    void interactive(SynthesisContext& ctx) override;
    void lighting(SynthesisContext& ctx) override;
    void entities(SynthesisContext& ctx) override;

    [[nodiscard]] std::map<std::string, size_t> region_summary() const override;

    [[nodiscard]] const std::vector<TypedRegion>& clearings() const { return clearings_; }

private:
    [[nodiscard]] bool in_clearing(TilePos pos) const;

    std::vector<TypedRegion> clearings_;
    std::vector<Connector> paths_;
    size_t side_trails_ = 0;
};

// ============================================================================
// Town: districts of buildings joined by streets
// ============================================================================

class TownSynthesizer final : public Synthesizer {
public:
    [[nodiscard]] BiomeType biome() const override { return BiomeType::Town; }

    void layout(SynthesisContext& ctx) override;
    void terrain(SynthesisContext& ctx) override;
    void structures(SynthesisContext& ctx) override;
    void interactive(SynthesisContext& ctx) override;
    void lighting(SynthesisContext& ctx) override;
    void entities(SynthesisContext& ctx) override;

    [[nodiscard]] std::map<std::string, size_t> region_summary() const override;

    [[nodiscard]] const std::vector<TypedRegion>& districts() const { return districts_; }
    [[nodiscard]] const std::vector<TypedRegion>& buildings() const { return buildings_; }
    [[nodiscard]] const std::vector<Connector>& streets() const { return streets_; }

private:
    std::vector<TypedRegion> districts_;
    std::vector<TypedRegion> buildings_;
    std::vector<Connector> streets_;
};

// ============================================================================
// Castle: fixed fortification template with randomized contents
// ============================================================================

class CastleSynthesizer final : public Synthesizer {
public:
    static constexpr int32_t TOWER_SIZE = 3;
    static constexpr int32_t KEEP_SIZE = 8;

    [[nodiscard]] BiomeType biome() const override { return BiomeType::Castle; }

    void layout(SynthesisContext& ctx) override;
    void terrain(SynthesisContext& ctx) override;
    void structures(SynthesisContext& ctx) override;
    void interactive(SynthesisContext& ctx) override;
    void lighting(SynthesisContext& ctx) override;
    void entities(SynthesisContext& ctx) override;

    [[nodiscard]] std::map<std::string, size_t> region_summary() const override;

    [[nodiscard]] const geometry::Rect& keep() const { return keep_; }
    [[nodiscard]] const std::vector<geometry::Rect>& towers() const { return towers_; }
    [[nodiscard]] const std::vector<TypedRegion>& courtyards() const { return courtyards_; }
    [[nodiscard]] const std::vector<TypedRegion>& sections() const { return sections_; }

    // Bottom-center cell of a tower or the keep
    [[nodiscard]] static TilePos door_of(const geometry::Rect& rect) {
        return {rect.x + rect.width / 2, rect.y + rect.height - 1};
    }

    // Towers in the lower half open upward so the door never faces the curtain wall
    [[nodiscard]] static TilePos tower_door_of(const geometry::Rect& tower, int32_t map_height) {
        if (tower.y + tower.height / 2 >= map_height / 2) {
            return {tower.x + tower.width / 2, tower.y};
        }
        return door_of(tower);
    }

private:
    int32_t wall_thickness_ = 2;
    std::vector<geometry::Rect> towers_;
    geometry::Rect keep_;
    std::vector<TypedRegion> courtyards_;
    std::vector<TypedRegion> sections_;
};

}  // namespace levelforge::gen
