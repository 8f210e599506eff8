// LevelForge Generation
// geometry.hpp - Placement, line rasterization and flood fill over tile grids

#pragma once

#include "grid.hpp"
#include "rng.hpp"
#include "types.hpp"

#include <cstdint>
#include <functional>
#include <variant>
#include <vector>

namespace levelforge::gen::geometry {

// ============================================================================
// Rectangles
// ============================================================================

struct Rect {
    int32_t x = 0;
    int32_t y = 0;
    int32_t width = 0;
    int32_t height = 0;

    [[nodiscard]] bool contains(TilePos pos) const {
        return pos.x >= x && pos.y >= y && pos.x < x + width && pos.y < y + height;
    }

    // Integer center (floor of the half extents)
    [[nodiscard]] TilePos center() const { return {x + width / 2, y + height / 2}; }

    [[nodiscard]] int32_t area() const { return width > 0 && height > 0 ? width * height : 0; }
    [[nodiscard]] bool empty() const { return width <= 0 || height <= 0; }

    // Intersection with another rectangle (may be empty)
    [[nodiscard]] Rect clipped(const Rect& bounds) const;

    // Uniform cell inside the rectangle; the rectangle must not be empty
    [[nodiscard]] TilePos random_cell(Rng& rng) const;

    template <typename Fn>
    void for_each_cell(Fn&& fn) const {
        for (int32_t cy = y; cy < y + height; ++cy) {
            for (int32_t cx = x; cx < x + width; ++cx) {
                fn(TilePos{cx, cy});
            }
        }
    }

    bool operator==(const Rect& other) const = default;
};

// ============================================================================
// Bounded Retry Placement
// ============================================================================

inline constexpr int32_t DEFAULT_MAX_ATTEMPTS = 20;

struct Placed {
    TilePos pos;
    int32_t attempts = 0;
};

struct Exhausted {
    int32_t attempts = 0;
};

using PlacementResult = std::variant<Placed, Exhausted>;

// Returns true when a coordinate must be rejected
using ExclusionPredicate = std::function<bool(TilePos)>;

// Samples up to max_attempts uniform cells of area and returns the first one
// the predicate does not exclude. Exhaustion is a normal outcome.
[[nodiscard]] PlacementResult try_place(Rng& rng, const Rect& area, const ExclusionPredicate& excluded,
                                        int32_t max_attempts = DEFAULT_MAX_ATTEMPTS);

[[nodiscard]] inline bool is_placed(const PlacementResult& result) {
    return std::holds_alternative<Placed>(result);
}

// ============================================================================
// Line Rasterization
// ============================================================================

// Cells of the straight interpolated path from `from` to `to`, both ends
// included, in drawing order without duplicates. Widths above 1 stamp a
// square brush of radius width / 2 at every centerline cell.
[[nodiscard]] std::vector<TilePos> rasterize_line(TilePos from, TilePos to, int32_t width = 1);

// ============================================================================
// Flood Fill / Region Extraction
// ============================================================================

// 4-directional fill over cells equal to target, starting at start. Visited
// cells are rewritten to replacement. Returns the component size (0 when the
// start cell does not match). When cells is non-null the visited positions
// are appended to it.
size_t flood_fill(BoolGrid& grid, TilePos start, uint8_t target, uint8_t replacement,
                  std::vector<TilePos>* cells = nullptr);

struct Component {
    TilePos seed;                // first cell in row-major scan order
    std::vector<TilePos> cells;  // fill order

    [[nodiscard]] size_t size() const { return cells.size(); }
    [[nodiscard]] Rect bounds() const;
};

// All 4-connected components of cells equal to target, in row-major order of
// their first cell. The grid is not modified.
[[nodiscard]] std::vector<Component> label_components(const BoolGrid& grid, uint8_t target);

// ============================================================================
// Cave Region Classification
// ============================================================================

inline constexpr size_t CHAMBER_MIN_SIZE = 51;  // size > 50
inline constexpr size_t TUNNEL_MIN_SIZE = 6;    // 5 < size <= 50

enum class RegionClass : uint8_t {
    Chamber = 0,
    Tunnel,
    Noise
};

[[nodiscard]] const char* region_class_to_string(RegionClass region);
[[nodiscard]] RegionClass classify_region(size_t size);

struct ClassifiedRegions {
    std::vector<Component> chambers;
    std::vector<Component> tunnels;
    std::vector<Component> noise;
};

// Classifies open cells (value 0) of a wall mask (1 = rock) by component size
[[nodiscard]] ClassifiedRegions classify_cave_regions(const BoolGrid& rock);

}  // namespace levelforge::gen::geometry
