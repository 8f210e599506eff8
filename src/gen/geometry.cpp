// LevelForge Generation
// geometry.cpp - Placement, rasterization and flood fill implementation

#include <levelforge/core/logger.hpp>
#include <levelforge/gen/geometry.hpp>

#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace levelforge::gen::geometry {

// ============================================================================
// Rect
// ============================================================================

Rect Rect::clipped(const Rect& bounds) const {
    int32_t x0 = std::max(x, bounds.x);
    int32_t y0 = std::max(y, bounds.y);
    int32_t x1 = std::min(x + width, bounds.x + bounds.width);
    int32_t y1 = std::min(y + height, bounds.y + bounds.height);
    return Rect{x0, y0, std::max(0, x1 - x0), std::max(0, y1 - y0)};
}

TilePos Rect::random_cell(Rng& rng) const {
    int32_t cx = x + rng.below(width);
    int32_t cy = y + rng.below(height);
    return {cx, cy};
}

Rect Component::bounds() const {
    if (cells.empty()) {
        return {};
    }
    int32_t min_x = cells.front().x;
    int32_t min_y = cells.front().y;
    int32_t max_x = min_x;
    int32_t max_y = min_y;
    for (const auto& cell : cells) {
        min_x = std::min(min_x, cell.x);
        min_y = std::min(min_y, cell.y);
        max_x = std::max(max_x, cell.x);
        max_y = std::max(max_y, cell.y);
    }
    return Rect{min_x, min_y, max_x - min_x + 1, max_y - min_y + 1};
}

// ============================================================================
// Bounded Retry Placement
// ============================================================================

PlacementResult try_place(Rng& rng, const Rect& area, const ExclusionPredicate& excluded, int32_t max_attempts) {
    if (area.empty()) {
        return Exhausted{0};
    }

    int32_t attempts = 0;
    while (attempts < max_attempts) {
        TilePos candidate = area.random_cell(rng);
        ++attempts;
        if (!excluded(candidate)) {
            return Placed{candidate, attempts};
        }
    }

    LEVELFORGE_LOG_TRACE(core::log_category::GEOMETRY, "Placement exhausted after {} attempts", attempts);
    return Exhausted{attempts};
}

// ============================================================================
// Line Rasterization
// ============================================================================

std::vector<TilePos> rasterize_line(TilePos from, TilePos to, int32_t width) {
    std::vector<TilePos> cells;
    std::unordered_set<TilePos> seen;

    auto emit = [&](TilePos pos) {
        if (seen.insert(pos).second) {
            cells.push_back(pos);
        }
    };

    int32_t radius = width > 1 ? width / 2 : 0;
    auto stamp = [&](TilePos center) {
        for (int32_t oy = -radius; oy <= radius; ++oy) {
            for (int32_t ox = -radius; ox <= radius; ++ox) {
                emit({center.x + ox, center.y + oy});
            }
        }
    };

    int32_t dx = to.x - from.x;
    int32_t dy = to.y - from.y;
    int32_t steps = std::max(std::abs(dx), std::abs(dy));

    if (steps == 0) {
        stamp(from);
        return cells;
    }

    for (int32_t i = 0; i <= steps; ++i) {
        double t = static_cast<double>(i) / static_cast<double>(steps);
        // Half-up rounding so both directions of a line agree on ties
        auto px = static_cast<int32_t>(std::floor(from.x + dx * t + 0.5));
        auto py = static_cast<int32_t>(std::floor(from.y + dy * t + 0.5));
        stamp({px, py});
    }

    return cells;
}

// ============================================================================
// Flood Fill
// ============================================================================

size_t flood_fill(BoolGrid& grid, TilePos start, uint8_t target, uint8_t replacement, std::vector<TilePos>* cells) {
    if (target == replacement || !grid.in_bounds(start) || grid.at(start) != target) {
        return 0;
    }

    std::vector<TilePos> stack;
    stack.push_back(start);
    size_t size = 0;

    while (!stack.empty()) {
        TilePos pos = stack.back();
        stack.pop_back();

        if (!grid.in_bounds(pos) || grid.at(pos) != target) {
            continue;
        }

        grid.at(pos) = replacement;
        ++size;
        if (cells != nullptr) {
            cells->push_back(pos);
        }

        for (const auto& offset : CARDINAL_OFFSETS) {
            stack.push_back(pos + offset);
        }
    }

    return size;
}

std::vector<Component> label_components(const BoolGrid& grid, uint8_t target) {
    std::vector<Component> components;
    BoolGrid scratch = grid;
    const uint8_t visited = target == 0xFF ? 0xFE : 0xFF;

    for (int32_t y = 0; y < scratch.height(); ++y) {
        for (int32_t x = 0; x < scratch.width(); ++x) {
            TilePos pos{x, y};
            if (scratch.at(pos) != target) {
                continue;
            }
            Component component;
            component.seed = pos;
            flood_fill(scratch, pos, target, visited, &component.cells);
            components.push_back(std::move(component));
        }
    }

    return components;
}

// ============================================================================
// Cave Region Classification
// ============================================================================

const char* region_class_to_string(RegionClass region) {
    switch (region) {
        case RegionClass::Chamber:
            return "chamber";
        case RegionClass::Tunnel:
            return "tunnel";
        case RegionClass::Noise:
            return "noise";
    }
    return "unknown";
}

RegionClass classify_region(size_t size) {
    if (size >= CHAMBER_MIN_SIZE) {
        return RegionClass::Chamber;
    }
    if (size >= TUNNEL_MIN_SIZE) {
        return RegionClass::Tunnel;
    }
    return RegionClass::Noise;
}

ClassifiedRegions classify_cave_regions(const BoolGrid& rock) {
    ClassifiedRegions regions;
    for (auto& component : label_components(rock, 0)) {
        switch (classify_region(component.size())) {
            case RegionClass::Chamber:
                regions.chambers.push_back(std::move(component));
                break;
            case RegionClass::Tunnel:
                regions.tunnels.push_back(std::move(component));
                break;
            case RegionClass::Noise:
                regions.noise.push_back(std::move(component));
                break;
        }
    }

    LEVELFORGE_LOG_DEBUG(core::log_category::GEOMETRY, "Cave regions: {} chambers, {} tunnels, {} noise",
                         regions.chambers.size(), regions.tunnels.size(), regions.noise.size());
    return regions;
}

}  // namespace levelforge::gen::geometry
