// LevelForge Generation
// grid.hpp - Dense row-major 2D grid

#pragma once

#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace levelforge::gen {

template<typename T>
class Grid {
public:
    Grid() = default;
    Grid(int32_t width, int32_t height, const T& fill = T{})
        : width_(width), height_(height),
          cells_(static_cast<size_t>(width > 0 ? width : 0) * static_cast<size_t>(height > 0 ? height : 0), fill) {}

    [[nodiscard]] int32_t width() const { return width_; }
    [[nodiscard]] int32_t height() const { return height_; }
    [[nodiscard]] size_t size() const { return cells_.size(); }

    [[nodiscard]] bool in_bounds(TilePos pos) const {
        return pos.x >= 0 && pos.y >= 0 && pos.x < width_ && pos.y < height_;
    }

    // Unchecked access; callers test in_bounds first
    [[nodiscard]] T& at(TilePos pos) { return cells_[index(pos)]; }
    [[nodiscard]] const T& at(TilePos pos) const { return cells_[index(pos)]; }

    // Returns the fallback for out-of-bounds positions
    [[nodiscard]] T get_or(TilePos pos, const T& fallback) const {
        return in_bounds(pos) ? cells_[index(pos)] : fallback;
    }

    void fill(const T& value) { cells_.assign(cells_.size(), value); }

    [[nodiscard]] const std::vector<T>& cells() const { return cells_; }

    bool operator==(const Grid& other) const = default;

private:
    [[nodiscard]] size_t index(TilePos pos) const {
        return static_cast<size_t>(pos.y) * static_cast<size_t>(width_) + static_cast<size_t>(pos.x);
    }

    int32_t width_ = 0;
    int32_t height_ = 0;
    std::vector<T> cells_;
};

// Open/closed masks for cellular automata and flood fill (avoids vector<bool>)
using BoolGrid = Grid<uint8_t>;

}  // namespace levelforge::gen
