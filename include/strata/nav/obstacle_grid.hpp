#pragma once

#include "strata/core/coords.hpp"
#include "strata/terrain/height_map.hpp"
#include "strata/world/block_classifier.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace strata::nav {

struct ObstacleConfig {
    // Largest elevation difference to a 4-neighbour that still counts as walkable.
    int32_t max_step = 1;
};

// Per-column passability over exactly the source height map's rectangle.
// Immutable; rebuild after the world changes.
class ObstacleGrid {
public:
    ObstacleGrid() = default;
    ObstacleGrid(core::Rect rect, std::vector<world::Classification> cells);

    static ObstacleGrid build(const terrain::HeightMap& map,
                              const world::IBlockClassifier& classifier,
                              const ObstacleConfig& cfg = {});

    [[nodiscard]] const core::Rect& rect() const noexcept { return rect_; }
    [[nodiscard]] bool empty() const noexcept { return cells_.empty(); }
    [[nodiscard]] bool contains(const core::Coordinate2D& column) const noexcept {
        return !empty() && rect_.contains(column);
    }

    // Throws core::OutOfBounds outside the grid.
    [[nodiscard]] world::Classification at(const core::Coordinate2D& column) const;
    [[nodiscard]] bool passable(const core::Coordinate2D& column) const;

    // Index-based access for the planner; no bounds checks.
    [[nodiscard]] bool passable_at(std::size_t idx) const noexcept {
        return cells_[idx] == world::Classification::Open;
    }

    [[nodiscard]] std::size_t count(world::Classification c) const noexcept;
    [[nodiscard]] const std::vector<world::Classification>& cells() const noexcept { return cells_; }

private:
    core::Rect rect_{};
    std::vector<world::Classification> cells_;
};

} // namespace strata::nav
