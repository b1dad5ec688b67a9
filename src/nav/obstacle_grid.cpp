#include "strata/nav/obstacle_grid.hpp"

#include "strata/core/errors.hpp"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <utility>

namespace strata::nav {

ObstacleGrid::ObstacleGrid(core::Rect rect, std::vector<world::Classification> cells)
    : rect_(rect)
    , cells_(std::move(cells))
{
    if (cells_.size() != rect_.area()) {
        throw std::invalid_argument("cell count must match the rectangle's area");
    }
}

ObstacleGrid ObstacleGrid::build(const terrain::HeightMap& map,
                                 const world::IBlockClassifier& classifier,
                                 const ObstacleConfig& cfg)
{
    if (cfg.max_step < 0) {
        throw std::invalid_argument("max_step must not be negative");
    }
    if (map.empty()) {
        return ObstacleGrid{core::Rect{}, {}};
    }

    const core::Rect& rect = map.rect();
    std::vector<world::Classification> cells(rect.area(), world::Classification::Open);

    for (std::size_t i = 0; i < cells.size(); ++i) {
        const core::Coordinate2D column = rect.at_index(i);
        const int32_t h = map.heights()[i];
        world::Classification c = classifier.classify({column.x, h, column.z});

        if (c == world::Classification::Open) {
            constexpr int kDx[4] = {1, -1, 0, 0};
            constexpr int kDz[4] = {0, 0, 1, -1};
            for (int n = 0; n < 4; ++n) {
                const auto neighbour = map.find({column.x + kDx[n], column.z + kDz[n]});
                if (neighbour && std::abs(*neighbour - h) > cfg.max_step) {
                    c = world::Classification::Steep;
                    break;
                }
            }
        }
        cells[i] = c;
    }

    return ObstacleGrid{rect, std::move(cells)};
}

world::Classification ObstacleGrid::at(const core::Coordinate2D& column) const {
    if (!contains(column)) {
        throw core::OutOfBounds("column (" + std::to_string(column.x) + ", " +
                                std::to_string(column.z) + ") is outside the obstacle grid");
    }
    return cells_[rect_.index(column)];
}

bool ObstacleGrid::passable(const core::Coordinate2D& column) const {
    return at(column) == world::Classification::Open;
}

std::size_t ObstacleGrid::count(world::Classification c) const noexcept {
    return static_cast<std::size_t>(std::count(cells_.begin(), cells_.end(), c));
}

} // namespace strata::nav
