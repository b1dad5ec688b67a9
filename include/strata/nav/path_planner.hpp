#pragma once

#include "strata/core/coords.hpp"
#include "strata/nav/obstacle_grid.hpp"
#include "strata/terrain/height_map.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace strata::nav {

struct PathConfig {
    // Extra cost per block of elevation change between adjacent cells.
    double elevation_penalty = 1.0;
    // Added to the terrain elevation when lifting cells to 3D.
    int32_t clearance = 1;
};

struct Path {
    // Search result, start to end, no repeated column.
    std::vector<core::Coordinate> centerline;
    // Centerline plus lateral widening, one entry per column.
    std::vector<core::Coordinate> cells;
    // Accumulated movement cost of the centerline.
    double cost = 0.0;
    // Nodes closed by the search.
    std::size_t expanded = 0;
};

// Horizontal length of a polyline (1 per orthogonal step, sqrt(2) per diagonal).
double horizontal_length(const std::vector<core::Coordinate>& points) noexcept;

// A* route over `grid` from `start` to `goal`, widened to `width` columns.
//
// Moves are 8-directional; a diagonal step may not cut past an impassable
// orthogonal neighbour. Step cost is 1 or sqrt(2) plus elevation_penalty
// times the absolute height change. The heuristic is the straight-line
// distance to the goal. Among frontier entries with equal priority the one
// enqueued first is expanded first, so identical inputs give identical paths.
//
// Throws core::OutOfBounds if an endpoint lies outside the grid,
// core::NoPathFound if the goal is impassable or unreachable, and
// std::invalid_argument if width < 1 or `map` and `grid` cover different
// rectangles.
Path plan_path(const core::Coordinate2D& start,
               const core::Coordinate2D& goal,
               const ObstacleGrid& grid,
               const terrain::HeightMap& map,
               int32_t width = 1,
               const PathConfig& cfg = {});

// Lateral widening of a lifted centerline; exposed for callers that plan
// their own centerlines. Cells outside `domain` are dropped.
std::vector<core::Coordinate> widen(const std::vector<core::Coordinate>& centerline,
                                    const core::Rect& domain,
                                    int32_t width);

} // namespace strata::nav
