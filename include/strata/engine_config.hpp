#pragma once

#include "strata/nav/obstacle_grid.hpp"
#include "strata/nav/path_planner.hpp"
#include "strata/terrain/height_map.hpp"
#include "strata/terrain/sculptor.hpp"

#include <cstddef>
#include <cstdint>

namespace strata {

struct EngineConfig {
    terrain::ScanConfig scan{};
    nav::ObstacleConfig obstacles{};
    nav::PathConfig path{};
    terrain::FlattenOptions flatten{};

    // Columns scanned beyond the endpoints' bounding box when planning.
    int32_t path_margin = 16;

    // Flush the store after this many placed voxels; 0 disables.
    std::size_t place_flush_interval = 0;

    bool verbose = true;
};

} // namespace strata
