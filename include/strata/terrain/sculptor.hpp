#pragma once

#include "strata/core/coords.hpp"
#include "strata/terrain/height_map.hpp"
#include "strata/world/block_classifier.hpp"
#include "strata/world/block_store.hpp"
#include "strata/world/voxel_set.hpp"

#include <optional>

namespace strata::terrain {

struct FlattenOptions {
    world::Material fill{"dirt"};
    // When set, replaces the top block of every adjusted column.
    std::optional<world::Material> surface;
};

// Target elevation of a column at distance `distance` outside the flattened
// rectangle, ramping from `target_y` at the edge to `original_y` at
// `blend_radius`. Fractions round toward `original_y`.
int32_t blended_height(int32_t original_y, int32_t target_y, double distance, int32_t blend_radius) noexcept;

// Voxel operations that bring every column of `rect` to `target_y`, plus a
// linear blend band `blend_radius` wide around it. `map` must cover `rect`
// expanded by `blend_radius` (core::OutOfBounds otherwise).
world::VoxelSet plan_flatten(const HeightMap& map,
                             const core::Rect& rect,
                             int32_t target_y,
                             int32_t blend_radius,
                             const FlattenOptions& options = {});

// Air for every vegetation block between the ground and surface elevations
// of each column in `rect`. Both maps must cover `rect`.
world::VoxelSet plan_vegetation_clearing(const world::IBlockStore& store,
                                         const world::IBlockClassifier& classifier,
                                         const HeightMap& surface,
                                         const HeightMap& ground,
                                         const core::Rect& rect,
                                         const world::Dimension& dimension = world::kOverworld);

} // namespace strata::terrain
