#pragma once

#include "strata/shape/shapes.hpp"
#include "strata/world/voxel_set.hpp"

namespace strata::shape {

// Pure function of the descriptor. Parameters are validated before any voxel
// is produced.
world::VoxelSet rasterize(const ShapeDescriptor& shape);

// Radius of cone level `level` (0 at the base).
double cone_level_radius(const Cone& cone, int32_t level) noexcept;

// Rows of a pitched roof of the given span.
int32_t roof_height(int32_t span) noexcept;

} // namespace strata::shape
