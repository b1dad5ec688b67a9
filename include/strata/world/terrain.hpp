#pragma once

#include "strata/core/coords.hpp"
#include "strata/world/world.hpp"

namespace strata::world::terrain {

// Parameters of the synthetic rolling heightfield.
struct TerrainParams {
    int32_t base_height = 64;
    float amplitude = 6.0f;
    float frequency = 0.08f;
    int32_t dirt_depth = 3;
    Material surface{"grass_block"};
    Material subsurface{"dirt"};
    Material bedrock{"stone"};
    Material water{"water"};
};

// Top solid block of column (x, z).
int32_t terrain_height(int32_t x, int32_t z, const TerrainParams& params) noexcept;

// Generate a single chunk worth of voxel data for the analytic terrain.
// Water fills columns below the configured sea level.
ChunkData generate_chunk(const core::ChunkCoord& chunk_coord,
                         const core::WorldConfig& cfg,
                         const TerrainParams& params = {});

// Generate every chunk column covering `rect` (full build height) and make
// it resident in the world. Returns the number of chunks generated.
std::size_t generate_region(World& world,
                            const Dimension& dimension,
                            const core::Rect& rect,
                            const TerrainParams& params = {});

} // namespace strata::world::terrain
