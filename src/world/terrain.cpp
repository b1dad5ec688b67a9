#include "strata/world/terrain.hpp"

#include "strata/world/chunk.hpp"

#include <chrono>
#include <cmath>
#include <iostream>
#include <vector>

namespace strata::world::terrain {

int32_t terrain_height(int32_t x, int32_t z, const TerrainParams& params) noexcept
{
    const float fx = static_cast<float>(x) * params.frequency;
    const float fz = static_cast<float>(z) * params.frequency;
    const float wobble = std::sin(fx) * std::cos(fz) + 0.5f * std::sin(0.5f * (fx + fz));
    return params.base_height + static_cast<int32_t>(std::lround(wobble * params.amplitude));
}

ChunkData generate_chunk(const core::ChunkCoord& chunk_coord,
                         const core::WorldConfig& cfg,
                         const TerrainParams& params)
{
    constexpr MaterialId kAir = 0;
    constexpr MaterialId kSurface = 1;
    constexpr MaterialId kSubsurface = 2;
    constexpr MaterialId kBedrock = 3;
    constexpr MaterialId kWater = 4;

    const auto cs = static_cast<std::size_t>(cfg.chunk_size);
    ChunkData chunk{};
    chunk.coord = chunk_coord;
    chunk.palette = {air(), params.surface, params.subsurface, params.bedrock, params.water};
    chunk.voxels.resize(cs * cs * cs);

    for (std::size_t z = 0; z < cs; ++z) {
        for (std::size_t x = 0; x < cs; ++x) {
            const core::Coordinate column = to_world_voxel(
                chunk_coord,
                core::LocalVoxelCoord{static_cast<uint16_t>(x), 0, static_cast<uint16_t>(z)},
                cfg);
            const int32_t height = terrain_height(column.x, column.z, params);

            for (std::size_t y = 0; y < cs; ++y) {
                const int32_t wy = column.y + static_cast<int32_t>(y);
                if (wy < cfg.min_y || wy > cfg.max_y) {
                    continue;
                }

                MaterialId material = kAir;
                if (wy > height) {
                    material = wy <= cfg.sea_level ? kWater : kAir;
                } else if (wy == height) {
                    material = height < cfg.sea_level ? kSubsurface : kSurface;
                } else if (wy > height - params.dirt_depth) {
                    material = kSubsurface;
                } else {
                    material = kBedrock;
                }

                const auto idx = voxel_index(cfg,
                                             static_cast<uint16_t>(x),
                                             static_cast<uint16_t>(y),
                                             static_cast<uint16_t>(z));
                chunk.voxels[idx].material = material;
            }
        }
    }

    return chunk;
}

std::size_t generate_region(World& world,
                            const Dimension& dimension,
                            const core::Rect& rect,
                            const TerrainParams& params)
{
    if (rect.empty()) {
        return 0;
    }

    const auto& cfg = world.config();
    const ChunkRange range = world.chunk_range(rect);

    std::vector<core::ChunkCoord> coords;
    coords.reserve(static_cast<std::size_t>(range.max.x - range.min.x + 1) *
                   static_cast<std::size_t>(range.max.y - range.min.y + 1) *
                   static_cast<std::size_t>(range.max.z - range.min.z + 1));

    for (int32_t cx = range.min.x; cx <= range.max.x; ++cx) {
        for (int32_t cy = range.min.y; cy <= range.max.y; ++cy) {
            for (int32_t cz = range.min.z; cz <= range.max.z; ++cz) {
                coords.push_back(core::ChunkCoord{cx, cy, cz});
            }
        }
    }

    std::cout << "[terrain] generate_region: " << coords.size() << " chunk(s)\n";
    const auto start = std::chrono::steady_clock::now();

    for (const auto& coord : coords) {
        world.adopt_chunk(dimension, generate_chunk(coord, cfg, params));
    }

    const auto end = std::chrono::steady_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    std::cout << "[terrain] region complete in " << ms << " ms\n";

    return coords.size();
}

} // namespace strata::world::terrain
