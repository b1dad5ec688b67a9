#pragma once

#include "strata/core/coords.hpp"
#include "strata/world/material.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace strata::world {

using MaterialId = uint16_t;

// Palette index 0 is always air.
constexpr MaterialId kAirId = 0;

struct Voxel {
    MaterialId material = kAirId;
};

struct Chunk {
    core::ChunkCoord coord{};
    std::vector<Voxel> voxels;
};

// Self-contained chunk payload, prior to inserting into a World.
// Voxel ids index into `palette`, whose entry 0 must be air.
struct ChunkData {
    core::ChunkCoord coord{};
    std::vector<Material> palette;
    std::vector<Voxel> voxels;
};

struct ChunkAndLocal {
    core::ChunkCoord chunk{};
    core::LocalVoxelCoord local{};
};

// x is fastest, then y, then z:
// idx = (z * cs + y) * cs + x
inline std::size_t voxel_index(const core::WorldConfig& cfg,
                               uint16_t x,
                               uint16_t y,
                               uint16_t z) noexcept
{
    const auto cs = static_cast<std::size_t>(cfg.chunk_size);
    const auto xs = static_cast<std::size_t>(x);
    const auto ys = static_cast<std::size_t>(y);
    const auto zs = static_cast<std::size_t>(z);
    return (zs * cs + ys) * cs + xs;
}

inline std::size_t voxel_index(const core::WorldConfig& cfg,
                               const core::LocalVoxelCoord& local) noexcept
{
    return voxel_index(cfg, local.x, local.y, local.z);
}

inline std::size_t chunk_volume(const core::WorldConfig& cfg) noexcept {
    const auto cs = static_cast<std::size_t>(cfg.chunk_size);
    return cs * cs * cs;
}

inline core::Coordinate to_world_voxel(const core::ChunkCoord& chunk,
                                       const core::LocalVoxelCoord& local,
                                       const core::WorldConfig& cfg) noexcept
{
    const int32_t cs = cfg.chunk_size;
    return {
        chunk.x * cs + local.x,
        chunk.y * cs + local.y,
        chunk.z * cs + local.z,
    };
}

inline ChunkAndLocal split_world_voxel(const core::Coordinate& world,
                                       const core::WorldConfig& cfg) noexcept
{
    ChunkAndLocal result{};

    const int32_t cs = cfg.chunk_size;

    auto split_axis = [cs](int32_t w, int32_t& chunk, uint16_t& local) noexcept {
        int32_t q = w / cs;
        int32_t r = w % cs;
        if (r < 0) {
            r += cs;
            --q;
        }
        chunk = q;
        local = static_cast<uint16_t>(r);
    };

    split_axis(world.x, result.chunk.x, result.local.x);
    split_axis(world.y, result.chunk.y, result.local.y);
    split_axis(world.z, result.chunk.z, result.local.z);

    return result;
}

} // namespace strata::world
