#pragma once

#include "strata/world/block_store.hpp"
#include "strata/world/voxel_set.hpp"

#include <cstddef>
#include <functional>

namespace strata::world {

struct EditStats {
    std::size_t voxels_touched = 0;
    std::size_t voxels_changed = 0;
    std::size_t flushes = 0;
};

struct PlaceOptions {
    // Invoke `flush` after every `flush_interval` placed voxels; 0 disables.
    std::size_t flush_interval = 0;
    std::function<void()> flush;
    // Leave non-air blocks alone and only write into air.
    bool only_replace_air = false;
};

// Writes every voxel of `voxels` into `store`. Every target is read before the
// first write, so a LoadError leaves the store untouched; a failing write
// restores the voxels already written and rethrows.
void apply_voxel_set(IBlockStore& store,
                     const Dimension& dimension,
                     const VoxelSet& voxels,
                     const PlaceOptions& options = {},
                     EditStats* out_stats = nullptr);

// Captures the current store contents at every coordinate of `voxels`,
// e.g. to undo a placement.
VoxelSet snapshot(const IBlockStore& store, const Dimension& dimension, const VoxelSet& voxels);

} // namespace strata::world
