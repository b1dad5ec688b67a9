#include "strata/world/edit.hpp"

#include <vector>

namespace strata::world {

void apply_voxel_set(IBlockStore& store,
                     const Dimension& dimension,
                     const VoxelSet& voxels,
                     const PlaceOptions& options,
                     EditStats* out_stats)
{
    // Reading every target first surfaces a LoadError before anything is written.
    const VoxelSet previous = snapshot(store, dimension, voxels);

    EditStats local_stats{};
    std::size_t since_flush = 0;
    std::vector<core::Coordinate> written;

    try {
        for (const auto& [coord, material] : voxels) {
            ++local_stats.voxels_touched;

            const Material& before = *previous.find(coord);
            if (options.only_replace_air && !before.is_air()) {
                continue;
            }

            if (before != material) {
                store.set(coord, dimension, material);
                written.push_back(coord);
                ++local_stats.voxels_changed;
            }

            if (options.flush_interval > 0 && ++since_flush >= options.flush_interval) {
                since_flush = 0;
                if (options.flush) {
                    options.flush();
                }
                ++local_stats.flushes;
            }
        }
    } catch (...) {
        for (auto it = written.rbegin(); it != written.rend(); ++it) {
            store.set(*it, dimension, *previous.find(*it));
        }
        throw;
    }

    if (out_stats) {
        *out_stats = local_stats;
    }
}

VoxelSet snapshot(const IBlockStore& store, const Dimension& dimension, const VoxelSet& voxels) {
    VoxelSet out;
    for (const auto& [coord, material] : voxels) {
        out.put(coord, store.get(coord, dimension));
    }
    return out;
}

} // namespace strata::world
