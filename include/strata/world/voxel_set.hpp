#pragma once

#include "strata/core/coords.hpp"
#include "strata/world/material.hpp"

#include <cstddef>
#include <map>

namespace strata::world {

// Coordinate -> material, at most one material per coordinate.
// Iteration order is (x, y, z) ascending so output is reproducible.
class VoxelSet {
public:
    using Storage = std::map<core::Coordinate, Material>;
    using const_iterator = Storage::const_iterator;

    // Last write wins.
    void put(const core::Coordinate& coord, const Material& material) {
        voxels_.insert_or_assign(coord, material);
    }

    void erase(const core::Coordinate& coord) { voxels_.erase(coord); }

    // Copies every voxel of `other`, overwriting on overlap.
    void merge(const VoxelSet& other) {
        for (const auto& [coord, material] : other.voxels_) {
            voxels_.insert_or_assign(coord, material);
        }
    }

    [[nodiscard]] const Material* find(const core::Coordinate& coord) const {
        auto it = voxels_.find(coord);
        return it == voxels_.end() ? nullptr : &it->second;
    }

    [[nodiscard]] bool contains(const core::Coordinate& coord) const { return voxels_.count(coord) != 0; }
    [[nodiscard]] std::size_t size() const noexcept { return voxels_.size(); }
    [[nodiscard]] bool empty() const noexcept { return voxels_.empty(); }

    const_iterator begin() const noexcept { return voxels_.begin(); }
    const_iterator end() const noexcept { return voxels_.end(); }

    [[nodiscard]] const Storage& voxels() const noexcept { return voxels_; }

private:
    Storage voxels_;
};

inline bool operator==(const VoxelSet& a, const VoxelSet& b) {
    return a.voxels() == b.voxels();
}

} // namespace strata::world
