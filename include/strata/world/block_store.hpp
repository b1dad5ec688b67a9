#pragma once

#include "strata/core/coords.hpp"
#include "strata/world/material.hpp"

#include <string>

namespace strata::world {

using Dimension = std::string;

inline const Dimension kOverworld = "minecraft:overworld";

// Block read/write access to a persisted world.
// Both operations throw core::LoadError when the coordinate's region is not
// resident.
class IBlockStore {
public:
    virtual ~IBlockStore() = default;
    virtual Material get(const core::Coordinate& coord, const Dimension& dimension) const = 0;
    virtual void set(const core::Coordinate& coord, const Dimension& dimension, const Material& material) = 0;
};

} // namespace strata::world
