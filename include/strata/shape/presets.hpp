#pragma once

#include "strata/core/coords.hpp"
#include "strata/world/voxel_set.hpp"

#include <cstdint>

namespace strata::shape {

struct HouseOptions {
    int32_t width = 7;
    int32_t height = 5;
    int32_t depth = 7;
    // Crafting table, furnace, chest, bed and a ceiling light.
    bool furnished = true;
};

// Small wooden cabin with its floor at origin.y and its minimum corner at
// (origin.x, origin.z). Includes a cobblestone foundation one block below,
// log-cornered plank walls, a slab roof at origin.y + height, a west-facing
// door, glass-pane windows and a doorstep outside the west wall.
//
// Throws core::InvalidShapeParams if width or depth is below 5 or height
// below 4.
world::VoxelSet simple_house(const core::Coordinate& origin, const HouseOptions& options = {});

struct SkyscraperOptions {
    int32_t width = 15;
    int32_t depth = 15;
    int32_t floors = 12;
    int32_t floor_height = 5;
};

// Glass curtain-wall tower with its ground floor at origin.y and its minimum
// corner at (origin.x, origin.z): a three-block deepslate foundation, per
// floor a checkered floor, smooth stone ceiling with four sea lanterns, iron
// corner posts and mullions every 4 blocks between tinted glass (the tint
// cycles by floor), an entrance portal on the west wall, and a parapet with an
// antenna on the roof at origin.y + floors * floor_height.
//
// Throws core::InvalidShapeParams if width or depth is below 8, floors below
// 1 or floor_height below 3.
world::VoxelSet skyscraper(const core::Coordinate& origin, const SkyscraperOptions& options = {});

} // namespace strata::shape
