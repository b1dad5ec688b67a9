#include "strata/shape/presets.hpp"

#include "strata/core/errors.hpp"
#include "strata/shape/rasterizer.hpp"

#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <string>
#include <utility>

namespace strata::shape {

namespace {

world::Material block(const char* name, world::Properties props = {}) {
    return world::Material{name, std::move(props)};
}

const char* const kCurtainGlass[] = {
    "light_blue_stained_glass",
    "white_stained_glass",
    "light_gray_stained_glass",
    "cyan_stained_glass",
};

world::Material parapet_wall() {
    return block("stone_brick_wall", {{"up", "true"},
                                      {"north", "none"},
                                      {"south", "none"},
                                      {"east", "none"},
                                      {"west", "none"},
                                      {"waterlogged", "false"}});
}

world::Material bottom_stair(const char* name, const char* facing) {
    return block(name, {{"facing", facing}, {"half", "bottom"}, {"shape", "straight"}, {"waterlogged", "false"}});
}

} // namespace

world::VoxelSet simple_house(const core::Coordinate& origin, const HouseOptions& options) {
    const int32_t w = options.width;
    const int32_t h = options.height;
    const int32_t d = options.depth;
    if (w < 5 || d < 5 || h < 4) {
        throw core::InvalidShapeParams("simple_house: footprint must be at least 5x5 and height at least 4, got " +
                                       std::to_string(w) + "x" + std::to_string(d) + " height " + std::to_string(h));
    }

    const int32_t x0 = origin.x;
    const int32_t y0 = origin.y;
    const int32_t z0 = origin.z;
    const int32_t x1 = x0 + w - 1;
    const int32_t z1 = z0 + d - 1;

    world::VoxelSet out;

    // Later layers overwrite earlier ones where they overlap.
    out.merge(rasterize(Floor{y0 - 1, {x0, z0}, {x1, z1}, block("cobblestone"), std::nullopt}));
    out.merge(rasterize(Floor{y0, {x0, z0}, {x1, z1}, block("oak_planks"), std::nullopt}));
    out.merge(rasterize(Walls{{x0, y0 + 1, z0}, {x1, y0 + h - 1, z1}, block("oak_planks"), block("oak_log")}));
    out.merge(rasterize(Box{{x0 + 1, y0 + 1, z0 + 1}, {x1 - 1, y0 + h - 1, z1 - 1}, false, false, world::air()}));

    const world::Material roof = block("oak_slab", {{"type", "top"}, {"waterlogged", "false"}});
    out.merge(rasterize(Floor{y0 + h, {x0, z0}, {x1, z1}, roof, std::nullopt}));

    const int32_t mid_x = x0 + w / 2;
    const int32_t mid_z = z0 + d / 2;

    out.merge(rasterize(Door{{x0, y0 + 1, mid_z}, "oak", "west", "left"}));

    const world::Material pane = block("glass_pane");
    for (int32_t wy : {y0 + 2, y0 + 3}) {
        out.put({x0, wy, mid_z + 1}, pane);
        out.put({x0, wy, mid_z - 1}, pane);
        out.put({x1, wy, mid_z}, pane);
        out.put({mid_x, wy, z0}, pane);
        out.put({mid_x, wy, z1}, pane);
    }

    if (options.furnished) {
        out.put({x1 - 1, y0 + 1, z0 + 1}, block("crafting_table"));
        out.put({x1 - 1, y0 + 1, z0 + 2}, block("furnace", {{"facing", "west"}, {"lit", "false"}}));
        out.put({x1 - 1, y0 + 1, z1 - 1},
                block("chest", {{"facing", "west"}, {"type", "single"}, {"waterlogged", "false"}}));
        out.merge(rasterize(Bed{{x0 + 1, y0 + 1, z1 - 1}, "east", "red"}));
        out.put({mid_x, y0 + h - 1, mid_z}, block("glowstone"));
    }

    out.put({x0 - 1, y0, mid_z}, bottom_stair("oak_stairs", "east"));

    return out;
}

world::VoxelSet skyscraper(const core::Coordinate& origin, const SkyscraperOptions& options) {
    const int32_t w = options.width;
    const int32_t d = options.depth;
    const int32_t fh = options.floor_height;
    if (w < 8 || d < 8 || options.floors < 1 || fh < 3) {
        throw core::InvalidShapeParams("skyscraper: footprint must be at least 8x8 with at least one floor of "
                                       "height 3, got " + std::to_string(w) + "x" + std::to_string(d) + ", " +
                                       std::to_string(options.floors) + " floor(s) of height " + std::to_string(fh));
    }

    const int32_t x0 = origin.x;
    const int32_t y0 = origin.y;
    const int32_t z0 = origin.z;
    const int32_t x1 = x0 + w - 1;
    const int32_t z1 = z0 + d - 1;

    world::VoxelSet out;

    out.merge(rasterize(Box{{x0 - 1, y0 - 3, z0 - 1}, {x1 + 1, y0 - 1, z1 + 1}, false, false,
                            block("deepslate_bricks")}));

    const world::Material smooth = block("smooth_stone");
    const world::Material iron = block("iron_block");
    const world::Material lantern = block("sea_lantern");

    for (int32_t fl = 0; fl < options.floors; ++fl) {
        const int32_t fy = y0 + fl * fh;
        const int32_t ceiling = fy + fh - 1;
        const world::Material glass =
            block(kCurtainGlass[static_cast<std::size_t>(fl) % std::size(kCurtainGlass)]);

        // Interior: checkered floor, open storey, smooth ceiling.
        out.merge(rasterize(Floor{fy, {x0 + 1, z0 + 1}, {x1 - 1, z1 - 1},
                                  block("polished_diorite"), block("polished_andesite")}));
        out.merge(rasterize(Box{{x0 + 1, fy + 1, z0 + 1}, {x1 - 1, ceiling - 1, z1 - 1}, false, false,
                                world::air()}));
        out.merge(rasterize(Floor{ceiling, {x0 + 1, z0 + 1}, {x1 - 1, z1 - 1}, smooth, std::nullopt}));

        // Shell: smooth bands top and bottom, curtain wall on storey rows 1-3.
        for (int32_t y = fy; y <= ceiling; ++y) {
            const int32_t row = y - fy;
            const bool curtain = row > 0 && y < ceiling && row <= 3;
            out.merge(rasterize(Walls{{x0, y, z0}, {x1, y, z1}, curtain ? glass : smooth, iron}));
            if (curtain) {
                out.merge(rasterize(Windows{{x0, y, z0}, {x1, y, z1}, 4, iron}));
            }
        }

        for (int32_t lx : {x0 + 3, x1 - 3}) {
            for (int32_t lz : {z0 + 3, z1 - 3}) {
                out.put({lx, ceiling, lz}, lantern);
            }
        }
    }

    // Entrance portal on the west wall.
    const int32_t mid_z = z0 + d / 2;
    const world::Material blackstone = block("polished_blackstone");
    out.merge(rasterize(Box{{x0, y0 + 1, mid_z - 2}, {x0, y0 + 3, mid_z + 2}, false, false, world::air()}));
    out.merge(rasterize(Box{{x0, y0, mid_z - 2}, {x0, y0, mid_z + 2}, false, false, blackstone}));
    for (int32_t pz : {mid_z - 3, mid_z + 3}) {
        out.merge(rasterize(Box{{x0 - 1, y0, pz}, {x0 - 1, y0 + 4, pz}, false, false,
                                block("quartz_pillar", {{"axis", "y"}})}));
        out.put({x0 - 1, y0 + 5, pz}, lantern);
    }
    out.merge(rasterize(Box{{x0 - 1, y0 + 4, mid_z - 3}, {x0 - 1, y0 + 4, mid_z + 3}, false, false, blackstone}));
    out.merge(rasterize(Box{{x0 - 1, y0, mid_z - 2}, {x0 - 1, y0, mid_z + 2}, false, false,
                            bottom_stair("polished_blackstone_stairs", "east")}));

    // Roof slab overhanging by one, parapet, antenna.
    const int32_t top = y0 + options.floors * fh;
    out.merge(rasterize(Floor{top, {x0 - 1, z0 - 1}, {x1 + 1, z1 + 1},
                              block("smooth_stone_slab", {{"type", "top"}, {"waterlogged", "false"}}),
                              std::nullopt}));
    out.merge(rasterize(Walls{{x0, top + 1, z0}, {x1, top + 1, z1}, parapet_wall(), std::nullopt}));

    const int32_t cx = x0 + w / 2;
    const int32_t cz = z0 + d / 2;
    out.merge(rasterize(Box{{cx, top + 1, cz}, {cx, top + 7, cz}, false, false, iron}));
    out.put({cx, top + 8, cz}, lantern);
    out.put({cx, top + 9, cz}, block("lightning_rod"));

    return out;
}

} // namespace strata::shape
