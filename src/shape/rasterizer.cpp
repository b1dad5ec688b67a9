#include "strata/shape/rasterizer.hpp"

#include "strata/core/overloaded.hpp"

#include <cmath>
#include <string>

namespace strata::shape {

namespace {

using core::overloaded;

// Disk: d <= r. Ring: r - 0.5 <= d <= r + 0.5.
void rasterize_circle(world::VoxelSet& out,
                      int32_t cx, int32_t y, int32_t cz,
                      double radius, bool fill,
                      const world::Material& material)
{
    const auto reach = static_cast<int32_t>(std::floor(radius + 0.5));
    const double inner = radius - 0.5;
    const double outer = radius + 0.5;

    for (int32_t dz = -reach; dz <= reach; ++dz) {
        for (int32_t dx = -reach; dx <= reach; ++dx) {
            const double d2 = static_cast<double>(dx) * dx + static_cast<double>(dz) * dz;
            bool inside = false;
            if (fill) {
                inside = d2 <= radius * radius;
            } else {
                inside = d2 <= outer * outer && (inner <= 0.0 || d2 >= inner * inner);
            }
            if (inside) {
                out.put({cx + dx, y, cz + dz}, material);
            }
        }
    }
}

world::VoxelSet rasterize_arch(const Arch& s) {
    world::VoxelSet out;

    const double a = s.span / 2.0;
    const double b = static_cast<double>(s.height);
    const double ai = a - s.thickness;
    const double bi = b - s.thickness;
    const bool solid = ai <= 0.0 || bi <= 0.0;

    for (int32_t i = 0; i < s.span; ++i) {
        const double u = (i + 0.5) - a;
        for (int32_t j = 0; j < s.height; ++j) {
            const double v = j + 0.5;
            const double outer = (u * u) / (a * a) + (v * v) / (b * b);
            if (outer > 1.0) {
                continue;
            }
            if (!solid && (u * u) / (ai * ai) + (v * v) / (bi * bi) <= 1.0) {
                continue;
            }
            for (int32_t k = 0; k < s.depth; ++k) {
                const core::Coordinate c = s.axis == Axis::Z
                    ? core::Coordinate{s.origin.x + i, s.origin.y + j, s.origin.z + k}
                    : core::Coordinate{s.origin.x + k, s.origin.y + j, s.origin.z + i};
                out.put(c, s.material);
            }
        }
    }
    return out;
}

world::Material stair_facing(const world::Material& stair, const char* facing) {
    world::Material m = stair;
    m.properties["facing"] = facing;
    m.properties.emplace("half", "bottom");
    m.properties.emplace("shape", "straight");
    m.properties.emplace("waterlogged", "false");
    return m;
}

// Row i climbs one block; stairs on both eaves face the ridge. An odd span
// leaves a single centre row, which gets a slab.
world::VoxelSet rasterize_roof(const PitchedRoof& s) {
    world::VoxelSet out;

    const bool ridge_along_z = s.axis == Axis::Z;
    const world::Material rising = stair_facing(s.stair, ridge_along_z ? "east" : "south");
    const world::Material falling = stair_facing(s.stair, ridge_along_z ? "west" : "north");
    world::Material slab = s.slab;
    slab.properties.emplace("type", "top");
    slab.properties.emplace("waterlogged", "false");

    const int32_t rows = roof_height(s.span);
    for (int32_t i = 0; i < rows; ++i) {
        const int32_t y = s.origin.y + i;
        const int32_t near = i;
        const int32_t far = s.span - 1 - i;
        for (int32_t k = 0; k < s.length; ++k) {
            auto at = [&](int32_t across) {
                return ridge_along_z
                    ? core::Coordinate{s.origin.x + across, y, s.origin.z + k}
                    : core::Coordinate{s.origin.x + k, y, s.origin.z + across};
            };
            if (near == far) {
                out.put(at(near), slab);
            } else {
                out.put(at(near), rising);
                out.put(at(far), falling);
            }
        }
    }
    return out;
}

world::VoxelSet rasterize_box(const Box& s) {
    world::VoxelSet out;
    const Box3 b = box_from_corners(s.corner1, s.corner2);
    for (int32_t x = b.min.x; x <= b.max.x; ++x) {
        for (int32_t y = b.min.y; y <= b.max.y; ++y) {
            for (int32_t z = b.min.z; z <= b.max.z; ++z) {
                const bool on_face = x == b.min.x || x == b.max.x ||
                                     y == b.min.y || y == b.max.y ||
                                     z == b.min.z || z == b.max.z;
                if (!s.hollow || on_face) {
                    out.put({x, y, z}, s.material);
                } else if (s.clear_interior) {
                    out.put({x, y, z}, world::air());
                }
            }
        }
    }
    return out;
}

world::VoxelSet rasterize_walls(const Walls& s) {
    world::VoxelSet out;
    const Box3 b = box_from_corners(s.corner1, s.corner2);
    const world::Material& corner = s.corner ? *s.corner : s.material;
    for (int32_t y = b.min.y; y <= b.max.y; ++y) {
        for (int32_t x = b.min.x; x <= b.max.x; ++x) {
            for (int32_t z = b.min.z; z <= b.max.z; ++z) {
                const bool edge_x = x == b.min.x || x == b.max.x;
                const bool edge_z = z == b.min.z || z == b.max.z;
                if (edge_x && edge_z) {
                    out.put({x, y, z}, corner);
                } else if (edge_x || edge_z) {
                    out.put({x, y, z}, s.material);
                }
            }
        }
    }
    return out;
}

world::VoxelSet rasterize_floor(const Floor& s) {
    world::VoxelSet out;
    const core::Rect r = core::Rect::spanning(s.corner1, s.corner2);
    for (int32_t x = r.min_x; x <= r.max_x; ++x) {
        for (int32_t z = r.min_z; z <= r.max_z; ++z) {
            const bool odd = ((x + z) & 1) != 0;
            out.put({x, s.y, z}, s.checkerboard && odd ? *s.checkerboard : s.material);
        }
    }
    return out;
}

world::VoxelSet rasterize_door(const Door& s) {
    world::VoxelSet out;
    const std::string name = s.wood + "_door";
    world::Properties props{
        {"facing", s.facing},
        {"hinge", s.hinge},
        {"open", "false"},
        {"powered", "false"},
    };
    props["half"] = "lower";
    out.put(s.base, world::Material{name, props});
    props["half"] = "upper";
    out.put({s.base.x, s.base.y + 1, s.base.z}, world::Material{name, props});
    return out;
}

world::VoxelSet rasterize_windows(const Windows& s) {
    world::VoxelSet out;
    const Box3 b = box_from_corners(s.corner1, s.corner2);
    for (int32_t y = b.min.y; y <= b.max.y; ++y) {
        for (int32_t x = b.min.x + 1; x < b.max.x; ++x) {
            if ((x - b.min.x) % s.spacing == 0) {
                out.put({x, y, b.min.z}, s.material);
                out.put({x, y, b.max.z}, s.material);
            }
        }
        for (int32_t z = b.min.z + 1; z < b.max.z; ++z) {
            if ((z - b.min.z) % s.spacing == 0) {
                out.put({b.min.x, y, z}, s.material);
                out.put({b.max.x, y, z}, s.material);
            }
        }
    }
    return out;
}

world::VoxelSet rasterize_bed(const Bed& s) {
    world::VoxelSet out;
    const std::string name = s.color + "_bed";
    world::Properties props{
        {"facing", s.facing},
        {"occupied", "false"},
    };
    props["part"] = "foot";
    out.put(s.foot, world::Material{name, props});
    props["part"] = "head";
    out.put(bed_head(s), world::Material{name, props});
    return out;
}

} // namespace

double cone_level_radius(const Cone& cone, int32_t level) noexcept {
    if (cone.height <= 1) {
        return cone.radius;
    }
    return cone.radius * static_cast<double>(cone.height - 1 - level) / static_cast<double>(cone.height - 1);
}

int32_t roof_height(int32_t span) noexcept {
    return span <= 0 ? 0 : (span + 1) / 2;
}

world::VoxelSet rasterize(const ShapeDescriptor& shape) {
    validate(shape);

    return std::visit(overloaded{
        [](const Circle& s) {
            world::VoxelSet out;
            rasterize_circle(out, s.center.x, s.center.y, s.center.z, s.radius, s.fill, s.material);
            return out;
        },
        [](const Cylinder& s) {
            world::VoxelSet out;
            for (int32_t y = s.y0; y <= s.y1; ++y) {
                rasterize_circle(out, s.center.x, y, s.center.z, s.radius, !s.hollow, s.material);
            }
            return out;
        },
        [](const Cone& s) {
            world::VoxelSet out;
            for (int32_t i = 0; i < s.height; ++i) {
                rasterize_circle(out, s.base.x, s.base.y + i, s.base.z,
                                 cone_level_radius(s, i), s.fill, s.material);
            }
            return out;
        },
        [](const Arch& s) { return rasterize_arch(s); },
        [](const PitchedRoof& s) { return rasterize_roof(s); },
        [](const Box& s) { return rasterize_box(s); },
        [](const Walls& s) { return rasterize_walls(s); },
        [](const Floor& s) { return rasterize_floor(s); },
        [](const Door& s) { return rasterize_door(s); },
        [](const Windows& s) { return rasterize_windows(s); },
        [](const Bed& s) { return rasterize_bed(s); },
    }, shape);
}

} // namespace strata::shape
