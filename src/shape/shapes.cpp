#include "strata/shape/shapes.hpp"
#include "strata/shape/rasterizer.hpp"

#include "strata/core/errors.hpp"
#include "strata/core/overloaded.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <initializer_list>
#include <string>

namespace strata::shape {

namespace {

using core::overloaded;

[[noreturn]] void fail(const char* shape, const std::string& what) {
    throw core::InvalidShapeParams(std::string(shape) + ": " + what);
}

bool is_one_of(const std::string& v, std::initializer_list<const char*> options) {
    return std::any_of(options.begin(), options.end(), [&v](const char* o) { return v == o; });
}

void check_radius(const char* shape, double radius) {
    if (!(radius >= 0.0) || !std::isfinite(radius)) {
        fail(shape, "radius must be a finite non-negative number, got " + std::to_string(radius));
    }
    if (radius > kMaxRadius) {
        fail(shape, "radius " + std::to_string(radius) + " exceeds " + std::to_string(kMaxRadius));
    }
}

void check_facing(const char* shape, const std::string& facing) {
    if (!is_one_of(facing, {"north", "south", "east", "west"})) {
        fail(shape, "unknown facing '" + facing + "'");
    }
}

void check_positive(const char* shape, const char* field, int32_t value) {
    if (value <= 0) {
        fail(shape, std::string(field) + " must be positive, got " + std::to_string(value));
    }
}

void check_horizontal(const char* shape, Axis axis) {
    if (axis != Axis::X && axis != Axis::Z) {
        fail(shape, std::string("axis must be horizontal (x or z), got ") + to_string(axis));
    }
}

void check_material(const char* shape, const world::Material& m) {
    if (m.name.empty()) {
        fail(shape, "material name must not be empty");
    }
}

int32_t horizontal_reach(double radius) noexcept {
    return static_cast<int32_t>(std::floor(radius + 0.5));
}

} // namespace

const char* to_string(Axis axis) noexcept {
    switch (axis) {
    case Axis::X: return "x";
    case Axis::Y: return "y";
    case Axis::Z: return "z";
    }
    return "?";
}

Axis parse_axis(std::string_view text) {
    if (text.size() == 1) {
        switch (std::tolower(static_cast<unsigned char>(text.front()))) {
        case 'x': return Axis::X;
        case 'y': return Axis::Y;
        case 'z': return Axis::Z;
        default: break;
        }
    }
    throw core::InvalidShapeParams("malformed axis '" + std::string(text) + "'");
}

const char* shape_name(const ShapeDescriptor& shape) noexcept {
    return std::visit(overloaded{
        [](const Circle&) { return "circle"; },
        [](const Cylinder&) { return "cylinder"; },
        [](const Cone&) { return "cone"; },
        [](const Arch&) { return "arch"; },
        [](const PitchedRoof&) { return "pitched_roof"; },
        [](const Box&) { return "box"; },
        [](const Walls&) { return "walls"; },
        [](const Floor&) { return "floor"; },
        [](const Door&) { return "door"; },
        [](const Windows&) { return "windows"; },
        [](const Bed&) { return "bed"; },
    }, shape);
}

void validate(const ShapeDescriptor& shape) {
    std::visit(overloaded{
        [](const Circle& s) {
            check_radius("circle", s.radius);
            check_material("circle", s.material);
        },
        [](const Cylinder& s) {
            check_radius("cylinder", s.radius);
            if (s.y1 < s.y0) {
                fail("cylinder", "y1 must not be below y0");
            }
            check_material("cylinder", s.material);
        },
        [](const Cone& s) {
            check_radius("cone", s.radius);
            check_positive("cone", "height", s.height);
            check_material("cone", s.material);
        },
        [](const Arch& s) {
            check_horizontal("arch", s.axis);
            check_positive("arch", "span", s.span);
            check_positive("arch", "height", s.height);
            check_positive("arch", "depth", s.depth);
            check_positive("arch", "thickness", s.thickness);
            check_material("arch", s.material);
        },
        [](const PitchedRoof& s) {
            check_horizontal("pitched_roof", s.axis);
            check_positive("pitched_roof", "span", s.span);
            check_positive("pitched_roof", "length", s.length);
            check_material("pitched_roof", s.stair);
            check_material("pitched_roof", s.slab);
        },
        [](const Box& s) {
            if (s.clear_interior && !s.hollow) {
                fail("box", "clear_interior requires hollow");
            }
            check_material("box", s.material);
        },
        [](const Walls& s) {
            check_material("walls", s.material);
            if (s.corner) {
                check_material("walls", *s.corner);
            }
        },
        [](const Floor& s) {
            check_material("floor", s.material);
            if (s.checkerboard) {
                check_material("floor", *s.checkerboard);
            }
        },
        [](const Door& s) {
            if (s.wood.empty()) {
                fail("door", "wood must not be empty");
            }
            check_facing("door", s.facing);
            if (!is_one_of(s.hinge, {"left", "right"})) {
                fail("door", "unknown hinge '" + s.hinge + "'");
            }
        },
        [](const Windows& s) {
            check_positive("windows", "spacing", s.spacing);
            check_material("windows", s.material);
        },
        [](const Bed& s) {
            check_facing("bed", s.facing);
            if (s.color.empty()) {
                fail("bed", "color must not be empty");
            }
        },
    }, shape);
}

core::Coordinate bed_head(const Bed& bed) {
    core::Coordinate head = bed.foot;
    if (bed.facing == "east") {
        ++head.x;
    } else if (bed.facing == "west") {
        --head.x;
    } else if (bed.facing == "south") {
        ++head.z;
    } else if (bed.facing == "north") {
        --head.z;
    } else {
        fail("bed", "unknown facing '" + bed.facing + "'");
    }
    return head;
}

Box3 box_from_corners(const core::Coordinate& a, const core::Coordinate& b) noexcept {
    return {
        {std::min(a.x, b.x), std::min(a.y, b.y), std::min(a.z, b.z)},
        {std::max(a.x, b.x), std::max(a.y, b.y), std::max(a.z, b.z)},
    };
}

Box3 shape_bounds(const ShapeDescriptor& shape) {
    validate(shape);
    return std::visit(overloaded{
        [](const Circle& s) {
            const int32_t r = horizontal_reach(s.radius);
            return Box3{{s.center.x - r, s.center.y, s.center.z - r},
                        {s.center.x + r, s.center.y, s.center.z + r}};
        },
        [](const Cylinder& s) {
            const int32_t r = horizontal_reach(s.radius);
            return Box3{{s.center.x - r, s.y0, s.center.z - r},
                        {s.center.x + r, s.y1, s.center.z + r}};
        },
        [](const Cone& s) {
            const int32_t r = horizontal_reach(s.radius);
            return Box3{{s.base.x - r, s.base.y, s.base.z - r},
                        {s.base.x + r, s.base.y + s.height - 1, s.base.z + r}};
        },
        [](const Arch& s) {
            const int32_t across = s.span - 1;
            const int32_t along = s.depth - 1;
            const int32_t dx = s.axis == Axis::Z ? across : along;
            const int32_t dz = s.axis == Axis::Z ? along : across;
            return Box3{s.origin, {s.origin.x + dx, s.origin.y + s.height - 1, s.origin.z + dz}};
        },
        [](const PitchedRoof& s) {
            const int32_t across = s.span - 1;
            const int32_t along = s.length - 1;
            const int32_t dx = s.axis == Axis::Z ? across : along;
            const int32_t dz = s.axis == Axis::Z ? along : across;
            return Box3{s.origin, {s.origin.x + dx, s.origin.y + roof_height(s.span) - 1, s.origin.z + dz}};
        },
        [](const Box& s) { return box_from_corners(s.corner1, s.corner2); },
        [](const Walls& s) { return box_from_corners(s.corner1, s.corner2); },
        [](const Floor& s) {
            return box_from_corners({s.corner1.x, s.y, s.corner1.z}, {s.corner2.x, s.y, s.corner2.z});
        },
        [](const Door& s) { return Box3{s.base, {s.base.x, s.base.y + 1, s.base.z}}; },
        [](const Windows& s) { return box_from_corners(s.corner1, s.corner2); },
        [](const Bed& s) { return box_from_corners(s.foot, bed_head(s)); },
    }, shape);
}

} // namespace strata::shape
