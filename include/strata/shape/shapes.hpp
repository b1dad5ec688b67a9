#pragma once

#include "strata/core/coords.hpp"
#include "strata/world/material.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace strata::shape {

enum class Axis : uint8_t { X, Y, Z };

const char* to_string(Axis axis) noexcept;

// Accepts "x", "y", "z" in any case; throws core::InvalidShapeParams otherwise.
Axis parse_axis(std::string_view text);

// Horizontal disk (fill) or one-block-wide ring at y = center.y.
struct Circle {
    core::Coordinate center{};
    double radius = 0.0;
    bool fill = true;
    world::Material material{"stone"};
};

// Circle stacked on every level of [y0, y1].
struct Cylinder {
    core::Coordinate2D center{};
    int32_t y0 = 0;
    int32_t y1 = 0;
    double radius = 0.0;
    bool hollow = false;
    world::Material material{"stone"};
};

// Levels base.y .. base.y + height - 1, radius shrinking linearly to 0.
struct Cone {
    core::Coordinate base{};
    int32_t height = 1;
    double radius = 0.0;
    bool fill = true;
    world::Material material{"stone"};
};

// Half-ellipse profile across the extrusion axis. `origin` is the minimum
// corner of the footprint.
struct Arch {
    core::Coordinate origin{};
    Axis axis = Axis::Z;
    int32_t span = 5;
    int32_t height = 3;
    int32_t depth = 1;
    int32_t thickness = 1;
    world::Material material{"stone_bricks"};
};

// Gable roof; `axis` is the ridge direction, `span` the width across it.
struct PitchedRoof {
    core::Coordinate origin{};
    Axis axis = Axis::Z;
    int32_t span = 5;
    int32_t length = 5;
    world::Material stair{"oak_stairs"};
    world::Material slab{"oak_slab"};
};

struct Box {
    core::Coordinate corner1{};
    core::Coordinate corner2{};
    bool hollow = false;
    // With hollow, also write air to the interior.
    bool clear_interior = false;
    world::Material material{"stone"};
};

// Four vertical walls, no floor or ceiling.
struct Walls {
    core::Coordinate corner1{};
    core::Coordinate corner2{};
    world::Material material{"oak_planks"};
    std::optional<world::Material> corner;
};

struct Floor {
    int32_t y = 0;
    core::Coordinate2D corner1{};
    core::Coordinate2D corner2{};
    world::Material material{"oak_planks"};
    // Placed on columns with odd x + z.
    std::optional<world::Material> checkerboard;
};

// Two-block door; `base` is the lower half.
struct Door {
    core::Coordinate base{};
    std::string wood = "oak";
    std::string facing = "west";
    std::string hinge = "left";
};

// Panes on the four walls of the box between the corners, on every level,
// at columns whose offset from the minimum corner is a multiple of `spacing`.
// Wall corners are skipped.
struct Windows {
    core::Coordinate corner1{};
    core::Coordinate corner2{};
    int32_t spacing = 3;
    world::Material material{"glass_pane"};
};

// Two-block bed; the head lies one block from `foot` in the `facing` direction.
struct Bed {
    core::Coordinate foot{};
    std::string facing = "east";
    std::string color = "red";
};

using ShapeDescriptor =
    std::variant<Circle, Cylinder, Cone, Arch, PitchedRoof, Box, Walls, Floor, Door, Windows, Bed>;

// Largest radius accepted by the circular shapes.
inline constexpr double kMaxRadius = 4096.0;

const char* shape_name(const ShapeDescriptor& shape) noexcept;

// Throws core::InvalidShapeParams describing the first bad parameter.
void validate(const ShapeDescriptor& shape);

// Inclusive axis-aligned box.
struct Box3 {
    core::Coordinate min{};
    core::Coordinate max{};

    [[nodiscard]] bool contains(const core::Coordinate& c) const noexcept {
        return c.x >= min.x && c.x <= max.x &&
               c.y >= min.y && c.y <= max.y &&
               c.z >= min.z && c.z <= max.z;
    }
};

Box3 box_from_corners(const core::Coordinate& a, const core::Coordinate& b) noexcept;

// Head position of a bed. Throws core::InvalidShapeParams on an unknown facing.
core::Coordinate bed_head(const Bed& bed);

// Geometric bounds of a shape; every rasterized voxel lies inside.
// Throws core::InvalidShapeParams for invalid shapes.
Box3 shape_bounds(const ShapeDescriptor& shape);

} // namespace strata::shape
