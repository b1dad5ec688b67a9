/**
 * @file test_rasterizer.cpp
 * @brief Parametric shapes to voxel sets
 */

#include <gtest/gtest.h>

#include "strata/core/errors.hpp"
#include "strata/shape/presets.hpp"
#include "strata/shape/rasterizer.hpp"
#include "strata/shape/shapes.hpp"

#include <string>
#include <vector>

using namespace strata;
using namespace strata::shape;

namespace {

std::size_t count_named(const world::VoxelSet& set, const std::string& name) {
    std::size_t n = 0;
    for (const auto& [c, m] : set) {
        n += m.name == name ? 1 : 0;
    }
    return n;
}

} // namespace

// =============================================================================
// Circles, cylinders, cones
// =============================================================================

TEST(CircleTest, DiskOfRadiusFive) {
    const world::VoxelSet disk = rasterize(Circle{{0, 64, 0}, 5.0, true});

    EXPECT_EQ(81u, disk.size());
    for (const auto& [c, m] : disk) {
        EXPECT_EQ(64, c.y);
        EXPECT_LE(c.x * c.x + c.z * c.z, 25);
    }
}

TEST(CircleTest, RingIsSubsetOfWiderDiskAndSmallerThanDisk) {
    const world::VoxelSet ring = rasterize(Circle{{3, 0, -2}, 5.0, false});
    const world::VoxelSet disk = rasterize(Circle{{3, 0, -2}, 5.0, true});

    EXPECT_LT(ring.size(), disk.size());
    EXPECT_FALSE(ring.contains({3, 0, -2}));
    EXPECT_TRUE(ring.contains({8, 0, -2}));
    for (const auto& [c, m] : ring) {
        const double dx = c.x - 3;
        const double dz = c.z + 2;
        const double d2 = dx * dx + dz * dz;
        EXPECT_GE(d2, 4.5 * 4.5);
        EXPECT_LE(d2, 5.5 * 5.5);
    }
}

TEST(CircleTest, ZeroRadiusIsSingleVoxel) {
    EXPECT_EQ(1u, rasterize(Circle{{0, 0, 0}, 0.0, true}).size());
    EXPECT_EQ(1u, rasterize(Circle{{0, 0, 0}, 0.0, false}).size());
}

TEST(CylinderTest, LevelsTimesDisk) {
    Cylinder cyl;
    cyl.center = {0, 0};
    cyl.y0 = 10;
    cyl.y1 = 13;
    cyl.radius = 5.0;

    EXPECT_EQ(4u * 81u, rasterize(cyl).size());

    cyl.hollow = true;
    const world::VoxelSet shell = rasterize(cyl);
    EXPECT_FALSE(shell.contains({0, 11, 0}));
    EXPECT_TRUE(shell.contains({5, 11, 0}));
}

TEST(ConeTest, ShrinksToApex) {
    Cone cone;
    cone.base = {0, 0, 0};
    cone.height = 3;
    cone.radius = 2.0;

    EXPECT_DOUBLE_EQ(2.0, cone_level_radius(cone, 0));
    EXPECT_DOUBLE_EQ(1.0, cone_level_radius(cone, 1));
    EXPECT_DOUBLE_EQ(0.0, cone_level_radius(cone, 2));

    const world::VoxelSet v = rasterize(cone);
    EXPECT_EQ(13u + 5u + 1u, v.size());
    EXPECT_TRUE(v.contains({0, 2, 0}));
    EXPECT_FALSE(v.contains({1, 2, 0}));
}

TEST(ConeTest, HeightOneIsADisk) {
    Cone cone;
    cone.height = 1;
    cone.radius = 5.0;

    EXPECT_EQ(81u, rasterize(cone).size());
}

// =============================================================================
// Arch and roof
// =============================================================================

TEST(ArchTest, HalfEllipseShell) {
    Arch arch;
    arch.origin = {10, 20, 30};
    arch.axis = Axis::Z;
    arch.span = 5;
    arch.height = 3;
    arch.depth = 1;
    arch.thickness = 1;

    const world::VoxelSet v = rasterize(arch);

    EXPECT_EQ(9u, v.size());
    // Opening under the keystone.
    EXPECT_FALSE(v.contains({12, 20, 30}));
    EXPECT_FALSE(v.contains({12, 21, 30}));
    EXPECT_TRUE(v.contains({12, 22, 30}));
    // Feet on both sides.
    EXPECT_TRUE(v.contains({10, 20, 30}));
    EXPECT_TRUE(v.contains({14, 20, 30}));
}

TEST(ArchTest, DepthExtrudesAlongAxis) {
    Arch arch;
    arch.axis = Axis::X;
    arch.depth = 4;

    const world::VoxelSet v = rasterize(arch);

    EXPECT_EQ(9u * 4u, v.size());
    EXPECT_TRUE(v.contains({3, 0, 0}));
    EXPECT_TRUE(v.contains({0, 0, 4}));
}

TEST(ArchTest, ThickArchIsSolid) {
    Arch arch;
    arch.thickness = 3;

    const world::VoxelSet v = rasterize(arch);
    EXPECT_TRUE(v.contains({2, 0, 0}));
}

TEST(PitchedRoofTest, OddSpanGetsRidgeSlab) {
    PitchedRoof roof;
    roof.origin = {0, 70, 0};
    roof.axis = Axis::Z;
    roof.span = 5;
    roof.length = 3;

    const world::VoxelSet v = rasterize(roof);

    EXPECT_EQ(15u, v.size());
    EXPECT_EQ(3, roof_height(5));
    EXPECT_EQ(3u, count_named(v, "oak_slab"));

    const world::Material* east = v.find({0, 70, 1});
    ASSERT_NE(nullptr, east);
    EXPECT_EQ("oak_stairs", east->name);
    EXPECT_EQ("east", east->properties.at("facing"));
    EXPECT_EQ("bottom", east->properties.at("half"));

    const world::Material* west = v.find({3, 71, 1});
    ASSERT_NE(nullptr, west);
    EXPECT_EQ("west", west->properties.at("facing"));

    const world::Material* ridge = v.find({2, 72, 2});
    ASSERT_NE(nullptr, ridge);
    EXPECT_EQ("top", ridge->properties.at("type"));
}

TEST(PitchedRoofTest, EvenSpanHasNoSlab) {
    PitchedRoof roof;
    roof.axis = Axis::X;
    roof.span = 4;
    roof.length = 2;

    const world::VoxelSet v = rasterize(roof);

    EXPECT_EQ(8u, v.size());
    EXPECT_EQ(0u, count_named(v, "oak_slab"));
    EXPECT_EQ("south", v.find({0, 0, 0})->properties.at("facing"));
    EXPECT_EQ("north", v.find({1, 1, 2})->properties.at("facing"));
}

// =============================================================================
// Boxes and building parts
// =============================================================================

TEST(BoxTest, HollowExcludesInteriorKeepsFaces) {
    Box box;
    box.corner1 = {4, 4, 4};
    box.corner2 = {0, 0, 0};
    box.hollow = true;

    const world::VoxelSet v = rasterize(box);

    EXPECT_EQ(125u - 27u, v.size());
    for (int32_t x = 1; x <= 3; ++x) {
        for (int32_t y = 1; y <= 3; ++y) {
            for (int32_t z = 1; z <= 3; ++z) {
                EXPECT_FALSE(v.contains({x, y, z}));
            }
        }
    }
    EXPECT_TRUE(v.contains({0, 2, 2}));
    EXPECT_TRUE(v.contains({4, 4, 4}));
}

TEST(BoxTest, ClearInteriorWritesAir) {
    Box box;
    box.corner2 = {4, 4, 4};
    box.hollow = true;
    box.clear_interior = true;

    const world::VoxelSet v = rasterize(box);

    EXPECT_EQ(125u, v.size());
    EXPECT_TRUE(v.find({2, 2, 2})->is_air());
    EXPECT_FALSE(v.find({0, 2, 2})->is_air());
}

TEST(BoxTest, SolidBox) {
    Box box;
    box.corner2 = {1, 2, 3};

    EXPECT_EQ(2u * 3u * 4u, rasterize(box).size());
}

TEST(WallsTest, PerimeterWithCornerPosts) {
    Walls walls;
    walls.corner1 = {0, 0, 0};
    walls.corner2 = {4, 2, 4};
    walls.corner = world::Material{"oak_log"};

    const world::VoxelSet v = rasterize(walls);

    EXPECT_EQ(3u * 16u, v.size());
    EXPECT_EQ(3u * 4u, count_named(v, "oak_log"));
    EXPECT_FALSE(v.contains({2, 1, 2}));
    EXPECT_EQ("oak_log", v.find({4, 1, 0})->name);
    EXPECT_EQ("oak_planks", v.find({2, 1, 0})->name);
}

TEST(FloorTest, Checkerboard) {
    Floor floor;
    floor.y = 5;
    floor.corner1 = {0, 0};
    floor.corner2 = {3, 3};
    floor.material = world::Material{"white_concrete"};
    floor.checkerboard = world::Material{"black_concrete"};

    const world::VoxelSet v = rasterize(floor);

    EXPECT_EQ(16u, v.size());
    EXPECT_EQ(8u, count_named(v, "black_concrete"));
    EXPECT_EQ("white_concrete", v.find({0, 5, 0})->name);
    EXPECT_EQ("black_concrete", v.find({1, 5, 0})->name);
    EXPECT_EQ("black_concrete", v.find({0, 5, 1})->name);
}

TEST(DoorTest, TwoHalves) {
    const world::VoxelSet v = rasterize(Door{{1, 2, 3}, "spruce", "north", "right"});

    ASSERT_EQ(2u, v.size());
    const world::Material* lower = v.find({1, 2, 3});
    const world::Material* upper = v.find({1, 3, 3});
    ASSERT_NE(nullptr, lower);
    ASSERT_NE(nullptr, upper);
    EXPECT_EQ("spruce_door", lower->name);
    EXPECT_EQ("lower", lower->properties.at("half"));
    EXPECT_EQ("upper", upper->properties.at("half"));
    EXPECT_EQ("north", upper->properties.at("facing"));
    EXPECT_EQ("right", upper->properties.at("hinge"));
    EXPECT_EQ("false", upper->properties.at("open"));
}

TEST(WindowsTest, PanesAtSpacingAlongAllFourWalls) {
    Windows windows;
    windows.corner1 = {0, 0, 0};
    windows.corner2 = {6, 1, 4};

    const world::VoxelSet v = rasterize(windows);

    EXPECT_EQ(8u, v.size());
    EXPECT_EQ(8u, count_named(v, "glass_pane"));
    for (int32_t y : {0, 1}) {
        EXPECT_TRUE(v.contains({3, y, 0}));
        EXPECT_TRUE(v.contains({3, y, 4}));
        EXPECT_TRUE(v.contains({0, y, 3}));
        EXPECT_TRUE(v.contains({6, y, 3}));
    }
    EXPECT_FALSE(v.contains({0, 0, 0}));
}

TEST(BedTest, HeadLiesInFacingDirection) {
    const world::VoxelSet v = rasterize(Bed{{2, 1, 2}, "north", "blue"});

    ASSERT_EQ(2u, v.size());
    const world::Material* foot = v.find({2, 1, 2});
    const world::Material* head = v.find({2, 1, 1});
    ASSERT_NE(nullptr, foot);
    ASSERT_NE(nullptr, head);
    EXPECT_EQ("blue_bed", foot->name);
    EXPECT_EQ("foot", foot->properties.at("part"));
    EXPECT_EQ("head", head->properties.at("part"));
    EXPECT_EQ("north", head->properties.at("facing"));
    EXPECT_EQ("false", head->properties.at("occupied"));
}

// =============================================================================
// Validation and bounds
// =============================================================================

TEST(ShapeValidationTest, RejectsBadParameters) {
    EXPECT_THROW(rasterize(Circle{{0, 0, 0}, -1.0, true}), core::InvalidShapeParams);

    Cylinder cyl;
    cyl.y0 = 5;
    cyl.y1 = 4;
    EXPECT_THROW(rasterize(cyl), core::InvalidShapeParams);

    Cone cone;
    cone.height = -2;
    EXPECT_THROW(rasterize(cone), core::InvalidShapeParams);

    Arch vertical;
    vertical.axis = Axis::Y;
    EXPECT_THROW(rasterize(vertical), core::InvalidShapeParams);

    Arch thin;
    thin.thickness = 0;
    EXPECT_THROW(rasterize(thin), core::InvalidShapeParams);

    PitchedRoof roof;
    roof.span = 0;
    EXPECT_THROW(rasterize(roof), core::InvalidShapeParams);

    EXPECT_THROW(rasterize(Door{{0, 0, 0}, "oak", "up", "left"}), core::InvalidShapeParams);

    Windows windows;
    windows.spacing = 0;
    EXPECT_THROW(rasterize(windows), core::InvalidShapeParams);
    EXPECT_THROW(rasterize(Bed{{0, 0, 0}, "up", "red"}), core::InvalidShapeParams);
}

TEST(ShapeValidationTest, RejectsHugeRadius) {
    EXPECT_THROW(rasterize(Circle{{0, 0, 0}, 1e10, true}), core::InvalidShapeParams);
    EXPECT_THROW(shape_bounds(Cylinder{{0, 0}, 0, 1, 1e10, false}), core::InvalidShapeParams);
    EXPECT_NO_THROW(validate(Cone{{0, 0, 0}, 3, kMaxRadius, true}));
}

TEST(ShapeValidationTest, ParseAxis) {
    EXPECT_EQ(Axis::X, parse_axis("x"));
    EXPECT_EQ(Axis::Z, parse_axis("Z"));
    EXPECT_THROW(parse_axis("w"), core::InvalidShapeParams);
    EXPECT_THROW(parse_axis("xz"), core::InvalidShapeParams);
}

TEST(ShapeBoundsTest, EveryVoxelInsideBounds) {
    Arch arch;
    arch.axis = Axis::X;
    arch.depth = 3;
    arch.span = 7;
    arch.height = 5;

    PitchedRoof roof;
    roof.span = 7;

    Cone cone;
    cone.height = 6;
    cone.radius = 3.7;

    const std::vector<ShapeDescriptor> shapes{
        Circle{{5, 5, 5}, 4.4, false},
        Cylinder{{1, -1}, 0, 3, 2.5, true},
        cone,
        arch,
        roof,
        Box{{0, 0, 0}, {3, -3, 3}, true, true},
        Walls{{0, 0, 0}, {2, 2, 6}},
        Floor{3, {-2, -2}, {2, 2}},
        Door{{0, 0, 0}},
        Windows{{0, 0, 0}, {7, 2, -5}, 2},
        Bed{{0, 0, 0}, "west"},
    };

    for (const ShapeDescriptor& shape : shapes) {
        const Box3 b = shape_bounds(shape);
        const world::VoxelSet v = rasterize(shape);
        EXPECT_FALSE(v.empty()) << shape_name(shape);
        for (const auto& [c, m] : v) {
            EXPECT_TRUE(b.contains(c)) << shape_name(shape) << " voxel outside bounds";
        }
    }
}

// =============================================================================
// Presets
// =============================================================================

TEST(SimpleHouseTest, ComposesBuildingParts) {
    const core::Coordinate origin{100, 64, -20};
    const world::VoxelSet house = simple_house(origin);

    EXPECT_EQ("cobblestone", house.find({100, 63, -20})->name);
    EXPECT_EQ("oak_log", house.find({100, 65, -20})->name);
    EXPECT_EQ("oak_log", house.find({106, 68, -14})->name);
    EXPECT_EQ("oak_slab", house.find({103, 69, -17})->name);
    EXPECT_EQ(49u, count_named(house, "oak_slab"));

    const world::Material* door = house.find({100, 65, -17});
    ASSERT_NE(nullptr, door);
    EXPECT_EQ("oak_door", door->name);
    EXPECT_EQ("west", door->properties.at("facing"));
    EXPECT_EQ("glass_pane", house.find({100, 66, -16})->name);
    EXPECT_TRUE(house.find({102, 67, -17})->is_air());
    EXPECT_EQ("glowstone", house.find({103, 68, -17})->name);
}

TEST(SimpleHouseTest, UnfurnishedHasNoFurniture) {
    HouseOptions options;
    options.furnished = false;
    const world::VoxelSet house = simple_house({0, 0, 0}, options);

    EXPECT_EQ(0u, count_named(house, "chest"));
    EXPECT_EQ(0u, count_named(house, "red_bed"));
    EXPECT_EQ("oak_stairs", house.find({-1, 0, 3})->name);
}

TEST(SimpleHouseTest, RejectsTinyFootprint) {
    HouseOptions options;
    options.width = 3;
    EXPECT_THROW(simple_house({0, 0, 0}, options), core::InvalidShapeParams);
}

TEST(SimpleHouseTest, BedFromBedShape) {
    const world::VoxelSet house = simple_house({0, 0, 0});

    EXPECT_EQ("foot", house.find({1, 1, 5})->properties.at("part"));
    EXPECT_EQ("head", house.find({2, 1, 5})->properties.at("part"));
}

TEST(SkyscraperTest, FloorsCurtainWallAndRoof) {
    const world::VoxelSet tower = skyscraper({0, 64, 0});

    EXPECT_EQ("deepslate_bricks", tower.find({-1, 61, -1})->name);
    EXPECT_EQ("iron_block", tower.find({0, 65, 0})->name);

    // Ground floor curtain wall: mullion every 4 blocks, first tint.
    EXPECT_EQ("light_blue_stained_glass", tower.find({0, 66, 1})->name);
    EXPECT_EQ("iron_block", tower.find({0, 66, 4})->name);
    EXPECT_EQ("smooth_stone", tower.find({0, 68, 1})->name);
    // Second floor cycles the tint.
    EXPECT_EQ("white_stained_glass", tower.find({1, 70, 0})->name);

    EXPECT_EQ("polished_diorite", tower.find({1, 64, 1})->name);
    EXPECT_EQ("polished_andesite", tower.find({2, 64, 1})->name);
    EXPECT_TRUE(tower.find({5, 66, 5})->is_air());
    EXPECT_EQ("sea_lantern", tower.find({3, 68, 3})->name);

    // Entrance on the west wall.
    EXPECT_TRUE(tower.find({0, 65, 7})->is_air());
    EXPECT_EQ("polished_blackstone", tower.find({0, 64, 7})->name);
    EXPECT_EQ("quartz_pillar", tower.find({-1, 64, 4})->name);
    EXPECT_EQ("polished_blackstone_stairs", tower.find({-1, 64, 7})->name);
    EXPECT_EQ("east", tower.find({-1, 64, 7})->properties.at("facing"));

    // Roof at 64 + 12 * 5.
    EXPECT_EQ("smooth_stone_slab", tower.find({-1, 124, -1})->name);
    EXPECT_EQ("stone_brick_wall", tower.find({0, 125, 0})->name);
    EXPECT_EQ("iron_block", tower.find({7, 131, 7})->name);
    EXPECT_EQ("lightning_rod", tower.find({7, 133, 7})->name);
    EXPECT_EQ(12u * 4u + 3u, count_named(tower, "sea_lantern"));
}

TEST(SkyscraperTest, RejectsNarrowFootprint) {
    SkyscraperOptions options;
    options.width = 7;
    EXPECT_THROW(skyscraper({0, 0, 0}, options), core::InvalidShapeParams);

    options.width = 15;
    options.floor_height = 2;
    EXPECT_THROW(skyscraper({0, 0, 0}, options), core::InvalidShapeParams);
}
