/**
 * @file test_path_planner.cpp
 * @brief A* routing, widening and failure modes
 */

#include <gtest/gtest.h>

#include "strata/core/errors.hpp"
#include "strata/nav/obstacle_grid.hpp"
#include "strata/nav/path_planner.hpp"

#include "test_helpers.hpp"

#include <cmath>
#include <algorithm>
#include <cstdlib>
#include <functional>
#include <set>
#include <stdexcept>

using namespace strata;
using namespace strata::test;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;

class PathPlannerTest : public ::testing::Test {
protected:
    // Flat 20x20 field at y = 10 with structures where `blocked` says so.
    void build(const std::function<bool(int32_t, int32_t)>& blocked,
               const std::function<int32_t(int32_t, int32_t)>& height = [](int32_t, int32_t) { return 10; })
    {
        map = make_height_map(rect, height);
        ON_CALL(classifier, classify(_)).WillByDefault(Invoke([blocked](const core::Coordinate& c) {
            return blocked(c.x, c.z) ? world::Classification::Structure : world::Classification::Open;
        }));
        grid = nav::ObstacleGrid::build(map, classifier);
    }

    static void expect_connected(const std::vector<core::Coordinate>& line) {
        for (std::size_t i = 1; i < line.size(); ++i) {
            EXPECT_LE(std::abs(line[i].x - line[i - 1].x), 1);
            EXPECT_LE(std::abs(line[i].z - line[i - 1].z), 1);
            EXPECT_FALSE(line[i].x == line[i - 1].x && line[i].z == line[i - 1].z);
        }
    }

    core::Rect rect{0, 0, 19, 19};
    NiceMock<MockClassifier> classifier;
    terrain::HeightMap map;
    nav::ObstacleGrid grid;
};

TEST_F(PathPlannerTest, StraightLineOnOpenField) {
    build([](int32_t, int32_t) { return false; });

    const nav::Path path = nav::plan_path({2, 5}, {12, 5}, grid, map);

    ASSERT_EQ(11u, path.centerline.size());
    EXPECT_DOUBLE_EQ(10.0, path.cost);
    EXPECT_EQ((core::Coordinate{2, 11, 5}), path.centerline.front());
    EXPECT_EQ((core::Coordinate{12, 11, 5}), path.centerline.back());
    EXPECT_EQ(path.centerline, path.cells);
}

TEST_F(PathPlannerTest, DiagonalCostsRootTwo) {
    build([](int32_t, int32_t) { return false; });

    const nav::Path path = nav::plan_path({0, 0}, {5, 5}, grid, map);

    EXPECT_EQ(6u, path.centerline.size());
    EXPECT_NEAR(5.0 * std::sqrt(2.0), path.cost, 1e-9);
    EXPECT_NEAR(path.cost, nav::horizontal_length(path.centerline), 1e-9);
}

TEST_F(PathPlannerTest, RoutesAroundObstacles) {
    // Wall at x = 8 with a gap at z = 17.
    build([](int32_t x, int32_t z) { return x == 8 && z != 17; });

    const nav::Path path = nav::plan_path({2, 2}, {15, 2}, grid, map);

    expect_connected(path.centerline);
    std::set<std::pair<int32_t, int32_t>> seen;
    for (const auto& c : path.centerline) {
        EXPECT_TRUE(grid.passable({c.x, c.z}));
        EXPECT_TRUE(seen.insert({c.x, c.z}).second) << "column revisited";
    }
    EXPECT_GT(path.cost, 13.0);
}

TEST_F(PathPlannerTest, SeparatingWallRaisesNoPathFound) {
    build([](int32_t x, int32_t) { return x == 8; });

    EXPECT_THROW(nav::plan_path({2, 2}, {15, 2}, grid, map), core::NoPathFound);
}

TEST_F(PathPlannerTest, ImpassableGoalRaisesNoPathFound) {
    build([](int32_t x, int32_t z) { return x == 15 && z == 2; });

    EXPECT_THROW(nav::plan_path({2, 2}, {15, 2}, grid, map), core::NoPathFound);
}

TEST_F(PathPlannerTest, EndpointOutsideGridRaisesOutOfBounds) {
    build([](int32_t, int32_t) { return false; });

    EXPECT_THROW(nav::plan_path({-1, 2}, {15, 2}, grid, map), core::OutOfBounds);
    EXPECT_THROW(nav::plan_path({2, 2}, {15, 20}, grid, map), core::OutOfBounds);
}

TEST_F(PathPlannerTest, RejectsBadArguments) {
    build([](int32_t, int32_t) { return false; });

    EXPECT_THROW(nav::plan_path({2, 2}, {5, 2}, grid, map, 0), std::invalid_argument);

    const terrain::HeightMap other = make_height_map(core::Rect{0, 0, 9, 9}, [](int32_t, int32_t) { return 10; });
    EXPECT_THROW(nav::plan_path({2, 2}, {5, 2}, grid, other), std::invalid_argument);
}

TEST_F(PathPlannerTest, NoCornerCutting) {
    // Diagonal (4,4)->(5,5) would squeeze between blocked (5,4) and (4,5).
    build([](int32_t x, int32_t z) { return (x == 5 && z == 4) || (x == 4 && z == 5); });

    const nav::Path path = nav::plan_path({4, 4}, {5, 5}, grid, map);

    EXPECT_GT(path.centerline.size(), 2u);
    expect_connected(path.centerline);
}

TEST_F(PathPlannerTest, ElevationPenaltyPrefersFlatDetour) {
    // Ridge of height 13 across z = 0..15 at x = 10; flat beyond z = 15.
    build([](int32_t, int32_t) { return false; },
          [](int32_t x, int32_t z) { return x == 10 && z <= 15 ? 11 : 10; });

    nav::PathConfig cfg;
    cfg.elevation_penalty = 50.0;
    const nav::Path path = nav::plan_path({5, 2}, {15, 2}, grid, map, 1, cfg);

    for (const auto& c : path.centerline) {
        EXPECT_EQ(11, c.y) << "path climbed at " << c.x << "," << c.z;
    }
}

TEST_F(PathPlannerTest, DeterministicForIdenticalInputs) {
    build([](int32_t x, int32_t z) { return x == 9 && z > 3 && z < 16; });

    const nav::Path a = nav::plan_path({1, 10}, {18, 10}, grid, map, 3);
    const nav::Path b = nav::plan_path({1, 10}, {18, 10}, grid, map, 3);

    EXPECT_EQ(a.centerline, b.centerline);
    EXPECT_EQ(a.cells, b.cells);
}

TEST_F(PathPlannerTest, WidthThreeAddsLateralNeighbours) {
    build([](int32_t, int32_t) { return false; });

    const nav::Path path = nav::plan_path({2, 10}, {12, 10}, grid, map, 3);

    std::set<std::pair<int32_t, int32_t>> columns;
    for (const auto& c : path.cells) {
        EXPECT_TRUE(columns.insert({c.x, c.z}).second);
    }
    for (const auto& c : path.centerline) {
        EXPECT_TRUE(columns.count({c.x, c.z - 1}));
        EXPECT_TRUE(columns.count({c.x, c.z + 1}));
    }
    EXPECT_EQ(3u * path.centerline.size(), path.cells.size());
}

TEST_F(PathPlannerTest, WideningTruncatesAtBoundary) {
    build([](int32_t, int32_t) { return false; });

    const nav::Path path = nav::plan_path({2, 0}, {12, 0}, grid, map, 5);

    for (const auto& c : path.cells) {
        EXPECT_TRUE(rect.contains(core::Coordinate2D{c.x, c.z}));
    }
    EXPECT_EQ(3u * path.centerline.size(), path.cells.size());
}

TEST(WidenTest, UsesCenterlineElevationAndPerpendicular) {
    const std::vector<core::Coordinate> line{{0, 7, 0}, {1, 8, 1}};
    const auto cells = nav::widen(line, core::Rect{-5, -5, 5, 5}, 3);

    // Diagonal direction (1, 1); perpendicular (-1, 1) plus the orthogonal
    // cells between.
    EXPECT_EQ(12u, cells.size());
    EXPECT_NE(std::find(cells.begin(), cells.end(), core::Coordinate{-1, 7, 1}), cells.end());
    EXPECT_NE(std::find(cells.begin(), cells.end(), core::Coordinate{1, 7, -1}), cells.end());
    EXPECT_NE(std::find(cells.begin(), cells.end(), core::Coordinate{0, 7, 1}), cells.end());
    EXPECT_NE(std::find(cells.begin(), cells.end(), core::Coordinate{0, 8, 2}), cells.end());
    EXPECT_NE(std::find(cells.begin(), cells.end(), core::Coordinate{2, 8, 1}), cells.end());
}

TEST(WidenTest, DiagonalRoadHasNoHoles) {
    std::vector<core::Coordinate> line;
    for (int32_t i = 0; i < 10; ++i) {
        line.push_back({i, 4, i});
    }
    const auto cells = nav::widen(line, core::Rect{-5, -5, 15, 15}, 3);

    std::set<core::Coordinate2D> covered;
    for (const auto& c : cells) {
        covered.insert({c.x, c.z});
    }
    for (int32_t x = 2; x <= 7; ++x) {
        for (int32_t z = x - 2; z <= x + 2; ++z) {
            EXPECT_TRUE(covered.count({x, z})) << "hole at (" << x << ", " << z << ")";
        }
    }
}

TEST(WidenTest, SinglePointWidensAlongX) {
    const auto cells = nav::widen({{3, 1, 3}}, core::Rect{0, 0, 9, 9}, 3);

    ASSERT_EQ(3u, cells.size());
    EXPECT_EQ((core::Coordinate{3, 1, 3}), cells[0]);
    EXPECT_EQ((core::Coordinate{4, 1, 3}), cells[1]);
    EXPECT_EQ((core::Coordinate{2, 1, 3}), cells[2]);
}
