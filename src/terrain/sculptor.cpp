#include "strata/terrain/sculptor.hpp"

#include "strata/core/errors.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace strata::terrain {

namespace {

void require_coverage(const HeightMap& map, const core::Rect& needed, const char* what) {
    if (!needed.empty() && (map.empty() || !map.rect().contains(needed))) {
        throw core::OutOfBounds(std::string(what) + " does not cover the requested rectangle");
    }
}

// Clear (current, new] or fill (current, new] in one column.
void reshape_column(world::VoxelSet& out,
                    const core::Coordinate2D& column,
                    int32_t current_y,
                    int32_t new_y,
                    const FlattenOptions& options)
{
    if (current_y > new_y) {
        for (int32_t y = new_y + 1; y <= current_y; ++y) {
            out.put({column.x, y, column.z}, world::air());
        }
    } else if (current_y < new_y) {
        for (int32_t y = current_y + 1; y <= new_y; ++y) {
            out.put({column.x, y, column.z}, options.fill);
        }
    } else {
        return;
    }

    if (options.surface) {
        out.put({column.x, new_y, column.z}, *options.surface);
    }
}

} // namespace

int32_t blended_height(int32_t original_y, int32_t target_y, double distance, int32_t blend_radius) noexcept
{
    if (blend_radius <= 0 || distance >= blend_radius) {
        return original_y;
    }
    if (distance <= 0.0) {
        return target_y;
    }
    const double t = distance / static_cast<double>(blend_radius);
    const double h = target_y + (original_y - target_y) * t;
    return static_cast<int32_t>(original_y > target_y ? std::ceil(h) : std::floor(h));
}

world::VoxelSet plan_flatten(const HeightMap& map,
                             const core::Rect& rect,
                             int32_t target_y,
                             int32_t blend_radius,
                             const FlattenOptions& options)
{
    if (blend_radius < 0) {
        throw std::invalid_argument("blend_radius must not be negative");
    }

    world::VoxelSet out;
    if (rect.empty()) {
        return out;
    }

    const core::Rect area = rect.expanded(blend_radius);
    require_coverage(map, area, "height map");

    for (int32_t z = area.min_z; z <= area.max_z; ++z) {
        for (int32_t x = area.min_x; x <= area.max_x; ++x) {
            const core::Coordinate2D column{x, z};
            const int32_t current = map.at(column);
            const double d = core::distance_to_rect(column, rect);
            if (d > blend_radius) {
                continue;
            }
            const int32_t goal = d == 0.0 ? target_y : blended_height(current, target_y, d, blend_radius);
            reshape_column(out, column, current, goal, options);
        }
    }

    return out;
}

world::VoxelSet plan_vegetation_clearing(const world::IBlockStore& store,
                                         const world::IBlockClassifier& classifier,
                                         const HeightMap& surface,
                                         const HeightMap& ground,
                                         const core::Rect& rect,
                                         const world::Dimension& dimension)
{
    world::VoxelSet out;
    if (rect.empty()) {
        return out;
    }
    require_coverage(surface, rect, "surface map");
    require_coverage(ground, rect, "ground map");

    for (int32_t z = rect.min_z; z <= rect.max_z; ++z) {
        for (int32_t x = rect.min_x; x <= rect.max_x; ++x) {
            const core::Coordinate2D column{x, z};
            const int32_t top = surface.at(column);
            const int32_t floor_y = ground.at(column);
            for (int32_t y = floor_y + 1; y <= top; ++y) {
                const core::Coordinate c{x, y, z};
                if (classifier.is_vegetation(store.get(c, dimension))) {
                    out.put(c, world::air());
                }
            }
        }
    }
    return out;
}

} // namespace strata::terrain
