#include "strata/terraformer.hpp"

#include "strata/core/errors.hpp"
#include "strata/nav/obstacle_grid.hpp"
#include "strata/shape/rasterizer.hpp"
#include "strata/terrain/sculptor.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace strata {

namespace {

using Clock = std::chrono::steady_clock;

long long elapsed_ms(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
}

} // namespace

Terraformer::Terraformer(world::IBlockStore& store,
                         const world::IBlockClassifier& classifier,
                         const world::INameResolver& resolver,
                         EngineConfig cfg)
    : store_(store)
    , classifier_(classifier)
    , resolver_(resolver)
    , cfg_(std::move(cfg))
{}

terrain::HeightMap Terraformer::scan(const core::Coordinate2D& center,
                                     int32_t radius,
                                     terrain::ScanMode mode) const
{
    const auto start = Clock::now();
    terrain::HeightMap map = terrain::scan_height_map(store_, classifier_, center, radius, mode, cfg_.scan);
    if (cfg_.verbose) {
        std::cout << "[scan] " << map.size() << " column(s) around (" << center.x << ", " << center.z
                  << "), mode " << terrain::to_string(mode) << ", " << elapsed_ms(start) << " ms\n";
    }
    return map;
}

world::VoxelSet Terraformer::flatten(const core::Rect& rect, int32_t target_y, int32_t blend_radius) const {
    const auto start = Clock::now();
    if (blend_radius < 0) {
        throw std::invalid_argument("blend_radius must not be negative");
    }

    const core::Rect area = rect.expanded(blend_radius);
    const terrain::HeightMap ground =
        terrain::scan_height_map(store_, classifier_, area, terrain::ScanMode::Ground, cfg_.scan);

    terrain::FlattenOptions options = cfg_.flatten;
    options.fill = world::resolve(resolver_, options.fill);
    if (options.surface) {
        options.surface = world::resolve(resolver_, *options.surface);
    }

    world::VoxelSet ops = terrain::plan_flatten(ground, rect, target_y, blend_radius, options);
    if (cfg_.verbose) {
        std::cout << "[sculpt] flatten to y=" << target_y << " (blend " << blend_radius << "): "
                  << ops.size() << " voxel(s) planned in " << elapsed_ms(start) << " ms\n";
    }
    return ops;
}

world::VoxelSet Terraformer::clear_vegetation(const core::Rect& rect) const {
    const auto start = Clock::now();
    const terrain::HeightMap surface =
        terrain::scan_height_map(store_, classifier_, rect, terrain::ScanMode::Surface, cfg_.scan);
    const terrain::HeightMap ground =
        terrain::scan_height_map(store_, classifier_, rect, terrain::ScanMode::Ground, cfg_.scan);

    world::VoxelSet ops =
        terrain::plan_vegetation_clearing(store_, classifier_, surface, ground, rect, dimension());
    if (cfg_.verbose) {
        std::cout << "[sculpt] clear vegetation: " << ops.size() << " voxel(s) in "
                  << elapsed_ms(start) << " ms\n";
    }
    return ops;
}

nav::Path Terraformer::plan(const core::Coordinate2D& start, const core::Coordinate2D& end, int32_t width) const {
    const auto t0 = Clock::now();
    const core::Rect domain = core::Rect::spanning(start, end).expanded(cfg_.path_margin);

    const terrain::HeightMap ground =
        terrain::scan_height_map(store_, classifier_, domain, terrain::ScanMode::Ground, cfg_.scan);
    const nav::ObstacleGrid grid = nav::ObstacleGrid::build(ground, classifier_, cfg_.obstacles);

    try {
        nav::Path path = nav::plan_path(start, end, grid, ground, width, cfg_.path);
        if (cfg_.verbose) {
            std::cout << "[path] " << path.centerline.size() << " step(s), " << path.cells.size()
                      << " cell(s), cost " << path.cost << ", expanded " << path.expanded << " in "
                      << elapsed_ms(t0) << " ms\n";
        }
        return path;
    } catch (const core::NoPathFound& e) {
        if (cfg_.verbose) {
            std::cout << "[path] " << e.what() << " (" << grid.count(world::Classification::Open) << " of "
                      << grid.cells().size() << " cells open)\n";
        }
        throw;
    }
}

world::VoxelSet Terraformer::rasterize(const shape::ShapeDescriptor& shape) const {
    return resolved(shape::rasterize(shape));
}

world::EditStats Terraformer::place(const world::VoxelSet& voxels, bool only_replace_air) {
    const auto start = Clock::now();

    world::PlaceOptions options;
    options.flush_interval = flush_ ? cfg_.place_flush_interval : 0;
    options.flush = flush_;
    options.only_replace_air = only_replace_air;

    world::EditStats stats;
    world::apply_voxel_set(store_, dimension(), resolved(voxels), options, &stats);
    if (cfg_.verbose) {
        std::cout << "[place] " << stats.voxels_changed << " of " << stats.voxels_touched
                  << " voxel(s) changed, " << stats.flushes << " flush(es), " << elapsed_ms(start) << " ms\n";
    }
    return stats;
}

io::Template Terraformer::capture_template(const shape::Box3& box,
                                           const core::Coordinate& origin,
                                           bool include_air) const
{
    world::VoxelSet captured;
    for (int32_t y = box.min.y; y <= box.max.y; ++y) {
        for (int32_t z = box.min.z; z <= box.max.z; ++z) {
            for (int32_t x = box.min.x; x <= box.max.x; ++x) {
                const core::Coordinate c{x, y, z};
                world::Material m = store_.get(c, dimension());
                if (include_air || !m.is_air()) {
                    captured.put(c, std::move(m));
                }
            }
        }
    }
    if (cfg_.verbose) {
        std::cout << "[place] captured " << captured.size() << " block(s)\n";
    }
    return io::Template::from_voxel_set(captured, origin);
}

world::EditStats Terraformer::place_template(const io::Template& tpl,
                                             const core::Coordinate& origin,
                                             int rotation_degrees,
                                             std::optional<shape::Axis> mirror)
{
    io::Template oriented = tpl.rotated(rotation_degrees);
    if (mirror) {
        oriented = oriented.mirrored(*mirror);
    }
    return place(oriented.to_voxel_set(origin));
}

world::VoxelSet Terraformer::resolved(const world::VoxelSet& voxels) const {
    world::VoxelSet out;
    for (const auto& [coord, material] : voxels) {
        out.put(coord, world::resolve(resolver_, material));
    }
    return out;
}

} // namespace strata
