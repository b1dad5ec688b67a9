#pragma once

#include "strata/engine_config.hpp"
#include "strata/io/template.hpp"
#include "strata/nav/path_planner.hpp"
#include "strata/shape/shapes.hpp"
#include "strata/terrain/height_map.hpp"
#include "strata/world/block_classifier.hpp"
#include "strata/world/block_store.hpp"
#include "strata/world/edit.hpp"
#include "strata/world/name_resolver.hpp"
#include "strata/world/voxel_set.hpp"

#include <functional>
#include <optional>
#include <utility>

namespace strata {

// Entry point tying the engine to one block store. Planning operations
// return complete VoxelSets or Paths without touching the store; only
// place() and place_template() write.
class Terraformer {
public:
    Terraformer(world::IBlockStore& store,
                const world::IBlockClassifier& classifier,
                const world::INameResolver& resolver,
                EngineConfig cfg = {});

    [[nodiscard]] const EngineConfig& config() const noexcept { return cfg_; }

    // Called every place_flush_interval placed voxels, e.g. to save a session.
    void set_flush(std::function<void()> flush) { flush_ = std::move(flush); }

    terrain::HeightMap scan(const core::Coordinate2D& center, int32_t radius, terrain::ScanMode mode) const;

    // Levels the ground (vegetation ignored) of `rect` to `target_y` with a
    // blend band `blend_radius` wide.
    world::VoxelSet flatten(const core::Rect& rect, int32_t target_y, int32_t blend_radius) const;

    // Air for the vegetation between ground and surface in `rect`.
    world::VoxelSet clear_vegetation(const core::Rect& rect) const;

    // Ground-level route scanned over the endpoints' bounding box plus
    // EngineConfig::path_margin.
    nav::Path plan(const core::Coordinate2D& start, const core::Coordinate2D& end, int32_t width = 1) const;

    // Rasterizes with every material name passed through the resolver.
    world::VoxelSet rasterize(const shape::ShapeDescriptor& shape) const;

    world::EditStats place(const world::VoxelSet& voxels, bool only_replace_air = false);

    // Blocks inside `box` relative to `origin`; air is skipped unless asked for.
    io::Template capture_template(const shape::Box3& box,
                                  const core::Coordinate& origin,
                                  bool include_air = false) const;

    // Rotation is applied before mirroring.
    world::EditStats place_template(const io::Template& tpl,
                                    const core::Coordinate& origin,
                                    int rotation_degrees = 0,
                                    std::optional<shape::Axis> mirror = std::nullopt);

private:
    [[nodiscard]] const world::Dimension& dimension() const noexcept { return cfg_.scan.dimension; }
    world::VoxelSet resolved(const world::VoxelSet& voxels) const;

    world::IBlockStore& store_;
    const world::IBlockClassifier& classifier_;
    const world::INameResolver& resolver_;
    EngineConfig cfg_;
    std::function<void()> flush_;
};

} // namespace strata
