#pragma once

#include "strata/core/coords.hpp"
#include "strata/shape/shapes.hpp"
#include "strata/world/voxel_set.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace strata::io {

// A reusable block arrangement stored relative to its own origin.
class Template {
public:
    Template() = default;
    explicit Template(world::VoxelSet relative);

    // Re-expresses absolute voxels relative to `origin`.
    static Template from_voxel_set(const world::VoxelSet& voxels, const core::Coordinate& origin);

    // Absolute voxels with the template origin placed at `origin`.
    [[nodiscard]] world::VoxelSet to_voxel_set(const core::Coordinate& origin) const;

    // Quarter turns about the vertical axis through the origin, (x, z) -> (-z, x)
    // per 90 degrees. Accepts any multiple of 90, negative included; other
    // angles throw std::invalid_argument. Block properties are not rotated.
    [[nodiscard]] Template rotated(int degrees) const;

    // Negates the coordinate along `axis`.
    [[nodiscard]] Template mirrored(shape::Axis axis) const;

    [[nodiscard]] const world::VoxelSet& voxels() const noexcept { return voxels_; }
    [[nodiscard]] std::size_t size() const noexcept { return voxels_.size(); }
    [[nodiscard]] bool empty() const noexcept { return voxels_.empty(); }

    friend bool operator==(const Template& a, const Template& b) { return a.voxels_ == b.voxels_; }
    friend bool operator!=(const Template& a, const Template& b) { return !(a == b); }

private:
    world::VoxelSet voxels_;
};

// YAML document:
//
//   version: 1
//   palette:
//     - name: oak_stairs
//       properties: {facing: east}
//   blocks:
//     - [x, y, z, palette_index]
std::string to_yaml(const Template& tpl);

// Throws core::TemplateFormatError on malformed or inconsistent documents.
Template template_from_yaml(std::string_view text);

// Throws core::Error if the file cannot be written.
void save_template(const Template& tpl, const std::filesystem::path& file);

// Throws core::TemplateFormatError if the file is missing or malformed.
Template load_template(const std::filesystem::path& file);

} // namespace strata::io
