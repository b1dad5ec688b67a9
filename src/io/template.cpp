#include "strata/io/template.hpp"

#include "strata/core/errors.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace strata::io {

namespace {

constexpr int kTemplateVersion = 1;

template <typename Transform>
Template transform_coords(const world::VoxelSet& voxels, Transform&& f) {
    world::VoxelSet out;
    for (const auto& [coord, material] : voxels) {
        out.put(f(coord), material);
    }
    return Template(std::move(out));
}

[[noreturn]] void bad_template(const std::string& what) {
    throw core::TemplateFormatError("template: " + what);
}

world::Material parse_palette_entry(const YAML::Node& node, std::size_t index) {
    if (!node.IsMap()) {
        bad_template("palette entry " + std::to_string(index) + " is not a mapping");
    }
    const YAML::Node name = node["name"];
    if (!name || !name.IsScalar() || name.Scalar().empty()) {
        bad_template("palette entry " + std::to_string(index) + " has no name");
    }

    world::Material material{name.Scalar()};
    if (const YAML::Node props = node["properties"]) {
        if (!props.IsMap()) {
            bad_template("properties of palette entry " + std::to_string(index) + " are not a mapping");
        }
        for (const auto& kv : props) {
            material.properties[kv.first.as<std::string>()] = kv.second.as<std::string>();
        }
    }
    return material;
}

Template parse_document(const YAML::Node& root) {
    if (!root.IsMap()) {
        bad_template("document is not a mapping");
    }
    if (!root["version"] || root["version"].as<int>() != kTemplateVersion) {
        bad_template("unsupported version");
    }

    const YAML::Node palette_node = root["palette"];
    const YAML::Node blocks_node = root["blocks"];
    if (!palette_node || !palette_node.IsSequence()) {
        bad_template("missing palette sequence");
    }
    if (!blocks_node || !blocks_node.IsSequence()) {
        bad_template("missing blocks sequence");
    }

    std::vector<world::Material> palette;
    palette.reserve(palette_node.size());
    for (std::size_t i = 0; i < palette_node.size(); ++i) {
        palette.push_back(parse_palette_entry(palette_node[i], i));
    }

    world::VoxelSet voxels;
    for (std::size_t i = 0; i < blocks_node.size(); ++i) {
        const YAML::Node entry = blocks_node[i];
        if (!entry.IsSequence() || entry.size() != 4) {
            bad_template("block " + std::to_string(i) + " is not [x, y, z, palette_index]");
        }
        const core::Coordinate c{entry[0].as<int32_t>(), entry[1].as<int32_t>(), entry[2].as<int32_t>()};
        const auto idx = entry[3].as<int64_t>();
        if (idx < 0 || static_cast<std::size_t>(idx) >= palette.size()) {
            bad_template("block " + std::to_string(i) + " references palette index " + std::to_string(idx) +
                         " of " + std::to_string(palette.size()));
        }
        if (voxels.contains(c)) {
            bad_template("duplicate block at (" + std::to_string(c.x) + ", " + std::to_string(c.y) + ", " +
                         std::to_string(c.z) + ")");
        }
        voxels.put(c, palette[static_cast<std::size_t>(idx)]);
    }
    return Template(std::move(voxels));
}

} // namespace

Template::Template(world::VoxelSet relative)
    : voxels_(std::move(relative))
{}

Template Template::from_voxel_set(const world::VoxelSet& voxels, const core::Coordinate& origin) {
    return transform_coords(voxels, [&origin](const core::Coordinate& c) {
        return core::Coordinate{c.x - origin.x, c.y - origin.y, c.z - origin.z};
    });
}

world::VoxelSet Template::to_voxel_set(const core::Coordinate& origin) const {
    world::VoxelSet out;
    for (const auto& [c, material] : voxels_) {
        out.put({c.x + origin.x, c.y + origin.y, c.z + origin.z}, material);
    }
    return out;
}

Template Template::rotated(int degrees) const {
    if (degrees % 90 != 0) {
        throw std::invalid_argument("template rotation must be a multiple of 90 degrees, got " +
                                    std::to_string(degrees));
    }
    const int turns = ((degrees / 90) % 4 + 4) % 4;
    return transform_coords(voxels_, [turns](core::Coordinate c) {
        for (int i = 0; i < turns; ++i) {
            c = {-c.z, c.y, c.x};
        }
        return c;
    });
}

Template Template::mirrored(shape::Axis axis) const {
    return transform_coords(voxels_, [axis](core::Coordinate c) {
        switch (axis) {
        case shape::Axis::X: c.x = -c.x; break;
        case shape::Axis::Y: c.y = -c.y; break;
        case shape::Axis::Z: c.z = -c.z; break;
        }
        return c;
    });
}

std::string to_yaml(const Template& tpl) {
    // Palette in first-use order so identical templates serialize identically.
    std::map<world::Material, std::size_t> lookup;
    std::vector<const world::Material*> palette;
    std::vector<std::pair<core::Coordinate, std::size_t>> blocks;
    blocks.reserve(tpl.size());
    for (const auto& [coord, material] : tpl.voxels()) {
        const auto [it, inserted] = lookup.emplace(material, palette.size());
        if (inserted) {
            palette.push_back(&material);
        }
        blocks.emplace_back(coord, it->second);
    }

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "version" << YAML::Value << kTemplateVersion;

    out << YAML::Key << "palette" << YAML::Value << YAML::BeginSeq;
    for (const world::Material* m : palette) {
        out << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << m->name;
        if (!m->properties.empty()) {
            out << YAML::Key << "properties" << YAML::Value << YAML::Flow << YAML::BeginMap;
            for (const auto& [key, value] : m->properties) {
                out << YAML::Key << key << YAML::Value << value;
            }
            out << YAML::EndMap;
        }
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "blocks" << YAML::Value << YAML::BeginSeq;
    for (const auto& [c, idx] : blocks) {
        out << YAML::Flow << YAML::BeginSeq << c.x << c.y << c.z << idx << YAML::EndSeq;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    return std::string(out.c_str()) + "\n";
}

Template template_from_yaml(std::string_view text) {
    try {
        return parse_document(YAML::Load(std::string(text)));
    } catch (const YAML::Exception& e) {
        throw core::TemplateFormatError(std::string("template: ") + e.what());
    }
}

void save_template(const Template& tpl, const std::filesystem::path& file) {
    std::ofstream stream(file, std::ios::trunc);
    stream << to_yaml(tpl);
    if (!stream) {
        throw core::Error("cannot write template " + file.string());
    }
}

Template load_template(const std::filesystem::path& file) {
    try {
        return parse_document(YAML::LoadFile(file.string()));
    } catch (const YAML::Exception& e) {
        throw core::TemplateFormatError("template " + file.string() + ": " + e.what());
    }
}

} // namespace strata::io
