#include "strata/io/config_file.hpp"

#include "strata/core/errors.hpp"
#include "strata/world/material.hpp"

#include <yaml-cpp/yaml.h>

#include <stdexcept>
#include <string>

namespace strata::io {

namespace {

template <typename T>
void overlay(const YAML::Node& section, const char* section_name, const char* key, T& value) {
    const YAML::Node node = section[key];
    if (!node) {
        return;
    }
    try {
        value = node.as<T>();
    } catch (const YAML::Exception&) {
        throw std::invalid_argument(std::string("config: ") + section_name + "." + key + " has the wrong type");
    }
}

world::Material parse_material(const YAML::Node& node, const std::string& key) {
    if (!node.IsScalar()) {
        throw std::invalid_argument("config: " + key + " must be a block string");
    }
    return world::parse_block_string(node.Scalar());
}

YAML::Node section(const YAML::Node& root, const char* name) {
    const YAML::Node node = root[name];
    if (node && !node.IsMap()) {
        throw std::invalid_argument(std::string("config: ") + name + " must be a mapping");
    }
    return node;
}

EngineConfig from_node(const YAML::Node& root) {
    EngineConfig cfg;
    if (!root || root.IsNull()) {
        return cfg;
    }
    if (!root.IsMap()) {
        throw std::invalid_argument("config: document must be a mapping");
    }

    overlay(root, "root", "verbose", cfg.verbose);

    if (const YAML::Node scan = section(root, "scan")) {
        overlay(scan, "scan", "dimension", cfg.scan.dimension);
        overlay(scan, "scan", "probe_top", cfg.scan.probe_top);
        overlay(scan, "scan", "probe_bottom", cfg.scan.probe_bottom);
    }
    if (const YAML::Node obstacles = section(root, "obstacles")) {
        overlay(obstacles, "obstacles", "max_step", cfg.obstacles.max_step);
    }
    if (const YAML::Node path = section(root, "path")) {
        overlay(path, "path", "elevation_penalty", cfg.path.elevation_penalty);
        overlay(path, "path", "clearance", cfg.path.clearance);
        overlay(path, "path", "margin", cfg.path_margin);
    }
    if (const YAML::Node flatten = section(root, "flatten")) {
        if (const YAML::Node fill = flatten["fill"]) {
            cfg.flatten.fill = parse_material(fill, "flatten.fill");
        }
        if (const YAML::Node surface = flatten["surface"]) {
            cfg.flatten.surface = parse_material(surface, "flatten.surface");
        }
    }
    if (const YAML::Node place = section(root, "place")) {
        overlay(place, "place", "flush_interval", cfg.place_flush_interval);
    }

    if (cfg.scan.probe_bottom > cfg.scan.probe_top) {
        throw std::invalid_argument("config: scan.probe_bottom is above scan.probe_top");
    }
    if (cfg.path_margin < 0) {
        throw std::invalid_argument("config: path.margin must not be negative");
    }
    return cfg;
}

} // namespace

EngineConfig engine_config_from_yaml(std::string_view text) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(text));
    } catch (const YAML::Exception& e) {
        throw std::invalid_argument(std::string("config: ") + e.what());
    }
    return from_node(root);
}

EngineConfig load_engine_config(const std::filesystem::path& file) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(file.string());
    } catch (const YAML::Exception& e) {
        throw core::LoadError("cannot read config " + file.string() + ": " + e.what());
    }
    return from_node(root);
}

} // namespace strata::io
