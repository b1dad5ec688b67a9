#include "strata/io/config_file.hpp"
#include "strata/io/template.hpp"
#include "strata/nav/obstacle_grid.hpp"
#include "strata/shape/presets.hpp"
#include "strata/terraformer.hpp"
#include "strata/world/block_classifier.hpp"
#include "strata/world/name_resolver.hpp"
#include "strata/world/session.hpp"
#include "strata/world/terrain.hpp"

#include <algorithm>
#include <cstdlib>
#include <exception>
#include <initializer_list>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void usage() {
    std::cerr << "usage: strata_cli <world_dir> <command> [args] [--config file.yaml]\n"
              << "  info    <x> <z> [radius]\n"
              << "  flatten <x> <z> <radius> <target_y> [blend]\n"
              << "  path    <x1> <z1> <x2> <z2> [width]\n"
              << "  house   <x> <y> <z>\n"
              << "  skyscraper <x> <y> <z> [floors]\n"
              << "  capture <x1> <y1> <z1> <x2> <y2> <z2> <file>\n"
              << "  paste   <file> <x> <y> <z> [rotation] [mirror_axis]\n";
}

// Positional arguments a command needs after the world directory and its name.
std::optional<std::size_t> required_args(const std::string& cmd) {
    if (cmd == "info") return 2;
    if (cmd == "flatten") return 4;
    if (cmd == "path") return 4;
    if (cmd == "house") return 3;
    if (cmd == "skyscraper") return 3;
    if (cmd == "capture") return 7;
    if (cmd == "paste") return 4;
    return std::nullopt;
}

int32_t arg_int(const std::vector<std::string>& args, std::size_t i) {
    try {
        return static_cast<int32_t>(std::stoi(args.at(i)));
    } catch (const std::invalid_argument&) {
        throw std::invalid_argument("argument '" + args.at(i) + "' is not an integer");
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("argument '" + args.at(i) + "' is out of range");
    }
}

int32_t arg_int_or(const std::vector<std::string>& args, std::size_t i, int32_t fallback) {
    return i < args.size() ? arg_int(args, i) : fallback;
}

// Makes the columns of `rect` plus a margin resident.
void load(strata::world::Session& session, const strata::EngineConfig& cfg, const strata::core::Rect& rect) {
    session.load_region(cfg.scan.dimension, rect.expanded(cfg.path_margin));
}

int run(const std::vector<std::string>& args, const std::optional<std::string>& config_path) {
    using namespace strata;

    const EngineConfig cfg = config_path ? io::load_engine_config(*config_path) : EngineConfig{};
    auto session = world::open_session(args.at(0), {}, world::terrain::TerrainParams{});
    world::World& w = session->world();

    world::CatalogClassifier classifier(w, cfg.scan.dimension);
    world::AliasNameResolver resolver;
    Terraformer tf(w, classifier, resolver, cfg);
    if (cfg.place_flush_interval > 0) {
        tf.set_flush([&session] { world::save(*session); });
    }

    const std::string& cmd = args.at(1);
    if (cmd == "info") {
        const core::Coordinate2D center{arg_int(args, 2), arg_int(args, 3)};
        const int32_t radius = arg_int_or(args, 4, 8);
        load(*session, cfg, core::Rect::around(center, radius));

        const terrain::HeightMap surface = tf.scan(center, radius, terrain::ScanMode::Surface);
        const terrain::HeightMap ground = tf.scan(center, radius, terrain::ScanMode::Ground);
        std::cout << "resident chunks: " << w.resident_chunk_count() << ", palette: " << w.palette_size() << "\n";
        if (const auto b = terrain::bounds(surface)) {
            std::cout << "surface y " << b->min_y << ".." << b->max_y << "\n";
        }
        if (const auto b = terrain::bounds(ground)) {
            std::cout << "ground y " << b->min_y << ".." << b->max_y << "\n";
        }
        long long total = 0;
        surface.for_each([&total](const core::Coordinate2D&, int32_t h) { total += h; });
        std::cout << "mean surface y " << (surface.empty() ? 0 : total / static_cast<long long>(surface.size())) << "\n";

        const nav::ObstacleGrid grid = nav::ObstacleGrid::build(ground, classifier, cfg.obstacles);
        for (const auto c : {world::Classification::Open, world::Classification::Structure,
                             world::Classification::Water, world::Classification::Steep}) {
            std::cout << world::to_string(c) << ": " << grid.count(c) << "\n";
        }
        std::cout << "top block at center: "
                  << world::to_block_string(w.get({center.x, surface.at(center), center.z}, cfg.scan.dimension))
                  << "\n";
    } else if (cmd == "flatten") {
        const core::Rect rect = core::Rect::around({arg_int(args, 2), arg_int(args, 3)}, arg_int(args, 4));
        const int32_t target_y = arg_int(args, 5);
        const int32_t blend = arg_int_or(args, 6, 0);
        load(*session, cfg, rect.expanded(blend));

        tf.place(tf.clear_vegetation(rect));
        tf.place(tf.flatten(rect, target_y, blend));
    } else if (cmd == "path") {
        const core::Coordinate2D start{arg_int(args, 2), arg_int(args, 3)};
        const core::Coordinate2D end{arg_int(args, 4), arg_int(args, 5)};
        load(*session, cfg, core::Rect::spanning(start, end));

        const nav::Path path = tf.plan(start, end, arg_int_or(args, 6, 1));
        world::VoxelSet road;
        for (const core::Coordinate& c : path.cells) {
            road.put({c.x, c.y - cfg.path.clearance, c.z}, world::Material{"dirt_path"});
        }
        tf.place(road);
    } else if (cmd == "house") {
        const core::Coordinate origin{arg_int(args, 2), arg_int(args, 3), arg_int(args, 4)};
        load(*session, cfg, core::Rect::around({origin.x, origin.z}, 8));
        tf.place(shape::simple_house(origin));
    } else if (cmd == "skyscraper") {
        const core::Coordinate origin{arg_int(args, 2), arg_int(args, 3), arg_int(args, 4)};
        shape::SkyscraperOptions options;
        options.floors = arg_int_or(args, 5, options.floors);
        load(*session, cfg, core::Rect{origin.x - 1, origin.z - 1,
                                       origin.x + options.width, origin.z + options.depth});
        tf.place(shape::skyscraper(origin, options));
    } else if (cmd == "capture") {
        const shape::Box3 box = shape::box_from_corners({arg_int(args, 2), arg_int(args, 3), arg_int(args, 4)},
                                                        {arg_int(args, 5), arg_int(args, 6), arg_int(args, 7)});
        load(*session, cfg, core::Rect{box.min.x, box.min.z, box.max.x, box.max.z});
        const io::Template tpl = tf.capture_template(box, box.min);
        io::save_template(tpl, args.at(8));
        std::cout << "wrote " << tpl.size() << " block(s) to " << args.at(8) << "\n";
    } else if (cmd == "paste") {
        const io::Template tpl = io::load_template(args.at(2));
        const core::Coordinate origin{arg_int(args, 3), arg_int(args, 4), arg_int(args, 5)};
        const int rotation = arg_int_or(args, 6, 0);
        std::optional<shape::Axis> mirror;
        if (args.size() > 7) {
            mirror = shape::parse_axis(args.at(7));
        }
        int32_t reach = 0;
        for (const auto& [c, material] : tpl.voxels()) {
            reach = std::max({reach, std::abs(c.x), std::abs(c.z)});
        }
        load(*session, cfg, core::Rect::around({origin.x, origin.z}, reach));
        tf.place_template(tpl, origin, rotation, mirror);
    } else {
        usage();
        return 2;
    }

    world::save(*session);
    world::close(*session);
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args;
    std::optional<std::string> config_path;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            args.push_back(a);
        }
    }
    if (args.size() < 2) {
        usage();
        return 2;
    }
    const std::optional<std::size_t> needed = required_args(args[1]);
    if (!needed || args.size() < 2 + *needed) {
        usage();
        return 2;
    }

    try {
        return run(args, config_path);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
