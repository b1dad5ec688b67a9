#include "strata/world/session.hpp"

#include "strata/core/errors.hpp"

#include <yaml-cpp/yaml.h>

#include <chrono>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>

namespace strata::world {

namespace {

constexpr const char* kLevelFile = "level.yaml";
constexpr int kLevelVersion = 1;

core::WorldConfig read_level_file(const std::filesystem::path& file) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(file.string());
    } catch (const YAML::Exception& e) {
        throw core::LoadError("cannot read " + file.string() + ": " + e.what());
    }

    if (root["version"].as<int>(0) != kLevelVersion) {
        throw core::LoadError("unsupported level version in " + file.string());
    }

    core::WorldConfig cfg;
    try {
        cfg.chunk_size = root["chunk_size"].as<int32_t>(cfg.chunk_size);
        cfg.min_y = root["min_y"].as<int32_t>(cfg.min_y);
        cfg.max_y = root["max_y"].as<int32_t>(cfg.max_y);
        cfg.sea_level = root["sea_level"].as<int32_t>(cfg.sea_level);
    } catch (const YAML::Exception& e) {
        throw core::LoadError("malformed " + file.string() + ": " + e.what());
    }
    return cfg;
}

void write_level_file(const std::filesystem::path& file, const core::WorldConfig& cfg) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "version" << YAML::Value << kLevelVersion;
    out << YAML::Key << "chunk_size" << YAML::Value << cfg.chunk_size;
    out << YAML::Key << "min_y" << YAML::Value << cfg.min_y;
    out << YAML::Key << "max_y" << YAML::Value << cfg.max_y;
    out << YAML::Key << "sea_level" << YAML::Value << cfg.sea_level;
    out << YAML::EndMap;

    std::ofstream stream(file, std::ios::trunc);
    stream << out.c_str() << "\n";
    if (!stream) {
        throw core::Error("cannot write " + file.string());
    }
}

} // namespace

Session::Session(std::filesystem::path path,
                 const core::WorldConfig& cfg,
                 std::optional<terrain::TerrainParams> generator)
    : path_(std::move(path))
    , store_(std::make_shared<FileChunkStore>(path_ / "chunks", cfg))
    , provider_(store_, cfg, std::move(generator))
    , world_(cfg)
{}

World& Session::world() {
    if (!open_) {
        throw core::LoadError("session for " + path_.string() + " is closed");
    }
    return world_;
}

const World& Session::world() const {
    if (!open_) {
        throw core::LoadError("session for " + path_.string() + " is closed");
    }
    return world_;
}

std::size_t Session::load_region(const Dimension& dimension, const core::Rect& rect) {
    World& w = world();
    if (rect.empty()) {
        return 0;
    }

    const ChunkRange range = w.chunk_range(rect);
    std::size_t loaded = 0;
    for (int32_t cx = range.min.x; cx <= range.max.x; ++cx) {
        for (int32_t cy = range.min.y; cy <= range.max.y; ++cy) {
            for (int32_t cz = range.min.z; cz <= range.max.z; ++cz) {
                const core::ChunkCoord coord{cx, cy, cz};
                if (w.is_resident(dimension, coord)) {
                    continue;
                }
                w.adopt_chunk(dimension, provider_.get(dimension, coord));
                ++loaded;
            }
        }
    }

    if (loaded > 0) {
        std::cout << "[session] loaded " << loaded << " chunk(s) in " << dimension << "\n";
    }
    return loaded;
}

std::unique_ptr<Session> open_session(const std::filesystem::path& path,
                                      const core::WorldConfig& cfg,
                                      std::optional<terrain::TerrainParams> generator)
{
    std::filesystem::create_directories(path);

    const std::filesystem::path level = path / kLevelFile;
    core::WorldConfig effective = cfg;
    if (std::filesystem::exists(level)) {
        effective = read_level_file(level);
    } else {
        write_level_file(level, cfg);
    }

    std::cout << "[session] opened " << path.string() << " (chunk_size " << effective.chunk_size
              << ", y " << effective.min_y << ".." << effective.max_y << ")\n";
    return std::make_unique<Session>(path, effective, std::move(generator));
}

void save(Session& session) {
    World& w = session.world();
    const auto start = std::chrono::steady_clock::now();

    std::size_t written = 0;
    for (const Dimension& dimension : w.dimensions()) {
        std::vector<core::ChunkCoord> coords;
        w.for_each_chunk(dimension, [&coords](const core::ChunkCoord& coord, const Chunk&) {
            coords.push_back(coord);
        });
        for (const auto& coord : coords) {
            if (!session.store_->save(dimension, w.export_chunk(dimension, coord))) {
                throw core::Error("failed to save chunk (" + std::to_string(coord.x) + ", " +
                                  std::to_string(coord.y) + ", " + std::to_string(coord.z) +
                                  ") in " + dimension);
            }
            ++written;
        }
    }

    const auto end = std::chrono::steady_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    std::cout << "[session] saved " << written << " chunk(s) in " << ms << " ms\n";
}

void close(Session& session) {
    if (!session.open_) {
        return;
    }
    session.world_.unload_all();
    session.open_ = false;
    std::cout << "[session] closed " << session.path_.string() << "\n";
}

} // namespace strata::world
