#include "strata/world/chunk_store.hpp"

#include "strata/core/errors.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace strata::world {

namespace {
constexpr std::uint32_t kChunkMagic   = 0x53545231; // "STR1"
constexpr std::uint32_t kChunkVersion = 2;
constexpr std::uint32_t kMaxString     = 4096;
constexpr std::uint32_t kMaxProperties = 256;

struct ChunkHeader {
    std::uint32_t magic = kChunkMagic;
    std::uint32_t version = kChunkVersion;
    std::int32_t  chunk_size = 0;
    std::uint32_t palette_size = 0;
    std::uint32_t voxel_count = 0;
};

// "minecraft:overworld" -> "minecraft_overworld"
std::string dimension_dir_name(const Dimension& dimension) {
    std::string out = dimension;
    std::replace_if(out.begin(), out.end(), [](char c) {
        return c == ':' || c == '/' || c == '\\';
    }, '_');
    return out;
}

void write_u32(std::ofstream& out, std::uint32_t v) {
    out.write(reinterpret_cast<const char*>(&v), sizeof(v));
}

void write_string(std::ofstream& out, const std::string& s) {
    write_u32(out, static_cast<std::uint32_t>(s.size()));
    out.write(s.data(), static_cast<std::streamsize>(s.size()));
}

bool read_u32(std::ifstream& in, std::uint32_t& v) {
    in.read(reinterpret_cast<char*>(&v), sizeof(v));
    return static_cast<bool>(in);
}

bool read_string(std::ifstream& in, std::string& s) {
    std::uint32_t len = 0;
    if (!read_u32(in, len) || len > kMaxString) {
        return false;
    }
    s.assign(len, '\0');
    in.read(s.data(), static_cast<std::streamsize>(len));
    return static_cast<bool>(in);
}

bool parse_chunk_file_name(const std::string& stem, core::ChunkCoord& out) {
    int x = 0;
    int y = 0;
    int z = 0;
    char tail = 0;
    if (std::sscanf(stem.c_str(), "%d_%d_%d%c", &x, &y, &z, &tail) != 3) {
        return false;
    }
    out = core::ChunkCoord{x, y, z};
    return true;
}

} // namespace

FileChunkStore::FileChunkStore(std::filesystem::path base_dir, const core::WorldConfig& cfg)
    : root_(std::move(base_dir))
    , cfg_(cfg)
{
    std::filesystem::create_directories(root_);
}

std::filesystem::path FileChunkStore::dimension_dir(const Dimension& dimension) const {
    return root_ / dimension_dir_name(dimension);
}

std::filesystem::path FileChunkStore::chunk_path(const Dimension& dimension, const core::ChunkCoord& coord) const {
    std::ostringstream name;
    name << coord.x << "_" << coord.y << "_" << coord.z << ".bin";
    return dimension_dir(dimension) / name.str();
}

bool FileChunkStore::save(const Dimension& dimension, const ChunkData& chunk) {
    const std::size_t expected = chunk_volume(cfg_);
    if (chunk.voxels.size() != expected || chunk.palette.empty()) {
        return false;
    }

    const std::filesystem::path path = chunk_path(dimension, chunk.coord);
    std::filesystem::create_directories(path.parent_path());

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return false;
    }

    ChunkHeader header;
    header.chunk_size = cfg_.chunk_size;
    header.palette_size = static_cast<std::uint32_t>(chunk.palette.size());
    header.voxel_count = static_cast<std::uint32_t>(expected);
    out.write(reinterpret_cast<const char*>(&header), sizeof(header));

    // name, property count, then key/value pairs; every string length-prefixed.
    for (const Material& m : chunk.palette) {
        write_string(out, m.name);
        write_u32(out, static_cast<std::uint32_t>(m.properties.size()));
        for (const auto& [key, value] : m.properties) {
            write_string(out, key);
            write_string(out, value);
        }
    }

    for (const Voxel& v : chunk.voxels) {
        const std::uint16_t mat = static_cast<std::uint16_t>(v.material);
        out.write(reinterpret_cast<const char*>(&mat), sizeof(mat));
    }

    return static_cast<bool>(out);
}

bool FileChunkStore::load(const Dimension& dimension, const core::ChunkCoord& coord, ChunkData& out_chunk) {
    const std::filesystem::path path = chunk_path(dimension, coord);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return false;
    }

    auto corrupt = [&path](const std::string& what) {
        return core::LoadError("chunk file " + path.string() + ": " + what);
    };

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw corrupt("cannot open");
    }

    ChunkHeader header{};
    in.read(reinterpret_cast<char*>(&header), sizeof(header));
    if (!in || header.magic != kChunkMagic) {
        throw corrupt("bad header");
    }
    if (header.version != kChunkVersion) {
        throw corrupt("unsupported version " + std::to_string(header.version));
    }
    if (header.chunk_size != cfg_.chunk_size || header.voxel_count != chunk_volume(cfg_)) {
        throw corrupt("chunk size " + std::to_string(header.chunk_size) + " does not match the world");
    }
    if (header.palette_size == 0) {
        throw corrupt("empty palette");
    }

    ChunkData chunk;
    chunk.coord = coord;
    chunk.palette.reserve(header.palette_size);
    for (std::uint32_t i = 0; i < header.palette_size; ++i) {
        Material m;
        std::uint32_t prop_count = 0;
        if (!read_string(in, m.name) || m.name.empty() || !read_u32(in, prop_count) ||
            prop_count > kMaxProperties) {
            throw corrupt("bad palette entry " + std::to_string(i));
        }
        for (std::uint32_t p = 0; p < prop_count; ++p) {
            std::string key;
            std::string value;
            if (!read_string(in, key) || key.empty() || !read_string(in, value)) {
                throw corrupt("bad property in palette entry " + std::to_string(i));
            }
            m.properties.emplace(std::move(key), std::move(value));
        }
        chunk.palette.push_back(std::move(m));
    }

    const std::size_t expected = static_cast<std::size_t>(header.voxel_count);
    chunk.voxels.resize(expected);
    for (std::size_t i = 0; i < expected; ++i) {
        std::uint16_t mat = 0;
        in.read(reinterpret_cast<char*>(&mat), sizeof(mat));
        if (!in) {
            throw corrupt("truncated voxel data");
        }
        if (mat >= header.palette_size) {
            throw corrupt("palette index " + std::to_string(mat) + " out of range");
        }
        chunk.voxels[i].material = static_cast<MaterialId>(mat);
    }

    out_chunk = std::move(chunk);
    return true;
}

std::vector<core::ChunkCoord> FileChunkStore::stored_chunks(const Dimension& dimension) const {
    std::vector<core::ChunkCoord> out;
    const std::filesystem::path dir = dimension_dir(dimension);
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return out;
    }
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".bin") {
            continue;
        }
        core::ChunkCoord coord{};
        if (parse_chunk_file_name(entry.path().stem().string(), coord)) {
            out.push_back(coord);
        }
    }
    return out;
}

} // namespace strata::world
