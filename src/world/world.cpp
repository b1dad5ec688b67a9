#include "strata/world/world.hpp"
#include "strata/core/errors.hpp"

#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace strata::world {

namespace {

std::string describe(const Dimension& dimension, const core::ChunkCoord& coord) {
    std::ostringstream oss;
    oss << "chunk (" << coord.x << ", " << coord.y << ", " << coord.z
        << ") in " << dimension << " is not resident";
    return oss.str();
}

} // namespace

World::World(const core::WorldConfig& config)
    : config_(config)
{
    if (config_.chunk_size <= 0) {
        throw std::invalid_argument("chunk_size must be positive");
    }
    if (config_.max_y < config_.min_y) {
        throw std::invalid_argument("max_y must not be below min_y");
    }
    palette_.push_back(air());
    palette_lookup_.emplace(palette_.front(), kAirId);
}

Material World::get(const core::Coordinate& coord, const Dimension& dimension) const {
    if (coord.y < config_.min_y || coord.y > config_.max_y) {
        return air();
    }
    ChunkAndLocal split = split_world_voxel(coord, config_);
    const Chunk* chunk = find_chunk(dimension, split.chunk);
    if (!chunk) {
        throw core::LoadError(describe(dimension, split.chunk));
    }
    const auto idx = voxel_index(config_, split.local);
    return palette_[chunk->voxels[idx].material];
}

void World::set(const core::Coordinate& coord, const Dimension& dimension, const Material& material) {
    if (coord.y < config_.min_y || coord.y > config_.max_y) {
        throw core::OutOfBounds("y=" + std::to_string(coord.y) + " is outside the build height");
    }
    ChunkAndLocal split = split_world_voxel(coord, config_);
    Chunk* chunk = find_chunk(dimension, split.chunk);
    if (!chunk) {
        throw core::LoadError(describe(dimension, split.chunk));
    }
    const MaterialId id = intern(material);
    const auto idx = voxel_index(config_, split.local);
    chunk->voxels[idx].material = id;
}

Chunk& World::ensure_chunk_loaded(const Dimension& dimension, const core::ChunkCoord& coord) {
    auto [it, inserted] = dimensions_[dimension].try_emplace(coord);
    if (inserted) {
        it->second.coord = coord;
        it->second.voxels.resize(chunk_volume(config_));
    }
    return it->second;
}

Chunk* World::find_chunk(const Dimension& dimension, const core::ChunkCoord& coord) {
    auto dim = dimensions_.find(dimension);
    if (dim == dimensions_.end()) {
        return nullptr;
    }
    auto it = dim->second.find(coord);
    if (it == dim->second.end()) {
        return nullptr;
    }
    return &it->second;
}

const Chunk* World::find_chunk(const Dimension& dimension, const core::ChunkCoord& coord) const {
    auto dim = dimensions_.find(dimension);
    if (dim == dimensions_.end()) {
        return nullptr;
    }
    auto it = dim->second.find(coord);
    if (it == dim->second.end()) {
        return nullptr;
    }
    return &it->second;
}

bool World::is_resident(const Dimension& dimension, const core::ChunkCoord& coord) const {
    return find_chunk(dimension, coord) != nullptr;
}

void World::adopt_chunk(const Dimension& dimension, ChunkData&& chunk_data) {
    if (chunk_data.voxels.size() != chunk_volume(config_)) {
        throw std::invalid_argument("ChunkData voxel count must match chunk_size^3");
    }
    if (chunk_data.palette.empty()) {
        throw std::invalid_argument("ChunkData palette must not be empty");
    }

    std::vector<MaterialId> remap;
    remap.reserve(chunk_data.palette.size());
    for (const Material& m : chunk_data.palette) {
        remap.push_back(intern(m));
    }

    for (Voxel& v : chunk_data.voxels) {
        if (v.material >= remap.size()) {
            throw std::invalid_argument("ChunkData voxel references a missing palette entry");
        }
        v.material = remap[v.material];
    }

    Chunk& chunk = dimensions_[dimension][chunk_data.coord];
    chunk.coord = chunk_data.coord;
    chunk.voxels = std::move(chunk_data.voxels);
}

ChunkData World::export_chunk(const Dimension& dimension, const core::ChunkCoord& coord) const {
    const Chunk* chunk = find_chunk(dimension, coord);
    if (!chunk) {
        throw core::LoadError(describe(dimension, coord));
    }

    ChunkData out;
    out.coord = coord;
    out.palette.push_back(air());
    out.voxels.resize(chunk->voxels.size());

    std::unordered_map<MaterialId, MaterialId> local_ids{{kAirId, kAirId}};
    for (std::size_t i = 0; i < chunk->voxels.size(); ++i) {
        const MaterialId global = chunk->voxels[i].material;
        auto [it, inserted] = local_ids.try_emplace(global, static_cast<MaterialId>(out.palette.size()));
        if (inserted) {
            out.palette.push_back(material(global));
        }
        out.voxels[i].material = it->second;
    }
    return out;
}

void World::unload_chunk(const Dimension& dimension, const core::ChunkCoord& coord) {
    auto dim = dimensions_.find(dimension);
    if (dim != dimensions_.end()) {
        dim->second.erase(coord);
    }
}

void World::unload_all() {
    dimensions_.clear();
}

ChunkRange World::chunk_range(const core::Rect& rect) const noexcept {
    const ChunkAndLocal lo = split_world_voxel({rect.min_x, config_.min_y, rect.min_z}, config_);
    const ChunkAndLocal hi = split_world_voxel({rect.max_x, config_.max_y, rect.max_z}, config_);
    return {lo.chunk, hi.chunk};
}

MaterialId World::intern(const Material& material) {
    if (material == air()) {
        return kAirId;
    }
    auto it = palette_lookup_.find(material);
    if (it != palette_lookup_.end()) {
        return it->second;
    }
    if (palette_.size() > std::numeric_limits<MaterialId>::max()) {
        throw std::length_error("material palette is full");
    }
    const auto id = static_cast<MaterialId>(palette_.size());
    palette_.push_back(material);
    palette_lookup_.emplace(material, id);
    return id;
}

const Material& World::material(MaterialId id) const {
    if (id >= palette_.size()) {
        throw std::out_of_range("unknown material id " + std::to_string(id));
    }
    return palette_[id];
}

std::vector<Dimension> World::dimensions() const {
    std::vector<Dimension> out;
    out.reserve(dimensions_.size());
    for (const auto& [name, chunks] : dimensions_) {
        out.push_back(name);
    }
    return out;
}

std::size_t World::resident_chunk_count() const noexcept {
    std::size_t count = 0;
    for (const auto& [name, chunks] : dimensions_) {
        count += chunks.size();
    }
    return count;
}

} // namespace strata::world
