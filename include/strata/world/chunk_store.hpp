#pragma once

#include "strata/core/coords.hpp"
#include "strata/world/block_store.hpp"
#include "strata/world/chunk.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace strata::world {

// Abstract chunk persistence API.
class IChunkStore {
public:
    virtual ~IChunkStore() = default;
    // False when nothing is stored for `coord`; throws core::LoadError when
    // stored data cannot be read.
    virtual bool load(const Dimension& dimension, const core::ChunkCoord& coord, ChunkData& out) = 0;
    virtual bool save(const Dimension& dimension, const ChunkData& chunk) = 0;
};

// Very simple disk-backed store: one file per chunk under a per-dimension
// directory, length-prefixed palette entries followed by uint16 palette indices.
class FileChunkStore final : public IChunkStore {
public:
    FileChunkStore(std::filesystem::path base_dir, const core::WorldConfig& cfg);

    bool load(const Dimension& dimension, const core::ChunkCoord& coord, ChunkData& out) override;
    bool save(const Dimension& dimension, const ChunkData& chunk) override;

    // Chunk coordinates stored on disk for `dimension`.
    [[nodiscard]] std::vector<core::ChunkCoord> stored_chunks(const Dimension& dimension) const;

private:
    std::filesystem::path dimension_dir(const Dimension& dimension) const;
    std::filesystem::path chunk_path(const Dimension& dimension, const core::ChunkCoord& coord) const;

    std::filesystem::path root_;
    core::WorldConfig cfg_;
};

} // namespace strata::world
