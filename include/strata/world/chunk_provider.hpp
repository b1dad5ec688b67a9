#pragma once

#include "strata/core/errors.hpp"
#include "strata/world/chunk.hpp"
#include "strata/world/chunk_store.hpp"
#include "strata/world/terrain.hpp"

#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <utility>

namespace strata::world {

// Interface for something that can provide a chunk, possibly from cache or generation.
class IChunkProvider {
public:
    virtual ~IChunkProvider() = default;

    // Throws core::LoadError if the chunk can be neither loaded nor produced.
    virtual ChunkData get(const Dimension& dimension, const core::ChunkCoord& coord) = 0;
};

// Wraps a store + optional generator: tries to load, otherwise generates and
// saves. Without a generator a missing chunk is a LoadError.
class CachedChunkProvider final : public IChunkProvider {
public:
    CachedChunkProvider(std::shared_ptr<IChunkStore> store,
                        core::WorldConfig cfg,
                        std::optional<terrain::TerrainParams> generator = std::nullopt)
        : store_(std::move(store))
        , cfg_(cfg)
        , generator_(std::move(generator))
    {}

    ChunkData get(const Dimension& dimension, const core::ChunkCoord& coord) override {
        ChunkData chunk;
        if (store_ && store_->load(dimension, coord, chunk)) {
            return chunk;
        }
        if (!generator_) {
            std::ostringstream oss;
            oss << "chunk (" << coord.x << ", " << coord.y << ", " << coord.z
                << ") in " << dimension << " is not stored";
            throw core::LoadError(oss.str());
        }
        chunk = terrain::generate_chunk(coord, cfg_, *generator_);
        if (store_ && !store_->save(dimension, chunk)) {
            std::cout << "[provider] could not cache chunk (" << coord.x << ", " << coord.y
                      << ", " << coord.z << ")\n";
        }
        return chunk;
    }

private:
    std::shared_ptr<IChunkStore> store_;
    core::WorldConfig cfg_;
    std::optional<terrain::TerrainParams> generator_;
};

} // namespace strata::world
