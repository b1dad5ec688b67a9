#pragma once

#include "strata/world/block_store.hpp"
#include "strata/world/chunk.hpp"

#include <functional>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace strata::world {

struct ChunkKeyHash {
    std::size_t operator()(const core::ChunkCoord& coord) const noexcept {
        std::size_t h1 = std::hash<int32_t>{}(coord.x);
        std::size_t h2 = std::hash<int32_t>{}(coord.y);
        std::size_t h3 = std::hash<int32_t>{}(coord.z);
        return h1 ^ (h2 << 1) ^ (h3 << 2);
    }
};

struct ChunkCoordEqual {
    bool operator()(const core::ChunkCoord& a, const core::ChunkCoord& b) const noexcept {
        return a.x == b.x && a.y == b.y && a.z == b.z;
    }
};

// Inclusive chunk-space box.
struct ChunkRange {
    core::ChunkCoord min{};
    core::ChunkCoord max{};
};

// Sparse chunked block store. Only resident chunks can be read or written;
// everything else raises core::LoadError.
class World final : public IBlockStore {
public:
    using ChunkMap = std::unordered_map<core::ChunkCoord, Chunk, ChunkKeyHash, ChunkCoordEqual>;

    explicit World(const core::WorldConfig& config);

    [[nodiscard]] const core::WorldConfig& config() const noexcept { return config_; }

    Material get(const core::Coordinate& coord, const Dimension& dimension) const override;
    void set(const core::Coordinate& coord, const Dimension& dimension, const Material& material) override;

    Chunk& ensure_chunk_loaded(const Dimension& dimension, const core::ChunkCoord& coord);
    Chunk*       find_chunk(const Dimension& dimension, const core::ChunkCoord& coord);
    const Chunk* find_chunk(const Dimension& dimension, const core::ChunkCoord& coord) const;
    [[nodiscard]] bool is_resident(const Dimension& dimension, const core::ChunkCoord& coord) const;

    // Takes ownership of an independently produced chunk, remapping its
    // palette onto this world's palette.
    void adopt_chunk(const Dimension& dimension, ChunkData&& chunk_data);
    [[nodiscard]] ChunkData export_chunk(const Dimension& dimension, const core::ChunkCoord& coord) const;

    void unload_chunk(const Dimension& dimension, const core::ChunkCoord& coord);
    void unload_all();

    // Chunk columns covering `rect` over the full build height.
    [[nodiscard]] ChunkRange chunk_range(const core::Rect& rect) const noexcept;

    MaterialId intern(const Material& material);
    [[nodiscard]] const Material& material(MaterialId id) const;
    [[nodiscard]] std::size_t palette_size() const noexcept { return palette_.size(); }

    [[nodiscard]] std::vector<Dimension> dimensions() const;
    [[nodiscard]] std::size_t resident_chunk_count() const noexcept;

    template <typename Func>
    void for_each_chunk(const Dimension& dimension, Func&& f) const
    {
        auto it = dimensions_.find(dimension);
        if (it == dimensions_.end()) {
            return;
        }
        for (const auto& [coord, chunk] : it->second) {
            f(coord, chunk);
        }
    }

private:
    core::WorldConfig config_;
    std::unordered_map<Dimension, ChunkMap> dimensions_;
    std::vector<Material> palette_;
    std::map<Material, MaterialId> palette_lookup_;
};

} // namespace strata::world
